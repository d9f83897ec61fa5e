#ifndef FETCHPOOL_CONSTANTS_HPP
#define FETCHPOOL_CONSTANTS_HPP

#include <array>
#include <chrono>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int HTTP_STATUS_CLASS = 100;
    inline constexpr long HTTP_OK_MIN = 200;
    inline constexpr long HTTP_OK_MAX = 400;
    inline constexpr std::size_t DEFAULT_CONCURRENCY = 25;
    inline constexpr int DEFAULT_FAST_DOWNLOAD_CONNECTIONS = 4;
    inline constexpr long DEFAULT_TIMEOUT_S = 30L;
    inline constexpr long DEFAULT_PROBE_TIMEOUT_S = 5L;
    inline constexpr long SECONDS_PER_MINUTE = 60L;
    inline constexpr long SECONDS_PER_HOUR = 3600L;
    inline constexpr std::chrono::milliseconds MULTI_WAIT_TIMEOUT{1000};
    inline constexpr std::chrono::milliseconds MULTI_WAIT_TIMEOUT_ACCURATE{200};
    inline constexpr std::chrono::milliseconds QUOTA_POLL_INTERVAL{250};
    inline constexpr std::array<unsigned char, 3> GZIP_MAGIC = {0x1f, 0x8b, 0x08};
    inline constexpr const char* STATUS_LINE = "Status-Line";
    inline constexpr const char* REQUEST_LINE = "Request-Line";
    inline constexpr const char* CONTENT_TYPE = "Content-Type";
    inline constexpr const char* CONTENT_LENGTH = "Content-Length";
    inline constexpr const char* CONTENT_ENCODING = "Content-Encoding";
    inline constexpr const char* LOGGER_NAME = "fetchpool";
    inline constexpr const char* TEMP_SUBDIRECTORY = "fetchpool";
    inline constexpr const char* TEMP_SUFFIX = ".tmp";
    inline constexpr const char* PART_SUFFIX = ".part";

}  // namespace constants

#endif
