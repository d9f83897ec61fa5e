#ifndef FETCHPOOL_LOGGER_HPP
#define FETCHPOOL_LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace fetchpool::log {
    // Shared "fetchpool" logger on stderr. Level is read from FETCHPOOL_LOG_LEVEL on first use.
    std::shared_ptr<spdlog::logger> logger();

    void set_level(spdlog::level::level_enum level);
}  // namespace fetchpool::log

#endif
