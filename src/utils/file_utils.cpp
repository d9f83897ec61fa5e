#include "file_utils.hpp"

#include <array>
#include <functional>
#include <string>
#include <system_error>

#include "constants.hpp"

namespace file_utils {
    namespace {
        constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

        bool pump(std::FILE* from, std::FILE* to) {
            std::array<char, COPY_BUFFER_SIZE> buf{};
            size_t n = 0;
            while ((n = std::fread(buf.data(), 1, buf.size(), from)) > 0) {
                if (std::fwrite(buf.data(), 1, n, to) != n) {
                    return false;
                }
            }
            return std::ferror(from) == 0;
        }
    }  // namespace

    std::filesystem::path temp_directory() {
        std::error_code ec;
        auto dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            dir = "/tmp";
        }
        dir /= constants::TEMP_SUBDIRECTORY;
        std::filesystem::create_directories(dir, ec);
        return dir;
    }

    std::filesystem::path temp_path_for(const std::filesystem::path& destination, const std::filesystem::path& directory) {
        const std::size_t h = std::hash<std::string>{}(std::filesystem::absolute(destination).string());
        return directory / (std::to_string(h) + constants::TEMP_SUFFIX);
    }

    std::filesystem::path append_to_path(const std::filesystem::path& path, const std::string& str) { return {path.string() + str}; }

    std::uintmax_t file_size_or_zero(const std::filesystem::path& path) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : size;
    }

    bool copy_file(const std::filesystem::path& from, const std::filesystem::path& to) {
        std::error_code ec;
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
        return !ec;
    }

    bool remove_file(const std::filesystem::path& path) {
        std::error_code ec;
        return std::filesystem::remove(path, ec);
    }

    bool append_file(const std::filesystem::path& from, std::FILE* to) {
        FilePtr in(std::fopen(from.c_str(), "rb"));
        if (!in) {
            return false;
        }
        return pump(in.get(), to);
    }

    bool copy_stream(std::FILE* from, const std::filesystem::path& to) {
        FilePtr out(std::fopen(to.c_str(), "wb"));
        if (!out) {
            return false;
        }
        std::rewind(from);
        return pump(from, out.get());
    }
}  // namespace file_utils
