#ifndef FETCHPOOL_FILE_UTILS_HPP
#define FETCHPOOL_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <cstdint>
#include <memory>
#include <string>

namespace file_utils {
    struct FileCloser {
        void operator()(std::FILE* f) const noexcept {
            if (f != nullptr) {
                std::fclose(f);
            }
        }
    };

    using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

    std::filesystem::path temp_directory();

    // Same destination always maps to the same file, so an interrupted download can resume.
    std::filesystem::path temp_path_for(const std::filesystem::path& destination, const std::filesystem::path& directory);

    std::filesystem::path append_to_path(const std::filesystem::path& path, const std::string& str);

    std::uintmax_t file_size_or_zero(const std::filesystem::path& path);

    bool copy_file(const std::filesystem::path& from, const std::filesystem::path& to);

    bool remove_file(const std::filesystem::path& path);

    // Appends the whole of `from` to the open `to` stream.
    bool append_file(const std::filesystem::path& from, std::FILE* to);

    bool copy_stream(std::FILE* from, const std::filesystem::path& to);
}  // namespace file_utils

#endif
