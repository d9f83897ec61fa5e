#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "../../log/logger.hpp"
#include "../pool/transfer_pool.hpp"
#include "transfer.hpp"

namespace fetchpool::http {
    void Transfer::attach_file(file_utils::FilePtr file) {
        file_ = std::move(file);
        easy().write_to_file(file_.get());
    }

    bool Transfer::set_download(const std::string& url, const std::filesystem::path& destination) {
        const auto temp = file_utils::temp_path_for(destination, temp_directory_);
        const auto existing = file_utils::file_size_or_zero(temp);

        const char* mode = "wb";
        if (existing > 0) {
            apply_option(CURLOPT_RANGE, std::to_string(existing) + "-");
            resumed_range_ = true;
            mode = "ab";
        }

        file_utils::FilePtr fh(std::fopen(temp.c_str(), mode));
        if (!fh) {
            log::logger()->error("unable to open {} for download of {}", temp.string(), url);
            return false;
        }

        download_file_name_ = temp;
        download_destination_ = destination;
        attach_file(std::move(fh));
        set_get(url);
        return true;
    }

    bool Transfer::set_download_with(const std::string& url, DownloadCallback callback) {
        file_utils::FilePtr fh(std::tmpfile());
        if (!fh) {
            log::logger()->error("unable to create temporary file for download of {}", url);
            return false;
        }

        download_file_name_.reset();
        download_destination_.reset();
        download_callback_ = std::move(callback);
        attach_file(std::move(fh));
        set_get(url);
        return true;
    }

    bool Transfer::download(const std::string& url, const std::filesystem::path& destination) {
        if (!set_download(url, destination)) {
            return false;
        }
        execute();
        return !errors_.error_;
    }

    bool Transfer::download_with(const std::string& url, DownloadCallback callback) {
        if (!set_download_with(url, std::move(callback))) {
            return false;
        }
        execute();
        return !errors_.error_;
    }

    void Transfer::download_complete() {
        std::fflush(file_.get());

        if (errors_.error_) {
            if (download_file_name_) {
                file_utils::remove_file(*download_file_name_);
            }
        } else if (download_callback_) {
            std::rewind(file_.get());
            download_callback_(*this, file_.get());
        }

        file_.reset();
        if (easy_) {
            easy_->write_to_body();
        }
        if (resumed_range_) {
            apply_option(CURLOPT_RANGE, nullptr);
            resumed_range_ = false;
        }

        if (!errors_.error_ && download_file_name_ && download_destination_) {
            if (file_utils::copy_file(*download_file_name_, *download_destination_)) {
                file_utils::remove_file(*download_file_name_);
            } else {
                log::logger()->error("unable to move {} to {}", download_file_name_->string(), download_destination_->string());
            }
        }
        download_file_name_.reset();
        download_destination_.reset();
    }

    bool Transfer::fast_download(const std::string& url, const std::filesystem::path& destination, int connections) {
        long content_length = 0;
        {
            Transfer probe(std::nullopt, user_set_options_);
            probe.head(url);
            if (probe.is_error()) {
                return false;
            }
            const auto header = probe.response().headers_.get(constants::CONTENT_LENGTH);
            if (header) {
                content_length = std::strtol(header->c_str(), nullptr, constants::BASE_10);
            }
        }

        if (content_length <= 0 || connections < 1) {
            return download(url, destination);
        }

        const long chunk = (content_length + connections - 1) / connections;
        std::vector<std::filesystem::path> parts;

        TransferPool pool(PoolOptions{.concurrency_ = static_cast<size_t>(connections)});
        for (int part = 0; part < connections; ++part) {
            const long start = part * chunk;
            if (start >= content_length) {
                break;
            }
            const bool last = part == connections - 1 || start + chunk >= content_length;
            const std::string range = last ? std::to_string(start) + "-" : std::to_string(start) + "-" + std::to_string(start + chunk - 1);

            const auto part_path = file_utils::append_to_path(destination, constants::PART_SUFFIX + std::to_string(part));
            parts.push_back(part_path);

            auto transfer = std::make_unique<Transfer>(std::nullopt, user_set_options_);
            transfer->set_range(range);
            transfer->set_download_with(url, [part_path](Transfer&, std::FILE* fh) { file_utils::copy_stream(fh, part_path); });
            pool.add_transfer(std::move(transfer));
        }
        pool.start();

        file_utils::remove_file(destination);
        file_utils::FilePtr out(std::fopen(destination.c_str(), "wb"));
        if (!out) {
            return false;
        }
        for (const auto& part : parts) {
            if (!std::filesystem::exists(part) || !file_utils::append_file(part, out.get())) {
                log::logger()->warn("fast download of {} is missing part {}", url, part.string());
                return false;
            }
            file_utils::remove_file(part);
        }
        return true;
    }
}  // namespace fetchpool::http
