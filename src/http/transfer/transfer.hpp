#ifndef FETCHPOOL_TRANSFER_HPP
#define FETCHPOOL_TRANSFER_HPP

#include <curl/curl.h>

#include <cstdio>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/file_utils.hpp"
#include "../client/callback_context.hpp"
#include "../client/curl_easy.hpp"
#include "../client/interface.hpp"
#include "../decode/decoder.hpp"
#include "../encode/post_data.hpp"
#include "../headers/header_store.hpp"
#include "../model/model.hpp"

namespace fetchpool::http {
    using DownloadCallback = std::function<void(Transfer&, std::FILE*)>;
    using Target = std::optional<std::string>;

    // One HTTP request/response exchange. Method helpers prefixed with set_ only
    // configure; the unprefixed ones also execute. A Target of std::nullopt means
    // "the URL this transfer already points at".
    class Transfer : public client::IRequestConfig {
       public:
        explicit Transfer(const Target& base_url = std::nullopt, const model::OptionMap& options = {});
        ~Transfer() override;

        [[nodiscard]] const std::string& id() const { return id_; }
        void set_id(std::string id) { id_ = std::move(id); }
        [[nodiscard]] bool child_of_pool() const { return child_of_pool_; }
        void set_child_of_pool(bool child) { child_of_pool_ = child; }

        void set_opt(CURLoption option, model::OptionValue value) override;
        void set_url(const std::string& url, const encode::Data& data = {}) override;
        void set_header(std::string key, std::string value) override;
        void unset_header(std::string_view key) override;
        void set_cookie(std::string key, std::string value) override;
        void set_retry(client::RetryPolicy policy) override;
        void set_json_decoder(decode::DecoderFn decoder) override { decoders_.json_ = std::move(decoder); }
        void set_xml_decoder(decode::DecoderFn decoder) override { decoders_.xml_ = std::move(decoder); }
        void set_default_decoder(decode::DecoderFn decoder) override { decoders_.default_ = std::move(decoder); }
        void stop() override;
        void close() override;

        // Parses "Key: Value" lines.
        void set_header_lines(const std::vector<std::string>& lines);
        void set_cookie_string(const std::string& cookie);
        // Both may be set; the size limit is checked first, then the progress callback.
        void set_progress(client::ProgressFn progress);
        void set_max_filesize(curl_off_t bytes);
        void set_stop(client::StopDecider decider);
        void set_temp_directory(std::filesystem::path directory) { temp_directory_ = std::move(directory); }
        void on_download_complete(DownloadCallback callback) { download_callback_ = std::move(callback); }

        void set_get(const Target& url = std::nullopt, const encode::Data& query = {});
        void set_head(const Target& url = std::nullopt, const encode::Data& query = {});
        void set_delete(const Target& url = std::nullopt, const encode::Data& query = {}, const encode::Data& data = {});
        void set_options(const Target& url = std::nullopt, const encode::Data& query = {});
        void set_patch(const Target& url = std::nullopt, const encode::Data& data = {});
        void set_post(const Target& url = std::nullopt, const encode::Data& data = {}, bool follow_303_with_post = false);
        void set_put(const Target& url = std::nullopt, const encode::Data& data = {});
        void set_search(const Target& url = std::nullopt, const encode::Data& data = {});
        // Streams to a resumable temp file, moved to `destination` on success.
        bool set_download(const std::string& url, const std::filesystem::path& destination);
        // Streams to an anonymous temp file handed to `callback` on success.
        bool set_download_with(const std::string& url, DownloadCallback callback);

        const model::Response& get(const Target& url = std::nullopt, const encode::Data& query = {});
        const model::Response& head(const Target& url = std::nullopt, const encode::Data& query = {});
        const model::Response& del(const Target& url = std::nullopt, const encode::Data& query = {}, const encode::Data& data = {});
        const model::Response& send_options(const Target& url = std::nullopt, const encode::Data& query = {});
        const model::Response& patch(const Target& url = std::nullopt, const encode::Data& data = {});
        const model::Response& post(const Target& url = std::nullopt, const encode::Data& data = {}, bool follow_303_with_post = false);
        const model::Response& put(const Target& url = std::nullopt, const encode::Data& data = {});
        const model::Response& search(const Target& url = std::nullopt, const encode::Data& data = {});
        bool download(const std::string& url, const std::filesystem::path& destination);
        bool download_with(const std::string& url, DownloadCallback callback);
        bool fast_download(const std::string& url, const std::filesystem::path& destination,
                           int connections = constants::DEFAULT_FAST_DOWNLOAD_CONNECTIONS);

        // Runs attempts until success or the retry policy gives up, then finalizes.
        const model::Response& execute();

        // Pieces of execute() that a TransferPool drives itself.
        void prepare_attempt();
        void complete_attempt(CURLcode result);
        bool attempt_retry();
        void finalize();

        void reset();

        [[nodiscard]] CURL* handle() const;
        [[nodiscard]] bool is_closed() const { return easy_ == nullptr; }
        [[nodiscard]] const std::string& url() const { return url_; }
        [[nodiscard]] const headers::HeaderStore& headers() const { return headers_; }
        [[nodiscard]] const model::Cookies& cookies() const { return cookies_; }
        [[nodiscard]] const model::OptionMap& user_set_options() const { return user_set_options_; }
        [[nodiscard]] const decode::DecoderSet& decoders() const { return decoders_; }
        [[nodiscard]] const client::RetryPolicy& retry_policy() const { return retry_; }

        [[nodiscard]] int attempts() const { return attempts_; }
        [[nodiscard]] int retries() const { return retries_; }
        [[nodiscard]] int remaining_retries() const { return remaining_retries_; }

        [[nodiscard]] const model::Response& response() const { return response_; }
        [[nodiscard]] const model::ErrorState& error_state() const { return errors_; }
        [[nodiscard]] bool is_error() const { return errors_.error_; }
        [[nodiscard]] bool is_transport_error() const { return errors_.transport_error_; }
        [[nodiscard]] bool is_http_error() const { return errors_.http_error_; }
        [[nodiscard]] long error_code() const { return errors_.code_; }
        [[nodiscard]] const std::string& error_message() const { return errors_.message_; }
        [[nodiscard]] long status() const { return response_.status_; }
        [[nodiscard]] std::optional<std::string> response_cookie(std::string_view name) const;
        // For after-send hooks that classify responses themselves.
        void set_error(bool error);
        // Throws TransportError or HttpError for a failed transfer.
        void raise_for_error() const;

        std::string effective_url();
        double total_time();
        std::string error_constant();

       private:
        enum class Deferred { EFFECTIVE_URL, TOTAL_TIME, ERROR_CONSTANT };
        using DeferredValue = std::variant<std::string, double>;

        template <typename T, typename Compute>
        const T& deferred(Deferred key, Compute compute);

        client::CurlEasy& easy() const;
        void initialize(const model::OptionMap& options);
        void apply_option(CURLoption option, model::OptionValue value);
        void apply_headers();
        void apply_cookies();
        void apply_body(const encode::Data& data);
        void apply_sized_body(const encode::Data& data);
        void resolve_target(const Target& url, const encode::Data& query);
        void install_default_decoders();
        void classify(CURLcode result);
        void attach_file(file_utils::FilePtr file);
        void download_complete();

        std::string id_;
        bool child_of_pool_ = false;

        std::string url_;
        std::string method_;
        headers::HeaderStore headers_;
        model::Cookies cookies_;
        model::OptionMap user_set_options_;
        decode::DecoderSet decoders_;
        client::RetryPolicy retry_;
        std::filesystem::path temp_directory_;

        int attempts_ = 0;
        int retries_ = 0;
        int remaining_retries_ = 0;

        model::Response response_;
        model::ErrorState errors_;
        std::map<Deferred, DeferredValue> deferred_;

        file_utils::FilePtr file_;
        std::optional<std::filesystem::path> download_file_name_;
        std::optional<std::filesystem::path> download_destination_;
        DownloadCallback download_callback_;
        bool resumed_range_ = false;

        std::shared_ptr<client::CallbackContext> context_;
        std::unique_ptr<client::CurlEasy> easy_;
    };
}  // namespace fetchpool::http

#endif
