#ifndef FETCHPOOL_CLIENT_INTERFACE_HPP
#define FETCHPOOL_CLIENT_INTERFACE_HPP

#include <curl/curl.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "../decode/decoder.hpp"
#include "../encode/post_data.hpp"
#include "../headers/header_store.hpp"
#include "../model/model.hpp"

namespace fetchpool::http {
    class Transfer;
}

namespace fetchpool::client {
    using Hook = std::function<void(http::Transfer&)>;
    using RetryDecider = std::function<bool(http::Transfer&)>;

    // Either a fixed number of retries or a predicate consulted after every failed attempt.
    using RetryPolicy = std::variant<std::monostate, int, RetryDecider>;

    struct Hooks {
        Hook before_send_;
        Hook after_send_;
        Hook success_;
        Hook error_;
        Hook complete_;
    };

    // Settings shared by a single Transfer and a TransferPool. Everything beyond the
    // pure virtuals is expressed in terms of set_opt().
    class IRequestConfig {
       public:
        IRequestConfig() = default;
        virtual ~IRequestConfig() = default;
        IRequestConfig(const IRequestConfig&) = delete;
        IRequestConfig& operator=(const IRequestConfig&) = delete;
        IRequestConfig(IRequestConfig&&) = delete;
        IRequestConfig& operator=(IRequestConfig&&) = delete;

        virtual void set_opt(CURLoption option, model::OptionValue value) = 0;
        virtual void set_url(const std::string& url, const encode::Data& data = {}) = 0;
        virtual void set_header(std::string key, std::string value) = 0;
        virtual void unset_header(std::string_view key) = 0;
        virtual void set_cookie(std::string key, std::string value) = 0;
        virtual void set_retry(RetryPolicy policy) = 0;
        // An empty function disables decoding for that content type.
        virtual void set_json_decoder(decode::DecoderFn decoder) = 0;
        virtual void set_xml_decoder(decode::DecoderFn decoder) = 0;
        virtual void set_default_decoder(decode::DecoderFn decoder) = 0;
        virtual void stop() = 0;
        virtual void close() = 0;

        void set_opts(const model::OptionMap& options);
        [[nodiscard]] std::optional<model::OptionValue> get_opt(CURLoption option) const;
        [[nodiscard]] const model::OptionMap& options() const { return options_; }
        [[nodiscard]] const Hooks& hooks() const { return hooks_; }

        void set_headers(const headers::HeaderStore& headers);
        void set_cookies(const model::Cookies& cookies);

        void on_before_send(Hook hook) { hooks_.before_send_ = std::move(hook); }
        void on_after_send(Hook hook) { hooks_.after_send_ = std::move(hook); }
        void on_success(Hook hook) { hooks_.success_ = std::move(hook); }
        void on_error(Hook hook) { hooks_.error_ = std::move(hook); }
        void on_complete(Hook hook) { hooks_.complete_ = std::move(hook); }

        void set_basic_authentication(const std::string& username, const std::string& password = "");
        void set_digest_authentication(const std::string& username, const std::string& password = "");
        void set_connect_timeout(long seconds);
        void set_timeout(long seconds);
        void disable_timeout();
        void set_follow_location(bool follow);
        void set_maximum_redirects(long redirects);
        void set_forbid_reuse(bool forbid);
        void set_interface(const std::string& interface);
        void set_port(long port);
        void set_range(const std::string& range);
        void set_referer(const std::string& referer);
        void set_auto_referer(bool auto_referer);
        void set_user_agent(const std::string& user_agent);
        void set_protocols(const std::string& protocols);
        void set_redirect_protocols(const std::string& protocols);
        void set_cookie_file(const std::filesystem::path& cookie_file);
        void set_cookie_jar(const std::filesystem::path& cookie_jar);

        void set_proxy(const std::string& proxy, std::optional<long> port = std::nullopt, const std::string& username = "",
                       const std::string& password = "");
        void set_proxy_auth(long auth);
        void set_proxy_tunnel(bool tunnel);
        void set_proxy_type(long type);
        void unset_proxy();

       protected:
        model::OptionMap options_;
        Hooks hooks_;
    };
}  // namespace fetchpool::client

#endif
