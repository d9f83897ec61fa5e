#include <curl/curl.h>

#include "interface.hpp"

namespace fetchpool::client {
    void IRequestConfig::set_opts(const model::OptionMap& options) {
        for (const auto& [option, value] : options) {
            set_opt(option, value);
        }
    }

    std::optional<model::OptionValue> IRequestConfig::get_opt(CURLoption option) const {
        auto it = options_.find(option);
        if (it == options_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void IRequestConfig::set_headers(const headers::HeaderStore& headers) {
        for (const auto& [key, value] : headers) {
            set_header(key, value);
        }
    }

    void IRequestConfig::set_cookies(const model::Cookies& cookies) {
        for (const auto& [key, value] : cookies) {
            set_cookie(key, value);
        }
    }

    void IRequestConfig::set_basic_authentication(const std::string& username, const std::string& password) {
        set_opt(CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        set_opt(CURLOPT_USERPWD, username + ":" + password);
    }

    void IRequestConfig::set_digest_authentication(const std::string& username, const std::string& password) {
        set_opt(CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_DIGEST));
        set_opt(CURLOPT_USERPWD, username + ":" + password);
    }

    void IRequestConfig::set_connect_timeout(long seconds) { set_opt(CURLOPT_CONNECTTIMEOUT, seconds); }

    void IRequestConfig::set_timeout(long seconds) { set_opt(CURLOPT_TIMEOUT, seconds); }

    void IRequestConfig::disable_timeout() { set_opt(CURLOPT_TIMEOUT, 0L); }

    void IRequestConfig::set_follow_location(bool follow) { set_opt(CURLOPT_FOLLOWLOCATION, static_cast<long>(follow)); }

    void IRequestConfig::set_maximum_redirects(long redirects) { set_opt(CURLOPT_MAXREDIRS, redirects); }

    void IRequestConfig::set_forbid_reuse(bool forbid) { set_opt(CURLOPT_FORBID_REUSE, static_cast<long>(forbid)); }

    void IRequestConfig::set_interface(const std::string& interface) { set_opt(CURLOPT_INTERFACE, interface); }

    void IRequestConfig::set_port(long port) { set_opt(CURLOPT_PORT, port); }

    void IRequestConfig::set_range(const std::string& range) { set_opt(CURLOPT_RANGE, range); }

    void IRequestConfig::set_referer(const std::string& referer) { set_opt(CURLOPT_REFERER, referer); }

    void IRequestConfig::set_auto_referer(bool auto_referer) { set_opt(CURLOPT_AUTOREFERER, static_cast<long>(auto_referer)); }

    void IRequestConfig::set_user_agent(const std::string& user_agent) { set_opt(CURLOPT_USERAGENT, user_agent); }

    void IRequestConfig::set_protocols(const std::string& protocols) { set_opt(CURLOPT_PROTOCOLS_STR, protocols); }

    void IRequestConfig::set_redirect_protocols(const std::string& protocols) { set_opt(CURLOPT_REDIR_PROTOCOLS_STR, protocols); }

    void IRequestConfig::set_cookie_file(const std::filesystem::path& cookie_file) { set_opt(CURLOPT_COOKIEFILE, cookie_file.string()); }

    void IRequestConfig::set_cookie_jar(const std::filesystem::path& cookie_jar) { set_opt(CURLOPT_COOKIEJAR, cookie_jar.string()); }

    void IRequestConfig::set_proxy(const std::string& proxy, std::optional<long> port, const std::string& username, const std::string& password) {
        set_opt(CURLOPT_PROXY, proxy);
        if (port) {
            set_opt(CURLOPT_PROXYPORT, *port);
        }
        if (!username.empty()) {
            set_opt(CURLOPT_PROXYUSERPWD, username + ":" + password);
        }
    }

    void IRequestConfig::set_proxy_auth(long auth) { set_opt(CURLOPT_PROXYAUTH, auth); }

    void IRequestConfig::set_proxy_tunnel(bool tunnel) { set_opt(CURLOPT_HTTPPROXYTUNNEL, static_cast<long>(tunnel)); }

    void IRequestConfig::set_proxy_type(long type) { set_opt(CURLOPT_PROXYTYPE, type); }

    void IRequestConfig::unset_proxy() { set_opt(CURLOPT_PROXY, nullptr); }
}  // namespace fetchpool::client
