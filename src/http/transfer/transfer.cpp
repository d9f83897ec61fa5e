#include "transfer.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "../../log/logger.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../headers/header_parser.hpp"
#include "../url/url.hpp"

namespace fetchpool::http {
    namespace {
        constexpr size_t ID_BYTES = 8;

        // RFC 2616 token characters
        bool is_cookie_key_char(unsigned char c) {
            return std::isalnum(c) != 0 || std::string_view("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) != std::string_view::npos;
        }

        // RFC 6265 cookie-octet
        bool is_cookie_value_char(unsigned char c) {
            return c == 0x21 || (c >= 0x23 && c <= 0x2B) || (c >= 0x2D && c <= 0x3A) || (c >= 0x3C && c <= 0x5B) || (c >= 0x5D && c <= 0x7E);
        }

        template <typename Allowed>
        std::string encode_cookie_part(std::string_view part, Allowed allowed) {
            std::string out;
            for (const unsigned char c : part) {
                if (allowed(c)) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out += string_utils::raw_url_encode(std::string_view(reinterpret_cast<const char*>(&c), 1));
                }
            }
            return out;
        }

        bool is_empty_data(const encode::Data& data) {
            if (data.is_string()) {
                return data.get_ref<const std::string&>().empty();
            }
            return data.is_null() || ((data.is_object() || data.is_array()) && data.empty());
        }
    }  // namespace

    Transfer::Transfer(const Target& base_url, const model::OptionMap& options)
        : id_(string_utils::random_hex(ID_BYTES)),
          temp_directory_(file_utils::temp_directory()),
          context_(std::make_shared<client::CallbackContext>()),
          easy_(std::make_unique<client::CurlEasy>(context_)) {
        initialize(options);
        if (base_url) {
            set_url(*base_url);
        }
    }

    Transfer::~Transfer() = default;

    void Transfer::initialize(const model::OptionMap& options) {
        apply_option(CURLOPT_TIMEOUT, constants::DEFAULT_TIMEOUT_S);
        for (const auto& [option, value] : options) {
            set_opt(option, value);
        }
    }

    client::CurlEasy& Transfer::easy() const {
        if (!easy_) {
            throw std::logic_error("Transfer " + id_ + " is closed");
        }
        return *easy_;
    }

    CURL* Transfer::handle() const { return easy().handle(); }

    void Transfer::apply_option(CURLoption option, model::OptionValue value) {
        const CURLcode rc = easy().apply(option, value);
        if (rc != CURLE_OK) {
            const std::string name = client::CurlEasy::option_name(option);
            throw http_error::OptionError(static_cast<long>(option), name, "Unable to set " + name + ": " + curl_easy_strerror(rc));
        }
        options_[option] = std::move(value);
    }

    void Transfer::set_opt(CURLoption option, model::OptionValue value) {
        const auto* as_long = std::get_if<long>(&value);
        if (option == CURLOPT_NOPROGRESS && (as_long == nullptr || *as_long != 0)) {
            log::logger()->warn("CURLOPT_NOPROGRESS must stay 0 so transfers can be stopped; transfer {}", id_);
        }
        if (option == CURLOPT_HEADER && as_long != nullptr && *as_long != 0) {
            log::logger()->warn("CURLOPT_HEADER mixes headers into the response body; transfer {}", id_);
        }

        apply_option(option, value);
        user_set_options_[option] = std::move(value);
    }

    void Transfer::set_url(const std::string& url, const encode::Data& data) {
        const std::string built = url::build_url(url, data);
        if (built.empty()) {
            return;
        }
        url_ = url_.empty() ? url::normalize(built) : url::resolve(url_, built);
        apply_option(CURLOPT_URL, url_);
    }

    void Transfer::resolve_target(const Target& url, const encode::Data& query) { set_url(url.value_or(url_), query); }

    void Transfer::set_header(std::string key, std::string value) {
        headers_.set(string_utils::trim(std::move(key)), string_utils::trim(std::move(value)));
        apply_headers();
    }

    void Transfer::unset_header(std::string_view key) {
        if (headers_.remove(key)) {
            apply_headers();
        }
    }

    void Transfer::set_header_lines(const std::vector<std::string>& lines) {
        for (const auto& line : lines) {
            const auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            headers_.set(string_utils::trim(line.substr(0, colon)), string_utils::trim(line.substr(colon + 1)));
        }
        apply_headers();
    }

    void Transfer::apply_headers() {
        easy().set_header_lines(headers_.lines());
    }

    void Transfer::set_cookie(std::string key, std::string value) {
        std::string k = encode_cookie_part(key, is_cookie_key_char);
        std::string v = encode_cookie_part(value, is_cookie_value_char);
        auto it = std::find_if(cookies_.begin(), cookies_.end(), [&](const auto& c) { return c.first == k; });
        if (it != cookies_.end()) {
            it->second = std::move(v);
        } else {
            cookies_.emplace_back(std::move(k), std::move(v));
        }
        apply_cookies();
    }

    void Transfer::apply_cookies() {
        std::string joined;
        for (const auto& [k, v] : cookies_) {
            if (!joined.empty()) {
                joined += "; ";
            }
            joined += k + "=" + v;
        }
        apply_option(CURLOPT_COOKIE, joined);
    }

    void Transfer::set_cookie_string(const std::string& cookie) { apply_option(CURLOPT_COOKIE, cookie); }

    void Transfer::set_retry(client::RetryPolicy policy) {
        retry_ = std::move(policy);
        remaining_retries_ = 0;
        if (const auto* count = std::get_if<int>(&retry_)) {
            remaining_retries_ = std::max(0, *count);
        }
    }

    void Transfer::set_progress(client::ProgressFn progress) { context_->progress_ = std::move(progress); }

    void Transfer::set_max_filesize(curl_off_t bytes) { context_->max_filesize_ = bytes; }

    void Transfer::set_stop(client::StopDecider decider) { context_->stop_request_decider_ = std::move(decider); }

    void Transfer::stop() { context_->stop_request_ = true; }

    void Transfer::close() {
        file_.reset();
        easy_.reset();
    }

    void Transfer::reset() {
        easy().reset();
        headers_.clear();
        cookies_.clear();
        options_.clear();
        user_set_options_.clear();
        decoders_ = {};
        retry_ = {};
        attempts_ = retries_ = remaining_retries_ = 0;
        response_ = {};
        errors_ = {};
        deferred_.clear();
        url_.clear();
        method_.clear();
        context_->reset();
        context_->progress_ = nullptr;
        context_->max_filesize_.reset();
        context_->stop_request_decider_ = nullptr;
        initialize({});
    }

    //
    // Methods
    //

    void Transfer::apply_body(const encode::Data& data) {
        const auto body = encode::build_post_data(data, headers_.get(constants::CONTENT_TYPE).value_or(""));
        easy().set_body(body);
    }

    void Transfer::apply_sized_body(const encode::Data& data) {
        const auto body = encode::build_post_data(data, headers_.get(constants::CONTENT_TYPE).value_or(""));
        const bool external_input = options_.count(CURLOPT_INFILESIZE) != 0 || options_.count(CURLOPT_READDATA) != 0;

        if (!body.multipart_ && !external_input) {
            if (body.encoded_.empty()) {
                unset_header(constants::CONTENT_LENGTH);
            } else {
                set_header(constants::CONTENT_LENGTH, std::to_string(body.encoded_.size()));
            }
        }

        if (body.multipart_ || !body.encoded_.empty()) {
            easy().set_body(body);
        } else {
            easy().clear_body();
        }
    }

    void Transfer::set_get(const Target& url, const encode::Data& query) {
        resolve_target(url, query);
        method_ = "GET";
        easy().clear_body();
        apply_option(CURLOPT_CUSTOMREQUEST, method_);
    }

    void Transfer::set_head(const Target& url, const encode::Data& query) {
        resolve_target(url, query);
        method_ = "HEAD";
        easy().clear_body();
        apply_option(CURLOPT_CUSTOMREQUEST, method_);
        apply_option(CURLOPT_NOBODY, 1L);
    }

    void Transfer::set_delete(const Target& url, const encode::Data& query, const encode::Data& data) {
        resolve_target(url, query);
        method_ = "DELETE";
        if (is_empty_data(data)) {
            easy().clear_body();
        } else {
            apply_body(data);
        }
        apply_option(CURLOPT_CUSTOMREQUEST, method_);
    }

    void Transfer::set_options(const Target& url, const encode::Data& query) {
        resolve_target(url, query);
        method_ = "OPTIONS";
        easy().clear_body();
        apply_option(CURLOPT_CUSTOMREQUEST, method_);
    }

    void Transfer::set_patch(const Target& url, const encode::Data& data) {
        resolve_target(url, {});
        method_ = "PATCH";
        apply_sized_body(data);
        apply_option(CURLOPT_CUSTOMREQUEST, method_);
    }

    void Transfer::set_post(const Target& url, const encode::Data& data, bool follow_303_with_post) {
        resolve_target(url, {});
        method_ = "POST";
        if (follow_303_with_post) {
            apply_option(CURLOPT_POSTREDIR, static_cast<long>(CURL_REDIR_POST_303));
            apply_option(CURLOPT_CUSTOMREQUEST, method_);
        } else if (options_.count(CURLOPT_CUSTOMREQUEST) != 0) {
            apply_option(CURLOPT_CUSTOMREQUEST, nullptr);
        }
        apply_option(CURLOPT_POST, 1L);
        apply_body(data);
    }

    void Transfer::set_put(const Target& url, const encode::Data& data) {
        resolve_target(url, {});
        method_ = "PUT";
        apply_sized_body(data);
        apply_option(CURLOPT_CUSTOMREQUEST, method_);
    }

    void Transfer::set_search(const Target& url, const encode::Data& data) {
        resolve_target(url, {});
        method_ = "SEARCH";
        apply_sized_body(data);
        apply_option(CURLOPT_CUSTOMREQUEST, method_);
    }

    const model::Response& Transfer::get(const Target& url, const encode::Data& query) {
        set_get(url, query);
        return execute();
    }

    const model::Response& Transfer::head(const Target& url, const encode::Data& query) {
        set_head(url, query);
        return execute();
    }

    const model::Response& Transfer::del(const Target& url, const encode::Data& query, const encode::Data& data) {
        set_delete(url, query, data);
        return execute();
    }

    const model::Response& Transfer::send_options(const Target& url, const encode::Data& query) {
        set_options(url, query);
        return execute();
    }

    const model::Response& Transfer::patch(const Target& url, const encode::Data& data) {
        set_patch(url, data);
        return execute();
    }

    const model::Response& Transfer::post(const Target& url, const encode::Data& data, bool follow_303_with_post) {
        set_post(url, data, follow_303_with_post);
        return execute();
    }

    const model::Response& Transfer::put(const Target& url, const encode::Data& data) {
        set_put(url, data);
        return execute();
    }

    const model::Response& Transfer::search(const Target& url, const encode::Data& data) {
        set_search(url, data);
        return execute();
    }

    //
    // Execution
    //

    const model::Response& Transfer::execute() {
        prepare_attempt();
        const CURLcode rc = easy().perform();
        complete_attempt(rc);

        if (child_of_pool_) {
            return response_;
        }

        if (attempt_retry()) {
            return execute();
        }

        finalize();
        return response_;
    }

    void Transfer::prepare_attempt() {
        context_->reset();
        deferred_.clear();
        if (method_ == "HEAD") {
            apply_option(CURLOPT_NOBODY, 1L);
        }
        if (hooks_.before_send_) {
            hooks_.before_send_(*this);
        }
    }

    void Transfer::install_default_decoders() {
        if (!decoders_.json_) {
            decoders_.json_ = decode::decode_json;
        }
        if (!decoders_.xml_) {
            decoders_.xml_ = decode::decode_xml;
        }
    }

    void Transfer::complete_attempt(CURLcode result) {
        ++attempts_;
        install_default_decoders();

        response_ = {};
        response_.raw_body_ = easy().take_body();
        if (result != CURLE_OK) {
            response_.raw_body_.clear();
        }
        response_.raw_headers_ = std::move(context_->raw_response_headers_);
        response_.raw_request_headers_ = std::move(context_->raw_request_headers_);
        response_.cookies_ = std::move(context_->response_cookies_);
        context_->reset();

        response_.request_headers_ = headers::parse_request_headers(response_.raw_request_headers_);
        response_.headers_ = headers::parse_response_headers(response_.raw_headers_);
        response_.body_ = decode::decode_body(response_.raw_body_, response_.headers_, decoders_);

        classify(result);

        unset_header(constants::CONTENT_LENGTH);
        if (options_.count(CURLOPT_NOBODY) != 0) {
            apply_option(CURLOPT_NOBODY, 0L);
        }
    }

    void Transfer::classify(CURLcode result) {
        errors_ = {};
        errors_.transport_code_ = static_cast<long>(result);
        errors_.transport_error_ = result != CURLE_OK;

        if (errors_.transport_error_) {
            std::string message = curl_easy_strerror(result);
            const std::string name = client::CurlEasy::error_constant_name(result);
            if (!name.empty()) {
                message += " (" + name + ")";
            }
            const std::string detail = easy().error_detail();
            if (!detail.empty()) {
                message += ": " + detail;
            }
            errors_.transport_message_ = std::move(message);
            log::logger()->info("transfer {} to {} failed: {}", id_, url_, errors_.transport_message_);
        }

        const auto status_line = response_.headers_.get(constants::STATUS_LINE);
        response_.status_ = status_line ? headers::status_code_from_line(*status_line) : 0;
        if (response_.status_ == 0) {
            response_.status_ = easy().response_code();
        }

        const long status_class = response_.status_ / constants::HTTP_STATUS_CLASS;
        errors_.http_error_ = status_class == 4 || status_class == 5;
        if (errors_.http_error_) {
            errors_.http_message_ = status_line.value_or(std::to_string(response_.status_));
        }
        errors_.error_ = errors_.transport_error_ || errors_.http_error_;

        if (hooks_.after_send_) {
            const bool before = errors_.error_;
            hooks_.after_send_(*this);
            if (before != errors_.error_) {
                log::logger()->debug("after-send hook changed error of transfer {} to {}", id_, errors_.error_);
            }
        }

        if (!errors_.error_) {
            errors_.code_ = 0;
            errors_.message_.clear();
        } else if (errors_.transport_error_) {
            errors_.code_ = errors_.transport_code_;
            errors_.message_ = errors_.transport_message_;
        } else {
            errors_.code_ = response_.status_;
            errors_.message_ = errors_.http_message_;
        }
    }

    bool Transfer::attempt_retry() {
        if (!errors_.error_) {
            return false;
        }

        bool retry = false;
        if (const auto* decider = std::get_if<client::RetryDecider>(&retry_)) {
            retry = *decider && (*decider)(*this);
        } else {
            retry = remaining_retries_ >= 1;
        }

        if (retry) {
            ++retries_;
            if (remaining_retries_ > 0) {
                --remaining_retries_;
            }
            log::logger()->debug("retrying transfer {} (retry {})", id_, retries_);
        }
        return retry;
    }

    void Transfer::finalize() {
        if (errors_.error_) {
            if (hooks_.error_) {
                hooks_.error_(*this);
            }
        } else if (hooks_.success_) {
            hooks_.success_(*this);
        }

        if (hooks_.complete_) {
            hooks_.complete_(*this);
        }

        if (file_) {
            download_complete();
        }
    }

    void Transfer::set_error(bool error) { errors_.error_ = error; }

    void Transfer::raise_for_error() const {
        if (!errors_.error_) {
            return;
        }
        if (errors_.transport_error_) {
            throw http_error::TransportError(errors_.transport_code_, url_, errors_.message_);
        }
        throw http_error::HttpError(response_.status_, url_, response_.raw_body_.substr(0, http_error::BODY_PREVIEW_LENGTH), errors_.message_);
    }

    std::optional<std::string> Transfer::response_cookie(std::string_view name) const {
        for (const auto& [k, v] : response_.cookies_) {
            if (k == name) {
                return v;
            }
        }
        return std::nullopt;
    }

    //
    // Deferred accessors, recomputed after each attempt
    //

    template <typename T, typename Compute>
    const T& Transfer::deferred(Deferred key, Compute compute) {
        auto it = deferred_.find(key);
        if (it == deferred_.end()) {
            it = deferred_.emplace(key, DeferredValue{compute()}).first;
        }
        return std::get<T>(it->second);
    }

    std::string Transfer::effective_url() {
        return deferred<std::string>(Deferred::EFFECTIVE_URL, [this] { return easy_ ? easy_->effective_url() : url_; });
    }

    double Transfer::total_time() {
        return deferred<double>(Deferred::TOTAL_TIME, [this] { return easy_ ? easy_->total_time() : 0.0; });
    }

    std::string Transfer::error_constant() {
        return deferred<std::string>(Deferred::ERROR_CONSTANT,
                                     [this] { return client::CurlEasy::error_constant_name(static_cast<CURLcode>(errors_.transport_code_)); });
    }
}  // namespace fetchpool::http
