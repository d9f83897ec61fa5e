//
// Created by Daniel Griffiths on 11/1/25.
//

#include "curl_easy.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../headers/header_parser.hpp"

namespace fetchpool::client {

    struct CurlDefaults {
        static constexpr long NO_PROGRESS = 0L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long VERBOSE = 1L;
        static constexpr long HTTP_GET = 1L;
    };

    CurlEasy::CurlEasy(std::shared_ptr<CallbackContext> context) : handle_(curl_easy_init()), context_(std::move(context)) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults();
    }

    CurlEasy::~CurlEasy() {
        free_headers();
        free_mime();

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_defaults() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(context_.get()));
        // progress must stay on, it is the only way to cancel a running transfer
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_XFERINFOFUNCTION, &CurlEasy::xferinfo_cb);
        setopt(CURLOPT_XFERINFODATA, static_cast<void*>(context_.get()));
        // verbose output goes to debug_cb, which only keeps outgoing headers
        setopt(CURLOPT_DEBUGFUNCTION, &CurlEasy::debug_cb);
        setopt(CURLOPT_DEBUGDATA, static_cast<void*>(context_.get()));
        setopt(CURLOPT_VERBOSE, CurlDefaults::VERBOSE);
        write_to_body();
    }

    void CurlEasy::reset() {
        free_headers();
        free_mime();
        curl_easy_reset(handle_);
        body_.clear();
        error_buf_[0] = '\0';
        set_defaults();
    }

    void CurlEasy::free_headers() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
    }

    void CurlEasy::free_mime() {
        if (mime_ != nullptr) {
            curl_mime_free(mime_);
            mime_ = nullptr;
        }
    }

    CURLcode CurlEasy::apply(CURLoption option, const model::OptionValue& value) {
        const curl_easyoption* info = curl_easy_option_by_id(option);
        if (info == nullptr) {
            return CURLE_UNKNOWN_OPTION;
        }

        switch (info->type) {
            case CURLOT_LONG:
            case CURLOT_VALUES:
                if (const auto* v = std::get_if<long>(&value)) {
                    return try_setopt(option, *v);
                }
                if (std::holds_alternative<std::nullptr_t>(value)) {
                    return try_setopt(option, 0L);
                }
                return CURLE_BAD_FUNCTION_ARGUMENT;
            case CURLOT_OFF_T:
                if (const auto* v = std::get_if<long>(&value)) {
                    return try_setopt(option, static_cast<curl_off_t>(*v));
                }
                if (std::holds_alternative<std::nullptr_t>(value)) {
                    return try_setopt(option, static_cast<curl_off_t>(0));
                }
                return CURLE_BAD_FUNCTION_ARGUMENT;
            case CURLOT_STRING:
                if (const auto* v = std::get_if<std::string>(&value)) {
                    return try_setopt(option, v->c_str());
                }
                if (std::holds_alternative<std::nullptr_t>(value)) {
                    return try_setopt(option, static_cast<const char*>(nullptr));
                }
                return CURLE_BAD_FUNCTION_ARGUMENT;
            default:
                return CURLE_BAD_FUNCTION_ARGUMENT;
        }
    }

    void CurlEasy::set_header_lines(const std::vector<std::string>& lines) {
        free_headers();
        for (const auto& h : lines) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_body(const encode::PostBody& body) {
        free_mime();

        if (!body.multipart_) {
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.encoded_.size()));
            setopt(CURLOPT_COPYPOSTFIELDS, body.encoded_.c_str());
            return;
        }

        mime_ = curl_mime_init(handle_);
        for (const auto& part : body.parts_) {
            curl_mimepart* mp = curl_mime_addpart(mime_);
            curl_mime_name(mp, part.name_.c_str());
            if (part.file_) {
                curl_mime_filedata(mp, part.file_->c_str());
            } else {
                curl_mime_data(mp, part.value_.data(), part.value_.size());
            }
        }
        setopt(CURLOPT_MIMEPOST, mime_);
    }

    void CurlEasy::clear_body() {
        if (mime_ != nullptr) {
            setopt(CURLOPT_MIMEPOST, static_cast<curl_mime*>(nullptr));
            free_mime();
        }
        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
    }

    void CurlEasy::write_to_body() {
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&body_));
    }

    void CurlEasy::write_to_file(std::FILE* file) {
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_file);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(file));
    }

    CURLcode CurlEasy::perform() {
        error_buf_[0] = '\0';
        return curl_easy_perform(handle_);
    }

    std::string CurlEasy::take_body() {
        std::string out = std::move(body_);
        body_.clear();
        return out;
    }

    long CurlEasy::response_code() const {
        long code = 0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        return code;
    }

    std::string CurlEasy::effective_url() const {
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);
        return eff != nullptr ? std::string{eff} : std::string{};
    }

    double CurlEasy::total_time() const {
        double t = 0.0;
        curl_easy_getinfo(handle_, CURLINFO_TOTAL_TIME, &t);
        return t;
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* ctx = static_cast<CallbackContext*>(userdata);
        const size_t bytes = size * n_items;
        const std::string_view chunk(buffer, bytes);

        ctx->raw_response_headers_.append(chunk);

        if (auto cookie = headers::parse_set_cookie(chunk)) {
            auto& cookies = ctx->response_cookies_;
            auto it = std::find_if(cookies.begin(), cookies.end(), [&](const auto& c) { return c.first == cookie->first; });
            if (it != cookies.end()) {
                it->second = std::move(cookie->second);
            } else {
                cookies.push_back(std::move(*cookie));
            }
        }

        if (ctx->stop_request_decider_ && ctx->stop_request_decider_(chunk)) {
            ctx->stop_request_ = true;
        }

        return bytes;
    }

    int CurlEasy::xferinfo_cb(void* userdata, curl_off_t dl_total, curl_off_t dl_now, curl_off_t ul_total, curl_off_t ul_now) {
        auto* ctx = static_cast<CallbackContext*>(userdata);
        if (ctx->stop_request_) {
            return 1;
        }
        if (ctx->max_filesize_ && dl_now > *ctx->max_filesize_) {
            return 1;
        }
        if (ctx->progress_) {
            return ctx->progress_(dl_total, dl_now, ul_total, ul_now);
        }
        return 0;
    }

    int CurlEasy::debug_cb(CURL* /*handle*/, curl_infotype type, char* data, size_t size, void* userdata) {
        if (type == CURLINFO_HEADER_OUT) {
            static_cast<CallbackContext*>(userdata)->raw_request_headers_.append(data, size);
        }
        return 0;
    }

    std::string CurlEasy::option_name(CURLoption option) {
        const curl_easyoption* info = curl_easy_option_by_id(option);
        if (info == nullptr || info->name == nullptr) {
            return std::to_string(static_cast<long>(option));
        }
        return std::string("CURLOPT_") + info->name;
    }

    std::string CurlEasy::error_constant_name(CURLcode code) {
        static const std::unordered_map<int, const char*> names = {
            {CURLE_OK, "CURLE_OK"},
            {CURLE_UNSUPPORTED_PROTOCOL, "CURLE_UNSUPPORTED_PROTOCOL"},
            {CURLE_FAILED_INIT, "CURLE_FAILED_INIT"},
            {CURLE_URL_MALFORMAT, "CURLE_URL_MALFORMAT"},
            {CURLE_NOT_BUILT_IN, "CURLE_NOT_BUILT_IN"},
            {CURLE_COULDNT_RESOLVE_PROXY, "CURLE_COULDNT_RESOLVE_PROXY"},
            {CURLE_COULDNT_RESOLVE_HOST, "CURLE_COULDNT_RESOLVE_HOST"},
            {CURLE_COULDNT_CONNECT, "CURLE_COULDNT_CONNECT"},
            {CURLE_WEIRD_SERVER_REPLY, "CURLE_WEIRD_SERVER_REPLY"},
            {CURLE_REMOTE_ACCESS_DENIED, "CURLE_REMOTE_ACCESS_DENIED"},
            {CURLE_HTTP2, "CURLE_HTTP2"},
            {CURLE_PARTIAL_FILE, "CURLE_PARTIAL_FILE"},
            {CURLE_QUOTE_ERROR, "CURLE_QUOTE_ERROR"},
            {CURLE_HTTP_RETURNED_ERROR, "CURLE_HTTP_RETURNED_ERROR"},
            {CURLE_WRITE_ERROR, "CURLE_WRITE_ERROR"},
            {CURLE_UPLOAD_FAILED, "CURLE_UPLOAD_FAILED"},
            {CURLE_READ_ERROR, "CURLE_READ_ERROR"},
            {CURLE_OUT_OF_MEMORY, "CURLE_OUT_OF_MEMORY"},
            {CURLE_OPERATION_TIMEDOUT, "CURLE_OPERATION_TIMEDOUT"},
            {CURLE_RANGE_ERROR, "CURLE_RANGE_ERROR"},
            {CURLE_HTTP_POST_ERROR, "CURLE_HTTP_POST_ERROR"},
            {CURLE_SSL_CONNECT_ERROR, "CURLE_SSL_CONNECT_ERROR"},
            {CURLE_BAD_DOWNLOAD_RESUME, "CURLE_BAD_DOWNLOAD_RESUME"},
            {CURLE_FUNCTION_NOT_FOUND, "CURLE_FUNCTION_NOT_FOUND"},
            {CURLE_ABORTED_BY_CALLBACK, "CURLE_ABORTED_BY_CALLBACK"},
            {CURLE_BAD_FUNCTION_ARGUMENT, "CURLE_BAD_FUNCTION_ARGUMENT"},
            {CURLE_INTERFACE_FAILED, "CURLE_INTERFACE_FAILED"},
            {CURLE_TOO_MANY_REDIRECTS, "CURLE_TOO_MANY_REDIRECTS"},
            {CURLE_UNKNOWN_OPTION, "CURLE_UNKNOWN_OPTION"},
            {CURLE_GOT_NOTHING, "CURLE_GOT_NOTHING"},
            {CURLE_SSL_ENGINE_NOTFOUND, "CURLE_SSL_ENGINE_NOTFOUND"},
            {CURLE_SEND_ERROR, "CURLE_SEND_ERROR"},
            {CURLE_RECV_ERROR, "CURLE_RECV_ERROR"},
            {CURLE_SSL_CERTPROBLEM, "CURLE_SSL_CERTPROBLEM"},
            {CURLE_SSL_CIPHER, "CURLE_SSL_CIPHER"},
            {CURLE_PEER_FAILED_VERIFICATION, "CURLE_PEER_FAILED_VERIFICATION"},
            {CURLE_BAD_CONTENT_ENCODING, "CURLE_BAD_CONTENT_ENCODING"},
            {CURLE_FILESIZE_EXCEEDED, "CURLE_FILESIZE_EXCEEDED"},
            {CURLE_LOGIN_DENIED, "CURLE_LOGIN_DENIED"},
            {CURLE_REMOTE_FILE_NOT_FOUND, "CURLE_REMOTE_FILE_NOT_FOUND"},
            {CURLE_SSL_CACERT_BADFILE, "CURLE_SSL_CACERT_BADFILE"},
            {CURLE_AGAIN, "CURLE_AGAIN"},
            {CURLE_SSL_CRL_BADFILE, "CURLE_SSL_CRL_BADFILE"},
            {CURLE_SSL_ISSUER_ERROR, "CURLE_SSL_ISSUER_ERROR"},
            {CURLE_HTTP2_STREAM, "CURLE_HTTP2_STREAM"},
            {CURLE_RECURSIVE_API_CALL, "CURLE_RECURSIVE_API_CALL"},
            {CURLE_PROXY, "CURLE_PROXY"},
            {CURLE_UNRECOVERABLE_POLL, "CURLE_UNRECOVERABLE_POLL"},
        };
        auto it = names.find(static_cast<int>(code));
        return it != names.end() ? std::string{it->second} : std::string{};
    }

    template <typename T>
    CURLcode CurlEasy::try_setopt(CURLoption option, T value) {
        return curl_easy_setopt(handle_, option, value);
    }

    template <typename T>
    void CurlEasy::setopt(CURLoption option, T value) {
        const auto rc = try_setopt(option, value);

        if (rc != CURLE_OK) {
            throw http_error::OptionError(static_cast<long>(option), option_name(option),
                                          std::string("curl_easy_setopt failed for ") + option_name(option) + ": " + curl_easy_strerror(rc));
        }
    }

}  // namespace fetchpool::client
