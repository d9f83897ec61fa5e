//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef FETCHPOOL_CURL_EASY_HPP
#define FETCHPOOL_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "../encode/post_data.hpp"
#include "../model/model.hpp"
#include "callback_context.hpp"

struct curl_slist;

namespace fetchpool::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    // Owns one easy handle plus everything libcurl keeps pointers into:
    // header list, MIME body, error buffer, response body.
    class CurlEasy {
       public:
        explicit CurlEasy(std::shared_ptr<CallbackContext> context);

        ~CurlEasy();
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        // Passes `value` on as the type libcurl declares for `option`.
        CURLcode apply(CURLoption option, const model::OptionValue& value);

        void set_header_lines(const std::vector<std::string>& lines);
        void set_body(const encode::PostBody& body);
        void clear_body();

        void write_to_body();
        void write_to_file(std::FILE* file);

        CURLcode perform();
        void reset();

        [[nodiscard]] CURL* handle() const { return handle_; }
        [[nodiscard]] std::string error_detail() const { return {error_buf_.data()}; }
        [[nodiscard]] const std::string& body() const { return body_; }
        std::string take_body();

        [[nodiscard]] long response_code() const;
        [[nodiscard]] std::string effective_url() const;
        [[nodiscard]] double total_time() const;

        // "CURLE_COULDNT_CONNECT" for CURLE_COULDNT_CONNECT, empty when unknown.
        static std::string error_constant_name(CURLcode code);
        // "CURLOPT_TIMEOUT" for CURLOPT_TIMEOUT, the numeric id when unknown.
        static std::string option_name(CURLoption option);

       private:
        template <typename T>
        CURLcode try_setopt(CURLoption option, T value);
        template <typename T>
        void setopt(CURLoption option, T value);

        void set_defaults();
        void free_headers();
        void free_mime();

        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static int xferinfo_cb(void* userdata, curl_off_t dl_total, curl_off_t dl_now, curl_off_t ul_total, curl_off_t ul_now);
        static int debug_cb(CURL* handle, curl_infotype type, char* data, size_t size, void* userdata);

        std::string body_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};
        curl_mime* mime_{};

        CURL* handle_{};
        std::shared_ptr<CallbackContext> context_;
    };
}  // namespace fetchpool::client

#endif
