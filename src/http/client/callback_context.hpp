#ifndef FETCHPOOL_CALLBACK_CONTEXT_HPP
#define FETCHPOOL_CALLBACK_CONTEXT_HPP

#include <curl/curl.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "../model/model.hpp"

namespace fetchpool::client {
    using StopDecider = std::function<bool(std::string_view header_chunk)>;
    // Non-zero return aborts the transfer.
    using ProgressFn = std::function<int(curl_off_t dl_total, curl_off_t dl_now, curl_off_t ul_total, curl_off_t ul_now)>;

    // State written by the libcurl header/progress/debug callbacks during one attempt.
    // Shared between a Transfer and its CurlEasy; reset between attempts, never reallocated.
    struct CallbackContext {
        std::string raw_response_headers_;
        std::string raw_request_headers_;
        model::Cookies response_cookies_;

        StopDecider stop_request_decider_;
        ProgressFn progress_;
        // Checked before progress_; a larger download aborts.
        std::optional<curl_off_t> max_filesize_;
        bool stop_request_ = false;

        void reset() {
            raw_response_headers_.clear();
            raw_request_headers_.clear();
            response_cookies_.clear();
            stop_request_ = false;
        }
    };
}  // namespace fetchpool::client

#endif
