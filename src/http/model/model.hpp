//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef FETCHPOOL_MODEL_HPP
#define FETCHPOOL_MODEL_HPP

#include <curl/curl.h>

#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "../decode/decoder.hpp"
#include "../headers/header_store.hpp"

namespace fetchpool::model {
    // Booleans and curl_off_t values travel as long; the option's declared type decides how it is passed on.
    using OptionValue = std::variant<std::nullptr_t, long, std::string>;
    using OptionMap = std::map<CURLoption, OptionValue>;
    using Cookies = std::vector<std::pair<std::string, std::string>>;

    struct Response {
        long status_ = 0;

        std::string raw_body_;
        std::string raw_headers_;
        std::string raw_request_headers_;

        headers::HeaderStore headers_;
        headers::HeaderStore request_headers_;
        Cookies cookies_;

        decode::Decoded body_;
    };

    struct ErrorState {
        bool error_ = false;
        bool transport_error_ = false;
        bool http_error_ = false;

        long code_ = 0;
        long transport_code_ = 0;

        std::string message_;
        std::string transport_message_;
        std::string http_message_;
    };
}  // namespace fetchpool::model

#endif
