//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef FETCHPOOL_STRING_UTILS_HPP
#define FETCHPOOL_STRING_UTILS_HPP

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    size_t write_to_file(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool iequals(std::string_view a, std::string_view b);


    std::string trim(std::string s);

    std::vector<std::string> split(std::string_view sv, std::string_view delimiter);

    std::vector<std::string> split_comma_delimited_string(std::string_view sv);

    // application/x-www-form-urlencoded: space becomes '+'
    std::string url_encode(std::string_view sv);

    // RFC 3986: space becomes %20
    std::string raw_url_encode(std::string_view sv);

    std::string random_hex(size_t bytes);
}  // namespace string_utils

#endif
