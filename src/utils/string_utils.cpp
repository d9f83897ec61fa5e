//
// Created by Daniel Griffiths on 11/1/25.
//

#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <string>
#include <vector>

namespace string_utils {
    namespace {
        constexpr const char* HEX_DIGITS = "0123456789ABCDEF";

        bool is_unreserved(unsigned char c) { return std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.'; }

        std::string percent_encode(std::string_view sv, bool plus_for_space, bool keep_tilde) {
            std::string out;
            out.reserve(sv.size() * 3);
            for (const unsigned char c : sv) {
                if (is_unreserved(c) || (keep_tilde && c == '~')) {
                    out.push_back(static_cast<char>(c));
                } else if (plus_for_space && c == ' ') {
                    out.push_back('+');
                } else {
                    out.push_back('%');
                    out.push_back(HEX_DIGITS[c >> 4U]);
                    out.push_back(HEX_DIGITS[c & 0x0FU]);
                }
            }
            return out;
        }
    }  // namespace

    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    size_t write_to_file(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *file = static_cast<std::FILE *>(userdata);
        return std::fwrite(ptr, size, nmemb, file) * size;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(buf[i]) != std::tolower(key[i])) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool iequals(std::string_view a, std::string_view b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char l, unsigned char r) {
                   return std::tolower(l) == std::tolower(r);
               });
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::vector<std::string> split(std::string_view sv, std::string_view delimiter) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            const size_t pos = sv.find(delimiter, start);
            if (pos == std::string_view::npos) {
                out.emplace_back(sv.substr(start));
                break;
            }
            out.emplace_back(sv.substr(start, pos - start));
            start = pos + delimiter.size();
        }
        return out;
    }

    std::vector<std::string> split_comma_delimited_string(std::string_view sv) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            size_t pos = sv.find(',', start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;

            std::string_view token = sv.substr(start, end - start);
            const auto first = token.find_first_not_of(" \t");
            if (first != std::string_view::npos) {
                const auto last = token.find_last_not_of(" \t");
                out.emplace_back(token.substr(first, last - first + 1));
            }

            if (pos == std::string_view::npos) {
                break;
            }

            start = pos + 1;
        }
        return out;
    }

    std::string url_encode(std::string_view sv) { return percent_encode(sv, true, false); }

    std::string raw_url_encode(std::string_view sv) { return percent_encode(sv, false, true); }

    std::string random_hex(size_t bytes) {
        std::random_device rd;
        std::uniform_int_distribution<int> dist(0, 255);
        std::string out;
        out.reserve(bytes * 2);
        for (size_t i = 0; i < bytes; ++i) {
            const auto b = static_cast<unsigned>(dist(rd));
            out.push_back(static_cast<char>(std::tolower(HEX_DIGITS[b >> 4U])));
            out.push_back(static_cast<char>(std::tolower(HEX_DIGITS[b & 0x0FU])));
        }
        return out;
    }
}  // namespace string_utils
