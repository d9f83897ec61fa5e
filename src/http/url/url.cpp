#include "url.hpp"

#include <curl/curl.h>

#include <cctype>
#include <memory>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"

namespace fetchpool::url {
    namespace {
        constexpr std::string_view ALLOWED_PUNCTUATION = "-._~!$&'()*+,;=:@/?#[]";
        constexpr const char* HEX_DIGITS = "0123456789ABCDEF";

        struct CurlUrlDeleter {
            void operator()(CURLU* u) const noexcept { curl_url_cleanup(u); }
        };
        using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

        struct CurlStringDeleter {
            void operator()(char* s) const noexcept { curl_free(s); }
        };

        bool is_hex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

        void set_or_throw(CURLU* handle, const std::string& value, std::string_view original) {
            const CURLUcode rc = curl_url_set(handle, CURLUPART_URL, value.c_str(), CURLU_NON_SUPPORT_SCHEME);
            if (rc != CURLUE_OK) {
                throw http_error::ResolutionError(std::string(original), std::string("Unable to parse URL: ") + curl_url_strerror(rc));
            }
        }

        std::string read_url(CURLU* handle, std::string_view original) {
            char* raw = nullptr;
            const CURLUcode rc = curl_url_get(handle, CURLUPART_URL, &raw, 0);
            std::unique_ptr<char, CurlStringDeleter> out(raw);
            if (rc != CURLUE_OK || !out) {
                throw http_error::ResolutionError(std::string(original), std::string("Unable to build URL: ") + curl_url_strerror(rc));
            }
            return {out.get()};
        }

        void append_pairs(const nlohmann::ordered_json& value, const std::string& prefix, std::string& out) {
            if (value.is_null()) {
                return;
            }
            if (value.is_object() || value.is_array()) {
                size_t index = 0;
                for (auto it = value.begin(); it != value.end(); ++it, ++index) {
                    const std::string key = value.is_object() ? it.key() : std::to_string(index);
                    append_pairs(*it, prefix.empty() ? key : prefix + "[" + key + "]", out);
                }
                return;
            }

            std::string scalar;
            if (value.is_string()) {
                scalar = value.get<std::string>();
            } else if (value.is_boolean()) {
                scalar = value.get<bool>() ? "1" : "0";
            } else {
                scalar = value.dump();
            }
            if (!out.empty()) {
                out.push_back('&');
            }
            out += string_utils::url_encode(prefix) + "=" + string_utils::url_encode(scalar);
        }
    }  // namespace

    std::string percent_encode_disallowed(std::string_view input) {
        std::string out;
        out.reserve(input.size());
        for (size_t i = 0; i < input.size(); ++i) {
            const auto c = static_cast<unsigned char>(input[i]);
            if (c == '%') {
                // keep existing escapes, encode a stray percent sign
                if (i + 2 < input.size() && is_hex(input[i + 1]) && is_hex(input[i + 2])) {
                    out.push_back('%');
                } else {
                    out += "%25";
                }
                continue;
            }
            if (std::isalnum(c) != 0 || ALLOWED_PUNCTUATION.find(static_cast<char>(c)) != std::string_view::npos) {
                out.push_back(static_cast<char>(c));
                continue;
            }
            out.push_back('%');
            out.push_back(HEX_DIGITS[c >> 4U]);
            out.push_back(HEX_DIGITS[c & 0x0FU]);
        }
        return out;
    }

    std::string resolve(std::string_view base, std::string_view relative) {
        CurlUrlPtr handle(curl_url());
        if (!handle) {
            throw http_error::ResolutionError(std::string(base), "Unable to allocate URL handle");
        }
        set_or_throw(handle.get(), percent_encode_disallowed(base), base);
        set_or_throw(handle.get(), percent_encode_disallowed(relative), relative);
        return read_url(handle.get(), relative);
    }

    std::string normalize(std::string_view absolute) {
        CurlUrlPtr handle(curl_url());
        if (!handle) {
            throw http_error::ResolutionError(std::string(absolute), "Unable to allocate URL handle");
        }
        set_or_throw(handle.get(), percent_encode_disallowed(absolute), absolute);
        return read_url(handle.get(), absolute);
    }

    std::string build_query(const nlohmann::ordered_json& data) {
        std::string out;
        append_pairs(data, "", out);
        return out;
    }

    std::string build_url(std::string_view url, const nlohmann::ordered_json& data) {
        std::string out(url);
        std::string query;
        if (data.is_string()) {
            query = data.get<std::string>();
        } else if (data.is_object() || data.is_array()) {
            query = build_query(data);
        } else if (!data.is_null()) {
            query = data.dump();
        }
        if (query.empty()) {
            return out;
        }
        const auto q = out.find('?');
        out.push_back(q != std::string::npos && q > 0 ? '&' : '?');
        out += query;
        return out;
    }
}  // namespace fetchpool::url
