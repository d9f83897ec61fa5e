#include "header_parser.hpp"

#include <charconv>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace fetchpool::headers {
    namespace {
        constexpr std::string_view BLOCK_SEPARATOR = "\r\n\r\n";
        constexpr std::string_view LINE_SEPARATOR = "\r\n";
        constexpr std::string_view HTTP_PREFIX = "HTTP/";
        constexpr std::string_view SET_COOKIE_PREFIX = "set-cookie:";

        HeaderStore parse_block(std::string_view block, const char* first_line_key) {
            HeaderStore out;
            std::vector<std::string> lines = string_utils::split(block, LINE_SEPARATOR);
            bool first = true;
            for (auto& line : lines) {
                if (line.empty()) {
                    continue;
                }
                if (first) {
                    out.set(first_line_key, string_utils::trim(line));
                    first = false;
                    continue;
                }
                const auto colon = line.find(':');
                if (colon == std::string::npos) {
                    continue;
                }
                std::string key = string_utils::trim(line.substr(0, colon));
                std::string value = string_utils::trim(line.substr(colon + 1));
                out.append(std::move(key), value);
            }
            return out;
        }

        template <typename Predicate>
        std::string_view last_block(std::string_view raw, Predicate accept) {
            std::string_view last;
            size_t start = 0;
            for (;;) {
                const size_t pos = raw.find(BLOCK_SEPARATOR, start);
                const size_t end = pos == std::string_view::npos ? raw.size() : pos;
                std::string_view block = raw.substr(start, end - start);
                if (accept(block)) {
                    last = block;
                }
                if (pos == std::string_view::npos) {
                    break;
                }
                start = pos + BLOCK_SEPARATOR.size();
            }
            return last;
        }
    }  // namespace

    HeaderStore parse_response_headers(std::string_view raw) {
        const auto block = last_block(raw, [](std::string_view b) { return string_utils::ieq_prefix(b.data(), b.size(), HTTP_PREFIX.data()); });
        return parse_block(block, constants::STATUS_LINE);
    }

    HeaderStore parse_request_headers(std::string_view raw) {
        const auto block = last_block(raw, [](std::string_view b) { return !b.empty(); });
        return parse_block(block, constants::REQUEST_LINE);
    }

    std::optional<std::pair<std::string, std::string>> parse_set_cookie(std::string_view header_line) {
        if (!string_utils::ieq_prefix(header_line.data(), header_line.size(), SET_COOKIE_PREFIX.data())) {
            return std::nullopt;
        }
        std::string_view rest = header_line.substr(SET_COOKIE_PREFIX.size());
        const auto begin = rest.find_first_not_of(" \t");
        if (begin == std::string_view::npos) {
            return std::nullopt;
        }
        rest = rest.substr(begin);

        const auto eq = rest.find('=');
        if (eq == 0 || eq == std::string_view::npos) {
            return std::nullopt;
        }
        std::string_view value = rest.substr(eq + 1);
        value = value.substr(0, value.find_first_of(";\r\n"));
        if (value.empty()) {
            return std::nullopt;
        }
        return std::make_pair(std::string(rest.substr(0, eq)), std::string(value));
    }

    long status_code_from_line(std::string_view status_line) {
        const auto space = status_line.find(' ');
        if (space == std::string_view::npos) {
            return 0;
        }
        std::string_view rest = status_line.substr(space + 1);
        long code = 0;
        const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), code, constants::BASE_10);
        return ec == std::errc() ? code : 0;
    }
}  // namespace fetchpool::headers
