#ifndef FETCHPOOL_HEADER_PARSER_HPP
#define FETCHPOOL_HEADER_PARSER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "header_store.hpp"

namespace fetchpool::headers {
    // Keeps only the last "HTTP/" block, so redirect hops are dropped.
    // The status line is stored under "Status-Line".
    HeaderStore parse_response_headers(std::string_view raw);

    // Same as above for CURLINFO_HEADER_OUT text; first line is "Request-Line".
    HeaderStore parse_request_headers(std::string_view raw);

    // "Set-Cookie: name=value; ..." -> {name, value}
    std::optional<std::pair<std::string, std::string>> parse_set_cookie(std::string_view header_line);

    // "HTTP/1.1 404 Not Found" -> 404, 0 when unparseable.
    long status_code_from_line(std::string_view status_line);
}  // namespace fetchpool::headers

#endif
