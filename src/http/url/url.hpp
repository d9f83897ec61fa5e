#ifndef FETCHPOOL_URL_HPP
#define FETCHPOOL_URL_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace fetchpool::url {
    // Resolves `relative` against `base` (RFC 3986 section 5). Characters that may
    // not appear in a URI are percent-encoded first. Throws ResolutionError.
    std::string resolve(std::string_view base, std::string_view relative);

    // Normalizes a single absolute URL.
    std::string normalize(std::string_view absolute);

    std::string percent_encode_disallowed(std::string_view input);

    // Query builder that drops null values, as form encoders conventionally do.
    std::string build_query(const nlohmann::ordered_json& data);

    // Appends `data` as a query string. Strings are appended verbatim.
    std::string build_url(std::string_view url, const nlohmann::ordered_json& data);
}  // namespace fetchpool::url

#endif
