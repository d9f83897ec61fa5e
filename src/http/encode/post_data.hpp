#ifndef FETCHPOOL_POST_DATA_HPP
#define FETCHPOOL_POST_DATA_HPP

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fetchpool::encode {
    using Data = nlohmann::ordered_json;

    struct FormPart {
        std::string name_;
        std::string value_;
        std::optional<std::filesystem::path> file_;
    };

    struct PostBody {
        bool multipart_ = false;
        std::string encoded_;
        std::vector<FormPart> parts_;
    };

    // "@/some/path" naming an existing regular file.
    std::optional<std::filesystem::path> file_reference(const Data& leaf);

    // Flattens nested objects/arrays into "parent[child]" keys. Empty containers become "".
    std::vector<std::pair<std::string, Data>> flatten(const Data& data);

    // Serializes request data for a body-bearing method. Throws SerializationError
    // when a JSON body cannot be encoded.
    PostBody build_post_data(const Data& data, std::string_view content_type);
}  // namespace fetchpool::encode

#endif
