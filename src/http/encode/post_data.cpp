#include "post_data.hpp"

#include <system_error>

#include "../../utils/string_utils.hpp"
#include "../decode/decoder.hpp"
#include "../error/http_error.hpp"

namespace fetchpool::encode {
    namespace {
        constexpr std::string_view MULTIPART_FORM_DATA = "multipart/form-data";

        bool is_container(const Data& d) { return d.is_object() || d.is_array(); }

        bool is_nested(const Data& data) {
            for (const auto& value : data) {
                if (is_container(value)) {
                    return true;
                }
            }
            return false;
        }

        template <typename Fn>
        void for_each_member(const Data& data, Fn&& fn) {
            size_t index = 0;
            for (auto it = data.begin(); it != data.end(); ++it, ++index) {
                fn(data.is_object() ? it.key() : std::to_string(index), *it);
            }
        }

        void flatten_into(const Data& data, const std::string& prefix, std::vector<std::pair<std::string, Data>>& out) {
            if (!is_container(data)) {
                out.emplace_back(prefix, data);
                return;
            }
            if (data.empty() && !prefix.empty()) {
                out.emplace_back(prefix, "");
                return;
            }
            for_each_member(data, [&](const std::string& key, const Data& value) {
                flatten_into(value, prefix.empty() ? key : prefix + "[" + key + "]", out);
            });
        }

        std::string scalar_to_string(const Data& value) {
            if (value.is_null()) {
                return "";
            }
            if (value.is_string()) {
                return value.get<std::string>();
            }
            if (value.is_boolean()) {
                return value.get<bool>() ? "1" : "";
            }
            return value.dump();
        }

        std::string encode_json(const Data& data) {
            try {
                return data.dump();
            } catch (const nlohmann::json::exception& e) {
                throw http_error::SerializationError(std::string("Unable to encode request body as JSON: ") + e.what());
            }
        }
    }  // namespace

    std::optional<std::filesystem::path> file_reference(const Data& leaf) {
        if (!leaf.is_string()) {
            return std::nullopt;
        }
        const auto& s = leaf.get_ref<const std::string&>();
        if (s.size() < 2 || s.front() != '@') {
            return std::nullopt;
        }
        std::filesystem::path path(s.substr(1));
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return std::nullopt;
        }
        return path;
    }

    std::vector<std::pair<std::string, Data>> flatten(const Data& data) {
        std::vector<std::pair<std::string, Data>> out;
        if (!is_container(data)) {
            return out;
        }
        if (!is_nested(data)) {
            for_each_member(data, [&](const std::string& key, const Data& value) { out.emplace_back(key, value); });
            return out;
        }
        flatten_into(data, "", out);
        return out;
    }

    PostBody build_post_data(const Data& data, std::string_view content_type) {
        PostBody body;

        if (!is_container(data)) {
            body.encoded_ = scalar_to_string(data);
            return body;
        }

        if (decode::is_json_content_type(content_type)) {
            body.encoded_ = encode_json(data);
            return body;
        }

        const auto fields = flatten(data);
        bool has_file = false;
        for (const auto& [key, value] : fields) {
            if (file_reference(value)) {
                has_file = true;
                break;
            }
        }

        body.multipart_ = has_file || string_utils::ieq_prefix(content_type.data(), content_type.size(), MULTIPART_FORM_DATA.data());
        if (body.multipart_) {
            for (const auto& [key, value] : fields) {
                FormPart part{key, {}, file_reference(value)};
                if (!part.file_) {
                    part.value_ = scalar_to_string(value);
                }
                body.parts_.push_back(std::move(part));
            }
            return body;
        }

        for (const auto& [key, value] : fields) {
            if (!body.encoded_.empty()) {
                body.encoded_.push_back('&');
            }
            body.encoded_ += string_utils::url_encode(key) + "=" + string_utils::url_encode(scalar_to_string(value));
        }
        return body;
    }
}  // namespace fetchpool::encode
