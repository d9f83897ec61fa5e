#ifndef FETCHPOOL_DECODER_HPP
#define FETCHPOOL_DECODER_HPP

#include <simdjson.h>
#include <tinyxml2.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "../headers/header_store.hpp"

namespace fetchpool::decode {
    struct JsonDocument {
        std::shared_ptr<simdjson::dom::document> document_;

        [[nodiscard]] simdjson::dom::element root() const { return document_->root(); }
    };

    struct XmlDocument {
        std::shared_ptr<tinyxml2::XMLDocument> document_;

        [[nodiscard]] const tinyxml2::XMLElement* root() const { return document_->RootElement(); }
    };

    // A decoder that cannot make sense of the body hands back the raw string.
    using Decoded = std::variant<std::string, JsonDocument, XmlDocument>;
    using DecoderFn = std::function<Decoded(const std::string& raw)>;

    // std::nullopt means "not configured"; an empty DecoderFn means "disabled".
    struct DecoderSet {
        std::optional<DecoderFn> json_;
        std::optional<DecoderFn> xml_;
        std::optional<DecoderFn> default_;
    };

    Decoded decode_json(const std::string& raw);
    Decoded decode_xml(const std::string& raw);

    bool is_json_content_type(std::string_view content_type);
    bool is_xml_content_type(std::string_view content_type);

    bool has_gzip_magic(std::string_view raw);
    std::optional<std::string> gunzip(std::string_view raw);

    // Content-type dispatch first, then best-effort gzip on whatever is still raw.
    Decoded decode_body(const std::string& raw, const headers::HeaderStore& response_headers, const DecoderSet& decoders);

    [[nodiscard]] inline bool is_raw(const Decoded& d) { return std::holds_alternative<std::string>(d); }
}  // namespace fetchpool::decode

#endif
