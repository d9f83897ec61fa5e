#include "decoder.hpp"

#include <zlib.h>

#include <array>
#include <regex>

#include "../../log/logger.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace fetchpool::decode {
    namespace {
        constexpr int GZIP_WINDOW_BITS = MAX_WBITS + 16;
        constexpr size_t INFLATE_CHUNK = 16 * 1024;

        const std::regex& json_pattern() {
            static const std::regex re(R"(^(?:application|text)/(?:[a-z]+(?:[.-][0-9a-z]+)*[+.]|x-)?json(?:-[a-z]+)?)",
                                       std::regex::ECMAScript | std::regex::icase);
            return re;
        }

        const std::regex& xml_pattern() {
            static const std::regex re(R"(^(?:text/|application/(?:atom\+|rss\+|soap\+)?)xml)", std::regex::ECMAScript | std::regex::icase);
            return re;
        }

        Decoded run(const DecoderFn& fn, const std::string& raw) {
            if (!fn) {
                return raw;
            }
            return fn(raw);
        }
    }  // namespace

    Decoded decode_json(const std::string& raw) {
        simdjson::dom::parser parser;
        auto doc = std::make_shared<simdjson::dom::document>();
        if (parser.parse_into_document(*doc, raw).error() != simdjson::SUCCESS) {
            return raw;
        }
        return JsonDocument{std::move(doc)};
    }

    Decoded decode_xml(const std::string& raw) {
        auto doc = std::make_shared<tinyxml2::XMLDocument>();
        if (doc->Parse(raw.c_str(), raw.size()) != tinyxml2::XML_SUCCESS) {
            return raw;
        }
        return XmlDocument{std::move(doc)};
    }

    bool is_json_content_type(std::string_view content_type) {
        return std::regex_search(content_type.begin(), content_type.end(), json_pattern());
    }

    bool is_xml_content_type(std::string_view content_type) { return std::regex_search(content_type.begin(), content_type.end(), xml_pattern()); }

    bool has_gzip_magic(std::string_view raw) {
        if (raw.size() < constants::GZIP_MAGIC.size()) {
            return false;
        }
        for (size_t i = 0; i < constants::GZIP_MAGIC.size(); ++i) {
            if (static_cast<unsigned char>(raw[i]) != constants::GZIP_MAGIC[i]) {
                return false;
            }
        }
        return true;
    }

    std::optional<std::string> gunzip(std::string_view raw) {
        z_stream zs{};
        if (inflateInit2(&zs, GZIP_WINDOW_BITS) != Z_OK) {
            return std::nullopt;
        }

        zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(raw.data()));
        zs.avail_in = static_cast<uInt>(raw.size());

        std::string out;
        std::array<char, INFLATE_CHUNK> buf{};
        int rc = Z_OK;
        while (rc == Z_OK) {
            zs.next_out = reinterpret_cast<Bytef*>(buf.data());
            zs.avail_out = static_cast<uInt>(buf.size());
            rc = inflate(&zs, Z_NO_FLUSH);
            if (rc != Z_OK && rc != Z_STREAM_END) {
                break;
            }
            out.append(buf.data(), buf.size() - zs.avail_out);
        }
        inflateEnd(&zs);

        if (rc != Z_STREAM_END) {
            return std::nullopt;
        }
        return out;
    }

    Decoded decode_body(const std::string& raw, const headers::HeaderStore& response_headers, const DecoderSet& decoders) {
        const std::string content_type = response_headers.get(constants::CONTENT_TYPE).value_or("");

        Decoded decoded = raw;
        if (decoders.json_ && is_json_content_type(content_type)) {
            decoded = run(*decoders.json_, raw);
        } else if (decoders.xml_ && is_xml_content_type(content_type)) {
            decoded = run(*decoders.xml_, raw);
        } else if (decoders.default_) {
            decoded = run(*decoders.default_, raw);
        }

        if (!is_raw(decoded)) {
            return decoded;
        }

        const bool declared = string_utils::iequals(response_headers.get(constants::CONTENT_ENCODING).value_or(""), "gzip");
        const auto& current = std::get<std::string>(decoded);
        if (declared || has_gzip_magic(current)) {
            if (auto inflated = gunzip(current)) {
                return std::move(*inflated);
            }
            log::logger()->debug("gzip body could not be inflated, keeping raw bytes");
        }
        return decoded;
    }
}  // namespace fetchpool::decode
