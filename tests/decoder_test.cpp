#include <gtest/gtest.h>
#include <zlib.h>

#include <string>

#include "../src/http/decode/decoder.hpp"

namespace decode = fetchpool::decode;
using fetchpool::headers::HeaderStore;

namespace {
    std::string gzip(const std::string& plain) {
        z_stream zs{};
        deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, MAX_WBITS + 16, 8, Z_DEFAULT_STRATEGY);
        std::string out(deflateBound(&zs, plain.size()), '\0');
        zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(plain.data()));
        zs.avail_in = static_cast<uInt>(plain.size());
        zs.next_out = reinterpret_cast<Bytef*>(out.data());
        zs.avail_out = static_cast<uInt>(out.size());
        deflate(&zs, Z_FINISH);
        out.resize(zs.total_out);
        deflateEnd(&zs);
        return out;
    }

    decode::DecoderSet defaults() { return {decode::decode_json, decode::decode_xml, std::nullopt}; }
}  // namespace

// =============================================================================
// Content-type matching
// =============================================================================

TEST(ContentTypeTest, JsonVariants) {
    EXPECT_TRUE(decode::is_json_content_type("application/json"));
    EXPECT_TRUE(decode::is_json_content_type("application/json; charset=utf-8"));
    EXPECT_TRUE(decode::is_json_content_type("text/json"));
    EXPECT_TRUE(decode::is_json_content_type("application/vnd.api+json"));
    EXPECT_TRUE(decode::is_json_content_type("application/x-json"));
    EXPECT_TRUE(decode::is_json_content_type("Application/JSON"));
    EXPECT_FALSE(decode::is_json_content_type("text/html"));
    EXPECT_FALSE(decode::is_json_content_type("image/json"));
}

TEST(ContentTypeTest, XmlVariants) {
    EXPECT_TRUE(decode::is_xml_content_type("text/xml"));
    EXPECT_TRUE(decode::is_xml_content_type("application/xml; charset=utf-8"));
    EXPECT_TRUE(decode::is_xml_content_type("application/atom+xml"));
    EXPECT_TRUE(decode::is_xml_content_type("application/rss+xml"));
    EXPECT_TRUE(decode::is_xml_content_type("application/soap+xml"));
    EXPECT_FALSE(decode::is_xml_content_type("application/xhtml+xml"));
    EXPECT_FALSE(decode::is_xml_content_type("application/json"));
}

// =============================================================================
// Decoders
// =============================================================================

TEST(DecoderTest, JsonBodyIsParsed) {
    const auto decoded = decode::decode_body(R"({"id": 7, "name": "x"})", {{"Content-Type", "application/json"}}, defaults());

    ASSERT_TRUE(std::holds_alternative<decode::JsonDocument>(decoded));
    const auto root = std::get<decode::JsonDocument>(decoded).root();
    EXPECT_EQ(root["id"].get_int64().value(), 7);
    EXPECT_EQ(root["name"].get_string().value(), "x");
}

TEST(DecoderTest, InvalidJsonFallsBackToRaw) {
    const auto decoded = decode::decode_body("{not json", {{"Content-Type", "application/json"}}, defaults());

    ASSERT_TRUE(decode::is_raw(decoded));
    EXPECT_EQ(std::get<std::string>(decoded), "{not json");
}

TEST(DecoderTest, EmptyJsonBodyFallsBackToRaw) {
    const auto decoded = decode::decode_json("");

    ASSERT_TRUE(decode::is_raw(decoded));
    EXPECT_EQ(std::get<std::string>(decoded), "");
}

TEST(DecoderTest, XmlBodyIsParsed) {
    const auto decoded = decode::decode_body("<feed><title>t</title></feed>", {{"Content-Type", "application/atom+xml"}}, defaults());

    ASSERT_TRUE(std::holds_alternative<decode::XmlDocument>(decoded));
    const auto* root = std::get<decode::XmlDocument>(decoded).root();
    ASSERT_NE(root, nullptr);
    EXPECT_STREQ(root->Name(), "feed");
    EXPECT_STREQ(root->FirstChildElement("title")->GetText(), "t");
}

TEST(DecoderTest, MalformedXmlFallsBackToRaw) {
    const auto decoded = decode::decode_body("<open>", {{"Content-Type", "text/xml"}}, defaults());

    EXPECT_TRUE(decode::is_raw(decoded));
}

TEST(DecoderTest, DisabledDecoderPassesRawThrough) {
    decode::DecoderSet set = defaults();
    set.json_ = decode::DecoderFn{};

    const auto decoded = decode::decode_body(R"({"a":1})", {{"Content-Type", "application/json"}}, set);

    ASSERT_TRUE(decode::is_raw(decoded));
    EXPECT_EQ(std::get<std::string>(decoded), R"({"a":1})");
}

TEST(DecoderTest, DefaultDecoderHandlesUnknownContentType) {
    decode::DecoderSet set = defaults();
    set.default_ = decode::decode_json;

    const auto decoded = decode::decode_body("[1,2]", {{"Content-Type", "text/plain"}}, set);

    EXPECT_TRUE(std::holds_alternative<decode::JsonDocument>(decoded));
}

// =============================================================================
// gzip
// =============================================================================

TEST(GzipTest, MagicBytesTriggerDecompressionWithoutHeader) {
    const std::string body = gzip("hello gzip");
    ASSERT_TRUE(decode::has_gzip_magic(body));

    const auto decoded = decode::decode_body(body, {}, defaults());

    ASSERT_TRUE(decode::is_raw(decoded));
    EXPECT_EQ(std::get<std::string>(decoded), "hello gzip");
}

TEST(GzipTest, CorruptPayloadKeepsOriginalBytes) {
    std::string body = gzip("some content that is long enough to corrupt");
    body.resize(body.size() / 2);
    body.append("garbage");

    const auto decoded = decode::decode_body(body, {{"Content-Encoding", "gzip"}}, defaults());

    ASSERT_TRUE(decode::is_raw(decoded));
    EXPECT_EQ(std::get<std::string>(decoded), body);
}

TEST(GzipTest, DeclaredEncodingWithoutMagicIsLeftAlone) {
    const auto decoded = decode::decode_body("plain", {{"Content-Encoding", "gzip"}}, defaults());

    EXPECT_EQ(std::get<std::string>(decoded), "plain");
}
