#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "../src/http/encode/post_data.hpp"
#include "../src/http/error/http_error.hpp"

using fetchpool::encode::build_post_data;
using fetchpool::encode::Data;
using fetchpool::encode::flatten;

TEST(PostDataTest, NullValuesArePreservedAsEmpty) {
    const Data data = {{"a", "1"}, {"b", nullptr}, {"c", "3"}};

    const auto body = build_post_data(data, "");

    EXPECT_FALSE(body.multipart_);
    EXPECT_EQ(body.encoded_, "a=1&b=&c=3");
}

TEST(PostDataTest, UsesFormEncodingForSpaces) {
    const auto body = build_post_data(Data{{"q", "a b&c"}}, "application/x-www-form-urlencoded");

    EXPECT_EQ(body.encoded_, "q=a+b%26c");
}

TEST(PostDataTest, NestedDataIsFlattenedWithBrackets) {
    const Data data = {{"user", {{"name", "x"}, {"tags", {"a", "b"}}}}, {"empty", Data::object()}, {"n", 5}};

    const auto body = build_post_data(data, "");

    EXPECT_EQ(body.encoded_, "user%5Bname%5D=x&user%5Btags%5D%5B0%5D=a&user%5Btags%5D%5B1%5D=b&empty=&n=5");
}

TEST(PostDataTest, FlattenKeepsNullLeaves) {
    const auto fields = flatten(Data{{"outer", {{"inner", nullptr}}}});

    ASSERT_EQ(fields.size(), 1u);
    EXPECT_EQ(fields[0].first, "outer[inner]");
    EXPECT_TRUE(fields[0].second.is_null());
}

TEST(PostDataTest, StringsPassThrough) {
    const auto body = build_post_data(Data("raw=body&x=1"), "application/json");

    EXPECT_EQ(body.encoded_, "raw=body&x=1");
}

TEST(PostDataTest, JsonContentTypeEncodesAsJson) {
    const Data data = {{"a", 1}, {"b", nullptr}};

    const auto body = build_post_data(data, "application/json; charset=utf-8");

    EXPECT_EQ(body.encoded_, R"({"a":1,"b":null})");
}

TEST(PostDataTest, InvalidUtf8InJsonBodyThrows) {
    const Data data = {{"bad", std::string("\xff\xfe")}};

    EXPECT_THROW(build_post_data(data, "application/json"), fetchpool::http_error::SerializationError);
}

TEST(PostDataTest, FileReferenceForcesMultipart) {
    const auto path = std::filesystem::temp_directory_path() / "fetchpool_upload_test.txt";
    std::ofstream(path) << "file body";

    const Data data = {{"meta", {{"file", "@" + path.string()}}}, {"title", "t"}};
    const auto body = build_post_data(data, "");

    ASSERT_TRUE(body.multipart_);
    ASSERT_EQ(body.parts_.size(), 2u);
    EXPECT_EQ(body.parts_[0].name_, "meta[file]");
    ASSERT_TRUE(body.parts_[0].file_.has_value());
    EXPECT_EQ(*body.parts_[0].file_, path);
    EXPECT_EQ(body.parts_[1].value_, "t");

    std::filesystem::remove(path);
}

TEST(PostDataTest, AtSignWithoutFileIsPlainText) {
    const auto body = build_post_data(Data{{"handle", "@nobody-here"}}, "");

    EXPECT_FALSE(body.multipart_);
    EXPECT_EQ(body.encoded_, "handle=%40nobody-here");
}

TEST(PostDataTest, MultipartContentTypeKeepsStructuredFields) {
    const auto body = build_post_data(Data{{"a", "1"}}, "multipart/form-data");

    ASSERT_TRUE(body.multipart_);
    ASSERT_EQ(body.parts_.size(), 1u);
    EXPECT_EQ(body.parts_[0].value_, "1");
}
