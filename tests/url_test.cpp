#include <gtest/gtest.h>

#include "../src/http/error/http_error.hpp"
#include "../src/http/url/url.hpp"

namespace url = fetchpool::url;
using Data = nlohmann::ordered_json;

TEST(UrlTest, ResolvesRelativePath) {
    EXPECT_EQ(url::resolve("http://example.com/a/b/c", "d"), "http://example.com/a/b/d");
    EXPECT_EQ(url::resolve("http://example.com/a/b/c", "../d"), "http://example.com/a/d");
    EXPECT_EQ(url::resolve("http://example.com/a/b/c", "/x/./y/../z"), "http://example.com/x/z");
}

TEST(UrlTest, AbsoluteReferenceReplacesBase) {
    EXPECT_EQ(url::resolve("http://example.com/a", "https://other.org/p"), "https://other.org/p");
}


TEST(UrlTest, DisallowedCharactersArePercentEncoded) {
    EXPECT_EQ(url::percent_encode_disallowed("/a b/c\"d"), "/a%20b/c%22d");
    EXPECT_EQ(url::percent_encode_disallowed("/100%/ok%20"), "/100%25/ok%20");
}

TEST(UrlTest, UnparseableUrlThrows) { EXPECT_THROW(url::normalize("http://"), fetchpool::http_error::ResolutionError); }

TEST(UrlTest, BuildUrlAppendsQuery) {
    EXPECT_EQ(url::build_url("http://h/p", Data{{"a", "1"}, {"b", "x y"}}), "http://h/p?a=1&b=x+y");
    EXPECT_EQ(url::build_url("http://h/p?z=0", Data{{"a", "1"}}), "http://h/p?z=0&a=1");
    EXPECT_EQ(url::build_url("http://h/p", Data{}), "http://h/p");
}

TEST(UrlTest, QueryBuilderDropsNulls) {
    EXPECT_EQ(url::build_query(Data{{"a", "1"}, {"b", nullptr}, {"c", true}, {"d", {{"e", 2}}}}), "a=1&c=1&d%5Be%5D=2");
}
