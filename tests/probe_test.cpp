#include <gtest/gtest.h>

#include "../src/http/error/http_error.hpp"
#include "../src/http/probe/probe.hpp"
#include "support/local_http_server.hpp"

using fetchpool::probe::probe;
using fetchpool::probe::ProbeCache;
using fetchpool::probe::ProbeOptions;
using fetchpool::testing::LocalHttpServer;
using fetchpool::testing::ServerRequest;
using fetchpool::testing::ServerResponse;

namespace {
    ServerResponse route(const ServerRequest& request) {
        ServerResponse response;
        if (request.path_ == "/moved") {
            response.status_ = 301;
            response.reason_ = "Moved Permanently";
            response.headers_.emplace_back("Location", "/up");
        } else if (request.path_ != "/up") {
            response.status_ = 404;
            response.reason_ = "Not Found";
        }
        return response;
    }

    class ProbeTest : public ::testing::Test {
       protected:
        ProbeCache cache_;
        LocalHttpServer server_{route};
    };
}  // namespace

TEST_F(ProbeTest, ReachableUrlIsCached) {
    EXPECT_TRUE(probe(cache_, server_.url("/up")));
    EXPECT_EQ(server_.requests()[0].method_, "HEAD");
    EXPECT_EQ(cache_.lookup(server_.url("/up")), true);

    EXPECT_TRUE(probe(cache_, server_.url("/up")));
    EXPECT_EQ(server_.request_count(), 1u);
}

TEST_F(ProbeTest, UncachedProbeAlwaysRequests) {
    ProbeOptions options;
    options.cached_ = false;

    EXPECT_TRUE(probe(cache_, server_.url("/up"), options));
    EXPECT_TRUE(probe(cache_, server_.url("/up"), options));

    EXPECT_EQ(server_.request_count(), 2u);
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(ProbeTest, RedirectsAreFollowed) { EXPECT_TRUE(probe(cache_, server_.url("/moved"))); }

TEST_F(ProbeTest, NotFoundIsUnreachable) {
    EXPECT_FALSE(probe(cache_, server_.url("/gone")));
    EXPECT_EQ(cache_.lookup(server_.url("/gone")), false);
}

TEST_F(ProbeTest, ThrowOnErrorRaisesHttpError) {
    ProbeOptions options;
    options.throw_on_error_ = true;

    try {
        probe(cache_, server_.url("/gone"), options);
        FAIL() << "expected HttpError";
    } catch (const fetchpool::http_error::HttpError& e) {
        EXPECT_EQ(e.status_, 404);
    }
}

TEST(ProbeTransportTest, ThrowOnErrorRaisesTransportError) {
    ProbeCache cache;
    ProbeOptions options;
    options.throw_on_error_ = true;
    options.timeout_s_ = 2;

    EXPECT_THROW(probe(cache, "http://127.0.0.1:1/", options), fetchpool::http_error::TransportError);
    EXPECT_EQ(cache.lookup("http://127.0.0.1:1/"), false);
}
