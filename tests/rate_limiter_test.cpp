#include <gtest/gtest.h>

#include <chrono>

#include "../src/http/error/http_error.hpp"
#include "../src/http/pool/rate_limiter.hpp"

using fetchpool::pool::RateLimiter;
using namespace std::chrono_literals;

// =============================================================================
// Parsing
// =============================================================================

TEST(RateLimiterParseTest, AcceptsAllUnits) {
    const auto per_second = RateLimiter::parse("5/s");
    EXPECT_EQ(per_second.max_requests(), 5);
    EXPECT_EQ(per_second.interval(), 1s);

    const auto per_minute = RateLimiter::parse("60/2m");
    EXPECT_EQ(per_minute.max_requests(), 60);
    EXPECT_EQ(per_minute.interval(), 120s);

    const auto per_hour = RateLimiter::parse("100/1H");
    EXPECT_EQ(per_hour.interval(), 3600s);
}

TEST(RateLimiterParseTest, RejectsMalformedSpecs) {
    for (const char* input : {"", "5", "5/", "5/x", "/s", "a/s", "5/1d", "5 / 1s", "0/s", "5/0s"}) {
        EXPECT_THROW(RateLimiter::parse(input), fetchpool::http_error::FormatError) << input;
    }
}

TEST(RateLimiterParseTest, ErrorCarriesInput) {
    try {
        (void)RateLimiter::parse("ten/s");
        FAIL() << "expected FormatError";
    } catch (const fetchpool::http_error::FormatError& e) {
        EXPECT_EQ(e.input_, "ten/s");
    }
}

// =============================================================================
// Window accounting
// =============================================================================

TEST(RateLimiterTest, QuotaExhaustsWithinWindow) {
    RateLimiter limiter(2, 1s);
    const auto t0 = RateLimiter::Clock::now();

    EXPECT_TRUE(limiter.has_quota(t0));
    limiter.record_request(t0);
    EXPECT_TRUE(limiter.has_quota(t0 + 100ms));
    limiter.record_request(t0 + 100ms);

    EXPECT_FALSE(limiter.has_quota(t0 + 200ms));
    EXPECT_FALSE(limiter.has_quota(t0 + 1s));
    EXPECT_EQ(limiter.requests_in_window(), 2);
}

TEST(RateLimiterTest, WindowRestartsAfterExpiry) {
    RateLimiter limiter(1, 1s);
    const auto t0 = RateLimiter::Clock::now();

    limiter.record_request(t0);
    EXPECT_FALSE(limiter.has_quota(t0 + 500ms));

    EXPECT_TRUE(limiter.has_quota(t0 + 1500ms));
    EXPECT_EQ(limiter.requests_in_window(), 0);
    limiter.record_request(t0 + 1500ms);
    EXPECT_FALSE(limiter.has_quota(t0 + 1600ms));
}

TEST(RateLimiterTest, WindowRestartsAfterUnderusedExpiry) {
    RateLimiter limiter(2, 1s);
    const auto t0 = RateLimiter::Clock::now();
    limiter.record_request(t0);

    const auto t1 = t0 + 1200ms;
    int activations = 0;
    while (activations < 10 && limiter.has_quota(t1)) {
        limiter.record_request(t1);
        ++activations;
    }
    EXPECT_EQ(activations, 2);
    EXPECT_EQ(limiter.requests_in_window(), 2);
    EXPECT_FALSE(limiter.has_quota(t1 + 100ms));
    EXPECT_TRUE(limiter.has_quota(t1 + 1100ms));
}

TEST(RateLimiterTest, WaitUntilQuotaBlocksUntilWindowEnds) {
    RateLimiter limiter(1, 1s);
    const auto t0 = RateLimiter::Clock::now();
    limiter.record_request(t0);
    ASSERT_FALSE(limiter.has_quota(t0));

    limiter.wait_until_quota();

    EXPECT_GE(RateLimiter::Clock::now() - t0, 1s);
    EXPECT_TRUE(limiter.has_quota());
}
