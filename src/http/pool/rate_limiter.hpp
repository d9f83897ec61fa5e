#ifndef FETCHPOOL_RATE_LIMITER_HPP
#define FETCHPOOL_RATE_LIMITER_HPP

#include <chrono>
#include <optional>
#include <string_view>

namespace fetchpool::pool {
    // Fixed-size window of `max_requests` per `interval`. The window restarts on the
    // first check after it has expired, whether or not the quota was used up.
    class RateLimiter {
       public:
        using Clock = std::chrono::steady_clock;

        RateLimiter(long max_requests, std::chrono::seconds interval);

        // "<count>/<interval><unit>", unit one of s, m, h; interval defaults to 1.
        // Throws FormatError.
        static RateLimiter parse(std::string_view rate);

        [[nodiscard]] bool has_quota(Clock::time_point now = Clock::now());
        void record_request(Clock::time_point now = Clock::now());
        // Sleeps until the current window ends, then starts a new one.
        void wait_until_quota();

        [[nodiscard]] long max_requests() const { return max_requests_; }
        [[nodiscard]] std::chrono::seconds interval() const { return interval_; }
        [[nodiscard]] long requests_in_window() const { return requests_in_window_; }

       private:
        long max_requests_;
        std::chrono::seconds interval_;

        Clock::time_point window_start_{};
        long requests_in_window_ = 0;
        bool limit_reached_ = false;
    };
}  // namespace fetchpool::pool

#endif
