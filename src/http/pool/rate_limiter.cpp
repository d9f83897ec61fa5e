#include "rate_limiter.hpp"

#include <cctype>
#include <regex>
#include <string>
#include <thread>

#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"

namespace fetchpool::pool {
    RateLimiter::RateLimiter(long max_requests, std::chrono::seconds interval) : max_requests_(max_requests), interval_(interval) {}

    RateLimiter RateLimiter::parse(std::string_view rate) {
        static const std::regex pattern(R"(^(\d+)\/(\d+)?(s|m|h)$)", std::regex::ECMAScript | std::regex::icase);

        const std::string input(rate);
        std::smatch match;
        if (!std::regex_match(input, match, pattern)) {
            throw http_error::FormatError(input, "rate limit must be of the form \"<count>/<interval><s|m|h>\", got \"" + input + "\"");
        }

        const long count = std::stol(match[1].str());
        const long interval = match[2].matched ? std::stol(match[2].str()) : 1L;
        if (count < 1 || interval < 1) {
            throw http_error::FormatError(input, "rate limit count and interval must be positive, got \"" + input + "\"");
        }

        long unit = 1;
        switch (std::tolower(static_cast<unsigned char>(match[3].str()[0]))) {
            case 'm':
                unit = constants::SECONDS_PER_MINUTE;
                break;
            case 'h':
                unit = constants::SECONDS_PER_HOUR;
                break;
            default:
                break;
        }
        return {count, std::chrono::seconds{interval * unit}};
    }

    bool RateLimiter::has_quota(Clock::time_point now) {
        if (now - window_start_ > interval_) {
            window_start_ = now;
            requests_in_window_ = 0;
        }
        limit_reached_ = requests_in_window_ >= max_requests_;
        return !limit_reached_;
    }

    void RateLimiter::record_request(Clock::time_point now) {
        if (requests_in_window_ == 0) {
            window_start_ = now;
        }
        ++requests_in_window_;
    }

    void RateLimiter::wait_until_quota() {
        const auto window_end = window_start_ + interval_;
        const auto remaining = window_end - Clock::now();
        if (remaining > std::chrono::seconds{1}) {
            std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::seconds>(remaining));
        }
        while (Clock::now() < window_end) {
            std::this_thread::sleep_for(constants::QUOTA_POLL_INTERVAL);
        }
        window_start_ = Clock::now();
        requests_in_window_ = 0;
        limit_reached_ = false;
    }
}  // namespace fetchpool::pool
