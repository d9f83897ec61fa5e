#ifndef FETCHPOOL_CURL_MULTI_HPP
#define FETCHPOOL_CURL_MULTI_HPP

#include <curl/curl.h>

#include <chrono>
#include <optional>
#include <utility>

namespace fetchpool::client {
    struct Completion {
        CURL* handle_;
        CURLcode result_;
    };

    class CurlMulti {
       public:
        CurlMulti();

        ~CurlMulti();
        CurlMulti(const CurlMulti&) = delete;
        CurlMulti& operator=(const CurlMulti&) = delete;
        CurlMulti(CurlMulti&&) = delete;
        CurlMulti& operator=(CurlMulti&&) = delete;

        void add(CURL* easy);
        void remove(CURL* easy);

        // Non-blocking. Returns the number of transfers still running.
        int perform();
        // Blocks until there is activity on any handle or `timeout` passes.
        void wait(std::chrono::milliseconds timeout);
        std::optional<Completion> next_completion();

       private:
        CURLM* handle_{};
    };
}  // namespace fetchpool::client

#endif
