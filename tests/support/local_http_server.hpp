#ifndef FETCHPOOL_TESTS_LOCAL_HTTP_SERVER_HPP
#define FETCHPOOL_TESTS_LOCAL_HTTP_SERVER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "../../src/http/headers/header_store.hpp"

namespace fetchpool::testing {
    struct ServerRequest {
        std::string method_;
        std::string target_;
        std::string path_;
        std::string query_;
        headers::HeaderStore headers_;
        std::string body_;
        std::chrono::steady_clock::time_point received_at_;
    };

    struct ServerResponse {
        int status_ = 200;
        std::string reason_ = "OK";
        std::vector<std::pair<std::string, std::string>> headers_;
        std::string body_;
        std::chrono::milliseconds delay_{0};
        bool send_content_length_ = true;
        // Sent verbatim instead of the fields above when set.
        std::string raw_;
    };

    using Handler = std::function<ServerResponse(const ServerRequest&)>;

    // Loopback HTTP/1.1 server, one thread per connection, Connection: close.
    class LocalHttpServer {
       public:
        explicit LocalHttpServer(Handler handler);
        ~LocalHttpServer();
        LocalHttpServer(const LocalHttpServer&) = delete;
        LocalHttpServer& operator=(const LocalHttpServer&) = delete;

        [[nodiscard]] std::string url(std::string_view path = "/") const;
        [[nodiscard]] uint16_t port() const { return port_; }
        [[nodiscard]] std::vector<ServerRequest> requests() const;
        [[nodiscard]] size_t request_count() const;

       private:
        void accept_loop();
        void serve(int fd);

        Handler handler_;
        int listen_fd_ = -1;
        uint16_t port_ = 0;
        std::atomic<bool> running_{false};
        std::thread acceptor_;
        std::vector<std::thread> workers_;
        mutable std::mutex mutex_;
        std::vector<ServerRequest> requests_;
    };
}  // namespace fetchpool::testing

#endif
