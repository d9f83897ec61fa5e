#include "local_http_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <sstream>
#include <stdexcept>

#include "../../src/utils/string_utils.hpp"

namespace fetchpool::testing {
    namespace {
        constexpr size_t RECV_BUFFER_SIZE = 4096;
        constexpr int LISTEN_BACKLOG = 64;

        bool send_all(int fd, const std::string& data) {
            size_t off = 0;
            while (off < data.size()) {
                const ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
                if (n <= 0) {
                    return false;
                }
                off += static_cast<size_t>(n);
            }
            return true;
        }

        bool recv_request(int fd, ServerRequest& request) {
            std::string raw;
            char buf[RECV_BUFFER_SIZE];
            while (raw.find("\r\n\r\n") == std::string::npos) {
                const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
                if (n <= 0) {
                    return false;
                }
                raw.append(buf, static_cast<size_t>(n));
            }

            const size_t header_end = raw.find("\r\n\r\n");
            const auto lines = string_utils::split(std::string_view(raw).substr(0, header_end), "\r\n");
            std::istringstream first(lines.front());
            std::string version;
            first >> request.method_ >> request.target_ >> version;

            const auto q = request.target_.find('?');
            request.path_ = request.target_.substr(0, q);
            request.query_ = q == std::string::npos ? "" : request.target_.substr(q + 1);

            for (size_t i = 1; i < lines.size(); ++i) {
                const auto colon = lines[i].find(':');
                if (colon != std::string::npos) {
                    request.headers_.append(string_utils::trim(lines[i].substr(0, colon)), string_utils::trim(lines[i].substr(colon + 1)));
                }
            }

            size_t content_length = 0;
            if (auto cl = request.headers_.get("Content-Length")) {
                content_length = std::stoul(*cl);
            }
            request.body_ = raw.substr(header_end + 4);
            while (request.body_.size() < content_length) {
                const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
                if (n <= 0) {
                    return false;
                }
                request.body_.append(buf, static_cast<size_t>(n));
            }
            request.received_at_ = std::chrono::steady_clock::now();
            return true;
        }

        std::string render(const ServerRequest& request, const ServerResponse& response) {
            if (!response.raw_.empty()) {
                return response.raw_;
            }
            std::ostringstream oss;
            oss << "HTTP/1.1 " << response.status_ << " " << response.reason_ << "\r\n";
            for (const auto& [key, value] : response.headers_) {
                oss << key << ": " << value << "\r\n";
            }
            if (response.send_content_length_) {
                oss << "Content-Length: " << response.body_.size() << "\r\n";
            }
            oss << "Connection: close\r\n\r\n";
            if (request.method_ != "HEAD") {
                oss << response.body_;
            }
            return oss.str();
        }
    }  // namespace

    LocalHttpServer::LocalHttpServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(listen_fd_, LISTEN_BACKLOG) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind()/listen() failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        running_ = true;
        acceptor_ = std::thread([this] { accept_loop(); });
    }

    LocalHttpServer::~LocalHttpServer() {
        running_ = false;
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        if (acceptor_.joinable()) {
            acceptor_.join();
        }
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    std::string LocalHttpServer::url(std::string_view path) const { return "http://127.0.0.1:" + std::to_string(port_) + std::string(path); }

    std::vector<ServerRequest> LocalHttpServer::requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t LocalHttpServer::request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    void LocalHttpServer::accept_loop() {
        while (running_) {
            const int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                if (!running_) {
                    break;
                }
                continue;
            }
            workers_.emplace_back([this, fd] { serve(fd); });
        }
    }

    void LocalHttpServer::serve(int fd) {
        ServerRequest request;
        if (recv_request(fd, request)) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
            }
            const ServerResponse response = handler_(request);
            if (response.delay_.count() > 0) {
                std::this_thread::sleep_for(response.delay_);
            }
            send_all(fd, render(request, response));
        }
        ::shutdown(fd, SHUT_WR);
        ::close(fd);
    }
}  // namespace fetchpool::testing
