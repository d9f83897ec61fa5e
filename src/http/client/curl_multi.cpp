#include "curl_multi.hpp"

#include <string>

#include "../error/http_error.hpp"

namespace fetchpool::client {
    namespace {
        void throw_if_failed(CURLMcode rc, const char* what) {
            if (rc != CURLM_OK) {
                throw http_error::MultiError(static_cast<int>(rc), std::string(what) + " failed: " + curl_multi_strerror(rc));
            }
        }
    }  // namespace

    CurlMulti::CurlMulti() : handle_(curl_multi_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL multi handle");
        }
    }

    CurlMulti::~CurlMulti() {
        if (handle_ != nullptr) {
            curl_multi_cleanup(handle_);
        }
    }

    void CurlMulti::add(CURL* easy) { throw_if_failed(curl_multi_add_handle(handle_, easy), "curl_multi_add_handle"); }

    void CurlMulti::remove(CURL* easy) { throw_if_failed(curl_multi_remove_handle(handle_, easy), "curl_multi_remove_handle"); }

    int CurlMulti::perform() {
        int running = 0;
        throw_if_failed(curl_multi_perform(handle_, &running), "curl_multi_perform");
        return running;
    }

    void CurlMulti::wait(std::chrono::milliseconds timeout) {
        throw_if_failed(curl_multi_wait(handle_, nullptr, 0, static_cast<int>(timeout.count()), nullptr), "curl_multi_wait");
    }

    std::optional<Completion> CurlMulti::next_completion() {
        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(handle_, &queued)) {
            if (msg->msg == CURLMSG_DONE) {
                return Completion{msg->easy_handle, msg->data.result};
            }
        }
        return std::nullopt;
    }
}  // namespace fetchpool::client
