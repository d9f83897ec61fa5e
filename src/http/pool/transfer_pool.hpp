#ifndef FETCHPOOL_TRANSFER_POOL_HPP
#define FETCHPOOL_TRANSFER_POOL_HPP

#include <chrono>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../../utils/constants.hpp"
#include "../client/curl_multi.hpp"
#include "../client/interface.hpp"
#include "../transfer/transfer.hpp"
#include "rate_limiter.hpp"

namespace fetchpool::http {
    struct PoolOptions {
        size_t concurrency_ = constants::DEFAULT_CONCURRENCY;
        std::optional<std::string> base_url_;
        model::OptionMap options_;
        std::optional<std::string> rate_limit_;
        bool prefer_request_time_accuracy_ = false;
    };

    // Runs many Transfers over one libcurl multi handle from the calling thread.
    // Pool settings act as defaults: a Transfer keeps anything it configured itself.
    class TransferPool : public client::IRequestConfig {
       public:
        using Finished = std::map<size_t, std::unique_ptr<Transfer>>;

        explicit TransferPool(PoolOptions options = {});
        ~TransferPool() override;

        void set_opt(CURLoption option, model::OptionValue value) override;
        void set_url(const std::string& url, const encode::Data& data = {}) override;
        void set_header(std::string key, std::string value) override;
        void unset_header(std::string_view key) override;
        void set_cookie(std::string key, std::string value) override;
        void set_retry(client::RetryPolicy policy) override { retry_ = std::move(policy); }
        void set_json_decoder(decode::DecoderFn decoder) override { decoders_.json_ = std::move(decoder); }
        void set_xml_decoder(decode::DecoderFn decoder) override { decoders_.xml_ = std::move(decoder); }
        void set_default_decoder(decode::DecoderFn decoder) override { decoders_.default_ = std::move(decoder); }
        // Drops queued transfers and detaches active ones. Safe to call from a hook.
        void stop() override;
        void close() override;

        void set_concurrency(size_t concurrency);
        void set_rate_limit(std::string_view rate);
        void set_proxies(std::vector<std::string> proxies) { proxies_ = std::move(proxies); }
        void set_request_time_accuracy() { prefer_request_time_accuracy_ = true; }

        Transfer& add_get(const std::string& url, const encode::Data& query = {});
        Transfer& add_head(const std::string& url, const encode::Data& query = {});
        Transfer& add_delete(const std::string& url, const encode::Data& query = {}, const encode::Data& data = {});
        Transfer& add_options(const std::string& url, const encode::Data& query = {});
        Transfer& add_patch(const std::string& url, const encode::Data& data = {});
        Transfer& add_post(const std::string& url, const encode::Data& data = {}, bool follow_303_with_post = false);
        Transfer& add_put(const std::string& url, const encode::Data& data = {});
        Transfer& add_search(const std::string& url, const encode::Data& data = {});
        Transfer& add_download(const std::string& url, const std::filesystem::path& destination);
        Transfer& add_download_with(const std::string& url, DownloadCallback callback);
        Transfer& add_transfer(std::unique_ptr<Transfer> transfer);

        // Blocks until every queued transfer has finished or stop() was called.
        void start();

        [[nodiscard]] size_t concurrency() const { return concurrency_; }
        [[nodiscard]] size_t queued_count() const { return queued_.size(); }
        [[nodiscard]] size_t active_count() const { return active_.size(); }
        // Finished transfers keyed by submission order.
        [[nodiscard]] const Finished& finished() const { return finished_; }
        void clear_finished() { finished_.clear(); }
        [[nodiscard]] std::chrono::system_clock::time_point start_time() const { return start_time_; }
        [[nodiscard]] std::chrono::system_clock::time_point stop_time() const { return stop_time_; }

       private:
        std::unique_ptr<Transfer> make_transfer();
        Transfer& queue(std::unique_ptr<Transfer> transfer);
        void activate_next();
        void apply_defaults(Transfer& transfer);
        void handle_completion(const client::Completion& completion);
        // Moves an active transfer to finished_ and releases its handle.
        void retire(size_t id);
        void detach_all();

        client::CurlMulti multi_;
        size_t concurrency_;
        std::optional<pool::RateLimiter> rate_limiter_;
        bool prefer_request_time_accuracy_;

        std::string base_url_;
        headers::HeaderStore headers_;
        model::Cookies cookies_;
        std::vector<std::string> proxies_;
        decode::DecoderSet decoders_;
        client::RetryPolicy retry_;

        size_t next_id_ = 0;
        std::deque<std::pair<size_t, std::unique_ptr<Transfer>>> queued_;
        std::map<size_t, std::unique_ptr<Transfer>> active_;
        std::unordered_map<CURL*, size_t> handle_ids_;
        Finished finished_;

        bool running_ = false;
        bool stop_requested_ = false;
        std::chrono::system_clock::time_point start_time_{};
        std::chrono::system_clock::time_point stop_time_{};
        std::mt19937 rng_{std::random_device{}()};
    };
}  // namespace fetchpool::http

#endif
