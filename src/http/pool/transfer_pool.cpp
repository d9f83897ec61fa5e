#include "transfer_pool.hpp"

#include <algorithm>

#include "../../log/logger.hpp"
#include "../error/http_error.hpp"
#include "../url/url.hpp"

namespace fetchpool::http {
    TransferPool::TransferPool(PoolOptions options)
        : concurrency_(std::max<size_t>(1, options.concurrency_)), prefer_request_time_accuracy_(options.prefer_request_time_accuracy_) {
        if (options.base_url_) {
            set_url(*options.base_url_);
        }
        set_opts(options.options_);
        if (options.rate_limit_) {
            set_rate_limit(*options.rate_limit_);
        }
    }

    TransferPool::~TransferPool() { close(); }

    void TransferPool::set_opt(CURLoption option, model::OptionValue value) { options_[option] = std::move(value); }

    void TransferPool::set_url(const std::string& url, const encode::Data& data) { base_url_ = url::build_url(url, data); }

    void TransferPool::set_header(std::string key, std::string value) {
        headers_.set(std::move(key), std::move(value));
        for (auto& [id, transfer] : queued_) {
            transfer->set_headers(headers_);
        }
    }

    void TransferPool::unset_header(std::string_view key) {
        headers_.remove(key);
        for (auto& [id, transfer] : queued_) {
            transfer->unset_header(key);
        }
    }

    void TransferPool::set_cookie(std::string key, std::string value) {
        auto it = std::find_if(cookies_.begin(), cookies_.end(), [&](const auto& c) { return c.first == key; });
        if (it != cookies_.end()) {
            it->second = std::move(value);
        } else {
            cookies_.emplace_back(std::move(key), std::move(value));
        }
    }

    void TransferPool::set_concurrency(size_t concurrency) { concurrency_ = std::max<size_t>(1, concurrency); }

    void TransferPool::set_rate_limit(std::string_view rate) { rate_limiter_ = pool::RateLimiter::parse(rate); }

    //
    // Queueing
    //

    std::unique_ptr<Transfer> TransferPool::make_transfer() {
        auto transfer = std::make_unique<Transfer>(base_url_.empty() ? Target{} : Target{base_url_}, options_);
        // applied before the method so a pool-wide Content-Type steers body encoding
        transfer->set_headers(headers_);
        return transfer;
    }

    Transfer& TransferPool::queue(std::unique_ptr<Transfer> transfer) {
        const size_t id = next_id_++;
        transfer->set_id(std::to_string(id));
        transfer->set_child_of_pool(true);
        if (transfer->headers().empty() && !headers_.empty()) {
            transfer->set_headers(headers_);
        }

        Transfer& ref = *transfer;
        queued_.emplace_back(id, std::move(transfer));
        return ref;
    }

    Transfer& TransferPool::add_transfer(std::unique_ptr<Transfer> transfer) { return queue(std::move(transfer)); }

    Transfer& TransferPool::add_get(const std::string& url, const encode::Data& query) {
        auto transfer = make_transfer();
        transfer->set_get(url, query);
        return queue(std::move(transfer));
    }

    Transfer& TransferPool::add_head(const std::string& url, const encode::Data& query) {
        auto transfer = make_transfer();
        transfer->set_head(url, query);
        return queue(std::move(transfer));
    }

    Transfer& TransferPool::add_delete(const std::string& url, const encode::Data& query, const encode::Data& data) {
        auto transfer = make_transfer();
        transfer->set_delete(url, query, data);
        return queue(std::move(transfer));
    }

    Transfer& TransferPool::add_options(const std::string& url, const encode::Data& query) {
        auto transfer = make_transfer();
        transfer->set_options(url, query);
        return queue(std::move(transfer));
    }

    Transfer& TransferPool::add_patch(const std::string& url, const encode::Data& data) {
        auto transfer = make_transfer();
        transfer->set_patch(url, data);
        return queue(std::move(transfer));
    }

    Transfer& TransferPool::add_post(const std::string& url, const encode::Data& data, bool follow_303_with_post) {
        auto transfer = make_transfer();
        transfer->set_post(url, data, follow_303_with_post);
        return queue(std::move(transfer));
    }

    Transfer& TransferPool::add_put(const std::string& url, const encode::Data& data) {
        auto transfer = make_transfer();
        transfer->set_put(url, data);
        return queue(std::move(transfer));
    }

    Transfer& TransferPool::add_search(const std::string& url, const encode::Data& data) {
        auto transfer = make_transfer();
        transfer->set_search(url, data);
        return queue(std::move(transfer));
    }

    Transfer& TransferPool::add_download(const std::string& url, const std::filesystem::path& destination) {
        auto transfer = make_transfer();
        if (!transfer->set_download(url, destination)) {
            log::logger()->warn("download of {} to {} will not be written to disk", url, destination.string());
        }
        return queue(std::move(transfer));
    }

    Transfer& TransferPool::add_download_with(const std::string& url, DownloadCallback callback) {
        auto transfer = make_transfer();
        if (!transfer->set_download_with(url, std::move(callback))) {
            log::logger()->warn("download of {} has no temporary file", url);
        }
        return queue(std::move(transfer));
    }

    //
    // Scheduling
    //

    void TransferPool::apply_defaults(Transfer& transfer) {
        const auto& own = transfer.hooks();
        if (!own.before_send_ && hooks_.before_send_) {
            transfer.on_before_send(hooks_.before_send_);
        }
        if (!own.after_send_ && hooks_.after_send_) {
            transfer.on_after_send(hooks_.after_send_);
        }
        if (!own.success_ && hooks_.success_) {
            transfer.on_success(hooks_.success_);
        }
        if (!own.error_ && hooks_.error_) {
            transfer.on_error(hooks_.error_);
        }
        if (!own.complete_ && hooks_.complete_) {
            transfer.on_complete(hooks_.complete_);
        }

        const auto& decoders = transfer.decoders();
        if (!decoders.json_ && decoders_.json_) {
            transfer.set_json_decoder(*decoders_.json_);
        }
        if (!decoders.xml_ && decoders_.xml_) {
            transfer.set_xml_decoder(*decoders_.xml_);
        }
        if (!decoders.default_ && decoders_.default_) {
            transfer.set_default_decoder(*decoders_.default_);
        }

        if (std::holds_alternative<std::monostate>(transfer.retry_policy()) && !std::holds_alternative<std::monostate>(retry_)) {
            transfer.set_retry(retry_);
        }

        for (const auto& [key, value] : cookies_) {
            const auto& own_cookies = transfer.cookies();
            const bool has_own = std::any_of(own_cookies.begin(), own_cookies.end(), [&](const auto& c) { return c.first == key; });
            if (!has_own) {
                transfer.set_cookie(key, value);
            }
        }

        if (!proxies_.empty() && !transfer.get_opt(CURLOPT_PROXY)) {
            std::uniform_int_distribution<size_t> pick(0, proxies_.size() - 1);
            transfer.set_proxy(proxies_[pick(rng_)]);
        }
    }

    void TransferPool::activate_next() {
        auto [id, transfer] = std::move(queued_.front());
        queued_.pop_front();

        apply_defaults(*transfer);
        if (rate_limiter_) {
            rate_limiter_->record_request();
        }

        Transfer& ref = *transfer;
        CURL* handle = ref.handle();
        handle_ids_[handle] = id;
        active_.emplace(id, std::move(transfer));

        try {
            ref.prepare_attempt();
            multi_.add(handle);
        } catch (...) {
            retire(id);
            throw;
        }
        log::logger()->debug("activated transfer {} ({} active, {} queued)", id, active_.size(), queued_.size());
    }

    void TransferPool::handle_completion(const client::Completion& completion) {
        auto id_it = handle_ids_.find(completion.handle_);
        if (id_it == handle_ids_.end()) {
            return;
        }
        const size_t id = id_it->second;
        auto active_it = active_.find(id);
        if (active_it == active_.end()) {
            return;
        }
        Transfer& transfer = *active_it->second;

        multi_.remove(completion.handle_);
        try {
            transfer.complete_attempt(completion.result_);
            if (transfer.attempt_retry()) {
                transfer.prepare_attempt();
                multi_.add(completion.handle_);
                return;
            }
            transfer.finalize();
        } catch (...) {
            // a throwing hook ends the transfer; it is not left half-detached in active_
            retire(id);
            throw;
        }
        retire(id);
    }

    void TransferPool::retire(size_t id) {
        auto active_it = active_.find(id);
        if (active_it == active_.end()) {
            return;
        }
        Transfer& transfer = *active_it->second;
        // memoize before the handle is released
        transfer.effective_url();
        transfer.total_time();

        handle_ids_.erase(transfer.handle());
        auto node = active_.extract(active_it);
        node.mapped()->close();
        finished_.insert(std::move(node));
    }

    void TransferPool::start() {
        if (running_) {
            return;
        }
        running_ = true;
        stop_requested_ = false;
        start_time_ = std::chrono::system_clock::now();

        struct RunningReset {
            TransferPool& pool_;
            ~RunningReset() {
                pool_.stop_time_ = std::chrono::system_clock::now();
                pool_.running_ = false;
            }
        } reset{*this};

        const auto wait_timeout = prefer_request_time_accuracy_ ? constants::MULTI_WAIT_TIMEOUT_ACCURATE : constants::MULTI_WAIT_TIMEOUT;
        int still_running = 0;

        do {
            while (!stop_requested_ && !queued_.empty() && active_.size() < concurrency_ && (!rate_limiter_ || rate_limiter_->has_quota())) {
                activate_next();
            }

            if (stop_requested_) {
                detach_all();
                break;
            }

            if (rate_limiter_ && active_.empty() && !queued_.empty() && !rate_limiter_->has_quota()) {
                log::logger()->debug("rate limit of {} per {}s reached, waiting", rate_limiter_->max_requests(), rate_limiter_->interval().count());
                rate_limiter_->wait_until_quota();
                continue;
            }

            still_running = multi_.perform();

            bool completed = false;
            while (auto completion = multi_.next_completion()) {
                handle_completion(*completion);
                completed = true;
                if (stop_requested_) {
                    break;
                }
            }

            if (stop_requested_) {
                detach_all();
                break;
            }

            if (!completed && still_running > 0) {
                multi_.wait(wait_timeout);
            }
        } while (!queued_.empty() || !active_.empty() || still_running > 0);
    }

    void TransferPool::stop() {
        if (running_) {
            stop_requested_ = true;
            return;
        }
        detach_all();
    }

    void TransferPool::detach_all() {
        for (auto& [id, transfer] : queued_) {
            transfer->close();
        }
        queued_.clear();

        for (auto& [id, transfer] : active_) {
            multi_.remove(transfer->handle());
            transfer->stop();
            finished_.emplace(id, std::move(transfer));
        }
        active_.clear();
        handle_ids_.clear();
    }

    void TransferPool::close() {
        try {
            detach_all();
        } catch (const http_error::MultiError& e) {
            log::logger()->error("failed to detach transfers while closing pool: {}", e.what());
        }
    }
}  // namespace fetchpool::http
