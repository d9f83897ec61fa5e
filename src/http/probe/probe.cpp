#include "probe.hpp"

#include "../../log/logger.hpp"
#include "../error/http_error.hpp"
#include "../transfer/transfer.hpp"

namespace fetchpool::probe {
    std::optional<bool> ProbeCache::lookup(const std::string& url) const {
        auto it = results_.find(url);
        if (it == results_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool probe(ProbeCache& cache, const std::string& url, const ProbeOptions& options) {
        if (options.cached_) {
            if (auto hit = cache.lookup(url)) {
                return *hit;
            }
        }

        http::Transfer transfer;
        transfer.set_url(url);
        transfer.set_timeout(options.timeout_s_);
        transfer.set_follow_location(true);
        transfer.set_opt(CURLOPT_FAILONERROR, 1L);
        transfer.set_opt(CURLOPT_NOBODY, 1L);
        transfer.execute();

        const long status = transfer.status();
        const bool reachable = !transfer.is_error() && status >= constants::HTTP_OK_MIN && status < constants::HTTP_OK_MAX;
        if (options.cached_) {
            cache.store(url, reachable);
        }
        log::logger()->debug("probe {} -> {} ({})", url, reachable, status);

        if (!reachable && options.throw_on_error_) {
            if (status >= constants::HTTP_OK_MAX) {
                throw http_error::HttpError(status, url, "", transfer.error_message());
            }
            throw http_error::TransportError(transfer.error_state().transport_code_, url, transfer.error_message());
        }
        return reachable;
    }
}  // namespace fetchpool::probe
