#ifndef FETCHPOOL_PROBE_HPP
#define FETCHPOOL_PROBE_HPP

#include <optional>
#include <string>
#include <unordered_map>

#include "../../utils/constants.hpp"

namespace fetchpool::probe {
    struct ProbeOptions {
        long timeout_s_ = constants::DEFAULT_PROBE_TIMEOUT_S;
        bool throw_on_error_ = false;
        bool cached_ = true;
    };

    // URL -> reachable. Owned by the caller, typically for the lifetime of the process.
    class ProbeCache {
       public:
        [[nodiscard]] std::optional<bool> lookup(const std::string& url) const;
        void store(const std::string& url, bool reachable) { results_[url] = reachable; }
        void clear() { results_.clear(); }
        [[nodiscard]] size_t size() const { return results_.size(); }

       private:
        std::unordered_map<std::string, bool> results_;
    };

    // Bodiless request following redirects; true when the final status is 2xx or 3xx.
    // With throw_on_error_ a failure raises HttpError (status >= 400) or TransportError.
    bool probe(ProbeCache& cache, const std::string& url, const ProbeOptions& options = {});
}  // namespace fetchpool::probe

#endif
