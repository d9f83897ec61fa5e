#include <cstdlib>
#include <iostream>
#include <string>

#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/http/pool/transfer_pool.hpp"
#include "src/log/logger.hpp"
#include "src/utils/constants.hpp"
#include "src/utils/string_utils.hpp"

int main() {
    try {
        //
        // Collect
        //

        const char* concurrency_env = std::getenv("FETCHPOOL_CONCURRENCY");
        const char* rate_limit_env = std::getenv("FETCHPOOL_RATE_LIMIT");
        const char* proxies_env = std::getenv("FETCHPOOL_PROXIES");
        const size_t concurrency =
            concurrency_env != nullptr ? std::strtoul(concurrency_env, nullptr, constants::BASE_10) : constants::DEFAULT_CONCURRENCY;

        fetchpool::client::CurlGlobal curl_global;

        fetchpool::http::PoolOptions options{.concurrency_ = concurrency};
        if (rate_limit_env != nullptr) {
            options.rate_limit_ = rate_limit_env;
        }
        fetchpool::http::TransferPool pool(options);
        pool.set_follow_location(true);
        pool.set_retry(1);
        if (proxies_env != nullptr) {
            pool.set_proxies(string_utils::split_comma_delimited_string(proxies_env));
        }

        std::string line;
        while (std::getline(std::cin, line)) {
            line = string_utils::trim(line);
            if (!line.empty()) {
                pool.add_get(line);
            }
        }

        //
        // Run
        //

        pool.start();

        //
        // Report
        //

        for (const auto& [id, transfer] : pool.finished()) {
            std::cout << id << '\t' << transfer->status() << '\t' << transfer->response().raw_body_.size() << '\t' << transfer->effective_url();
            if (transfer->is_error()) {
                std::cout << '\t' << transfer->error_message();
            }
            std::cout << '\n';
        }
    } catch (const fetchpool::http_error::FormatError& e) {
        std::cerr << "Invalid FETCHPOOL_RATE_LIMIT: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        fetchpool::log::logger()->critical("fatal: {}", e.what());
        return 1;
    }

    return 0;
};
