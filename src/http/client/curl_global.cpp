//
// Created by Daniel Griffiths on 11/1/25.
//

#include "curl_global.hpp"

#include <curl/curl.h>

#include <stdexcept>

#include "../../log/logger.hpp"

namespace fetchpool::client {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
        }
        log::logger()->debug("libcurl {} initialized", version());
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

    std::string CurlGlobal::version() {
        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        return info != nullptr && info->version != nullptr ? std::string{info->version} : std::string{};
    }

}  // namespace fetchpool::client
