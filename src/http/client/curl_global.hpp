//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef FETCHPOOL_CURL_GLOBAL_HPP
#define FETCHPOOL_CURL_GLOBAL_HPP

#include <string>

namespace fetchpool::client {

    // Must outlive every Transfer and TransferPool.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] static std::string version();
    };

}  // namespace fetchpool::client

#endif
