//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef FETCHPOOL_HTTP_ERROR_HPP
#define FETCHPOOL_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fetchpool::http_error {
    const size_t BODY_PREVIEW_LENGTH = 512;

    // Transport-layer failure (DNS, TLS, connect, timeout). code_ is the CURLcode.
    struct TransportError : public std::runtime_error {
        long code_;
        std::string url_;
        explicit TransportError(long c, std::string u, const std::string &msg);
    };

    struct HttpError : public std::runtime_error {
        long status_;
        std::string url_;
        std::string body_preview_;
        explicit HttpError(long s, std::string u, std::string preview, const std::string &msg);
    };

    struct OptionError : public std::invalid_argument {
        long option_;
        std::string option_name_;
        explicit OptionError(long o, std::string name, const std::string &msg);
    };

    struct SerializationError : public std::runtime_error {
        explicit SerializationError(const std::string &msg);
    };

    struct FormatError : public std::invalid_argument {
        std::string input_;
        explicit FormatError(std::string in, const std::string &msg);
    };

    struct ResolutionError : public std::invalid_argument {
        std::string url_;
        explicit ResolutionError(std::string u, const std::string &msg);
    };

    // The multiplexer refused an add/remove/perform call.
    struct MultiError : public std::runtime_error {
        int code_;
        explicit MultiError(int c, const std::string &msg);
    };
}  // namespace fetchpool::http_error

#endif
