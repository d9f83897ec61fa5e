//
// Created by Daniel Griffiths on 11/1/25.
//

#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace fetchpool::http_error {
    TransportError::TransportError(long c, std::string u, const std::string &msg) : std::runtime_error(msg), code_(c), url_(std::move(u)) {}

    HttpError::HttpError(long s, std::string u,
                         std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}

    OptionError::OptionError(long o, std::string name, const std::string &msg)
        : std::invalid_argument(msg), option_(o), option_name_(std::move(name)) {}

    SerializationError::SerializationError(const std::string &msg) : std::runtime_error(msg) {}

    FormatError::FormatError(std::string in, const std::string &msg) : std::invalid_argument(msg), input_(std::move(in)) {}

    ResolutionError::ResolutionError(std::string u, const std::string &msg) : std::invalid_argument(msg), url_(std::move(u)) {}

    MultiError::MultiError(int c, const std::string &msg) : std::runtime_error(msg), code_(c) {}
};  // namespace fetchpool::http_error
