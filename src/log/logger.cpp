#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <string>

#include "../utils/constants.hpp"

namespace fetchpool::log {
    namespace {
        std::shared_ptr<spdlog::logger> create_logger() {
            auto existing = spdlog::get(constants::LOGGER_NAME);
            if (existing) {
                return existing;
            }

            auto created = spdlog::stderr_color_mt(constants::LOGGER_NAME);
            created->set_level(spdlog::level::warn);

            if (const char* level = std::getenv("FETCHPOOL_LOG_LEVEL"); level != nullptr) {
                created->set_level(spdlog::level::from_str(level));
            }
            return created;
        }
    }  // namespace

    std::shared_ptr<spdlog::logger> logger() {
        static std::shared_ptr<spdlog::logger> instance = create_logger();
        return instance;
    }

    void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }
}  // namespace fetchpool::log
