//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace rcp::logging
{
    std::shared_ptr<spdlog::logger> logger() {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }

        static std::mutex creation_mutex;
        std::lock_guard lock(creation_mutex);
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }

        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_level(spdlog::level::info);
        return created;
    }

    Result<void> set_level(const std::string& level) {
        const auto parsed = spdlog::level::from_str(level);

        // from_str maps unknown names to off; only accept off when asked for.
        if (parsed == spdlog::level::off && level != "off") {
            return Result<void>::failure(
                Error::invalid_argument("Unknown log level", level)
            );
        }

        logger()->set_level(parsed);
        return Result<void>::success();
    }

}  // namespace rcp::logging
