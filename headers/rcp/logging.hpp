//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_LOGGING_HPP
#define REPORTCONTENTPIPELINE_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Library logger.
 *
 * All pipeline components log through a single spdlog logger named "rcp"
 * that writes to stderr. Hosts can reconfigure it through the spdlog
 * registry or with set_level().
 */

#include "rcp/result.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace rcp::logging {

    inline constexpr auto LOGGER_NAME = "rcp";

    /**
     * Returns the "rcp" logger, creating it on first use.
     */
    std::shared_ptr<spdlog::logger> logger();

    /**
     * Sets the logger level from a name: trace, debug, info, warn, error,
     * critical or off.
     *
     * @return InvalidArgument for unknown names.
     */
    Result<void> set_level(const std::string& level);

}  // namespace rcp::logging

#endif //REPORTCONTENTPIPELINE_LOGGING_HPP
