//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_RCP_HPP
#define REPORTCONTENTPIPELINE_RCP_HPP

/**
 * @file rcp.hpp
 * @brief Main header for the Report Content Pipeline library.
 *
 * Pulls in the public API. Include individual headers for narrower
 * dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "pipeline.hpp"
#include "progress/progress_tracker.hpp"
#include "storage/report_store.hpp"
#include "format/report_formatter.hpp"

#endif //REPORTCONTENTPIPELINE_RCP_HPP
