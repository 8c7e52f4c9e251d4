//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_REPORT_FORMATTER_HPP
#define REPORTCONTENTPIPELINE_REPORT_FORMATTER_HPP

/**
 * @file report_formatter.hpp
 * @brief Report headers and file naming.
 *
 * Two header styles exist. The styled header is plain markdown with an HTML
 * metadata block and is read back heuristically by scrape_header_metadata().
 * The frontmatter header carries the same facts as a YAML block that
 * metadata::extract_frontmatter() accepts.
 */

#include "rcp/types.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace rcp::format {

    using Clock = std::chrono::system_clock;

    /**
     * Fields recovered from a styled header. Absent fields hold the
     * "Unknown ..." defaults.
     */
    struct HeaderMetadata {
        std::string title = "Unknown Title";
        std::string date = "Unknown Date";
        std::string id = "Unknown ID";
    };

    /**
     * "MR-YYYYMMDD-HHMMSS" in local time.
     */
    std::string report_id(Clock::time_point now);

    /**
     * Prepends the styled header:
     * @code
     *     # <title> Market Analysis
     *
     *     <div class="report-metadata">
     *     <p class="report-date">Generated on: March 14, 2025</p>
     *     <p class="report-id">Report ID: MR-20250314-101500</p>
     *     <p class="confidentiality">CONFIDENTIAL DOCUMENT</p>
     *     </div>
     *
     *     ---
     *
     *     <content>
     * @endcode
     */
    std::string format_report(std::string_view content, std::string_view title,
                              Clock::time_point now = Clock::now());

    /**
     * Prepends a YAML block (id, title, date) followed by the heading and a
     * "Generated on" line.
     */
    std::string format_report_frontmatter(std::string_view content, std::string_view title,
                                          Clock::time_point now = Clock::now());

    /**
     * Reads title, date and id back from a styled header. Never fails.
     */
    HeaderMetadata scrape_header_metadata(std::string_view content);

    /**
     * "<topic>_YYYYMMDD_HHMMSS<extension>" with the topic lowercased and
     * spaces and slashes replaced by underscores.
     */
    std::string report_file_name(std::string_view topic, Clock::time_point now = Clock::now(),
                                 std::string_view extension = ".md");

}  // namespace rcp::format

#endif //REPORTCONTENTPIPELINE_REPORT_FORMATTER_HPP
