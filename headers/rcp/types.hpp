//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_TYPES_HPP
#define REPORTCONTENTPIPELINE_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures shared by the pipeline stages.
 *
 * - Size ceilings for processed documents and stored reports
 * - ReportMetadata / ExtractedDocument produced by metadata extraction
 * - ProgressSnapshot published by the progress tracker
 */

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace rcp {

    namespace fs = std::filesystem;

    using Duration = std::chrono::nanoseconds;

    // ============================================================================
    // Limits
    // ============================================================================

    /// Largest document accepted by render, extract and export (10 MiB).
    inline constexpr std::size_t kMaxProcessBytes = 10u * 1024u * 1024u;

    /// Largest stored report the store will read back (50 MiB).
    inline constexpr std::uintmax_t kMaxReadBytes = 50u * 1024u * 1024u;

    /// Delimiter line that opens and closes a metadata block.
    inline constexpr std::string_view kMetadataDelimiter = "---";

    /// Keys every valid metadata block must define.
    inline constexpr std::array<std::string_view, 2> kRequiredMetadataKeys = {"title", "date"};

    /**
     * Execution context used to contain faults in the conversion engine.
     */
    enum class IsolationMode {
        Thread,   ///< Dedicated worker thread; exceptions are captured at join
        Process   ///< Forked child; crashes and signals are captured at waitpid
    };

    // ============================================================================
    // Metadata
    // ============================================================================

    /**
     * Field name to value. Extra keys pass through untouched.
     */
    using ReportMetadata = std::map<std::string, std::string>;

    /**
     * A document split into its metadata block and the remaining body.
     *
     * metadata is empty only when the permissive grammar found no block.
     */
    struct ExtractedDocument {
        ReportMetadata metadata;
        std::string body;
    };

    // ============================================================================
    // Progress
    // ============================================================================

    /**
     * Consistent copy of the tracker state at one instant.
     */
    struct ProgressSnapshot {
        float percentage = 0.0f;
        std::string stage;
        std::string agent;
        std::string activity;
        Duration elapsed = Duration::zero();

        [[nodiscard]] double elapsed_seconds() const {
            return std::chrono::duration<double>(elapsed).count();
        }
    };

}  // namespace rcp

#endif //REPORTCONTENTPIPELINE_TYPES_HPP
