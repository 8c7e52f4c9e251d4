//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_PIPELINE_HPP
#define REPORTCONTENTPIPELINE_PIPELINE_HPP

/**
 * @file pipeline.hpp
 * @brief Stateless entry points over the pipeline stages.
 *
 * Each function builds whatever it needs from its arguments and keeps no
 * state between calls. Hosts that need persistence or progress reporting
 * own a ReportStore or ProgressTracker themselves.
 *
 * Usage:
 * @code
 *     auto doc = rcp::pipeline::process_document(raw);
 *     if (doc.is_ok()) {
 *         store.save(name, doc.value().body);
 *     }
 * @endcode
 */

#include "rcp/result.hpp"
#include "rcp/error.hpp"
#include "rcp/types.hpp"
#include "rcp/config.hpp"
#include "rcp/render/renderer.hpp"

#include <string>
#include <string_view>

namespace rcp::pipeline {

    /**
     * Which metadata grammar process_document() applies.
     */
    enum class MetadataPolicy {
        Frontmatter,   ///< Block required
        Permissive     ///< Block optional
    };

    struct ProcessOptions {
        MetadataPolicy policy = MetadataPolicy::Permissive;
        render::RenderOptions render;
    };

    /**
     * Output of the full text path: validated metadata, the sanitized body
     * and its HTML rendering.
     */
    struct ProcessedDocument {
        ReportMetadata metadata;
        std::string body;
        std::string html;
    };

    [[nodiscard]] std::string sanitize(std::string_view text);

    [[nodiscard]] Result<ExtractedDocument> extract_frontmatter(std::string_view document);

    [[nodiscard]] Result<ExtractedDocument> extract_permissive(std::string_view document);

    [[nodiscard]] Result<std::string> render(std::string_view body,
                                             const render::RenderOptions& options = {});

    /**
     * Sanitize, extract metadata, render the body.
     */
    [[nodiscard]] Result<ProcessedDocument> process_document(std::string_view raw,
                                                             const ProcessOptions& options = {});

    Result<fs::path> export_pdf(std::string_view body, const fs::path& destination,
                                const Config& config = Config{});

    Result<void> open_with_default_app(const fs::path& path);

    /**
     * Applies process-wide settings from config (currently the log level).
     */
    Result<void> apply_config(const Config& config);

}  // namespace rcp::pipeline

#endif //REPORTCONTENTPIPELINE_PIPELINE_HPP
