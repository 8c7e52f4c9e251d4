//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_METADATA_EXTRACTOR_HPP
#define REPORTCONTENTPIPELINE_METADATA_EXTRACTOR_HPP

/**
 * @file metadata_extractor.hpp
 * @brief Splitting a report into its YAML metadata block and body.
 *
 * A metadata block is YAML enclosed by two "---" delimiter lines at the top
 * of the document:
 *
 * @code
 *     ---
 *     title: EV Charging Market Analysis
 *     date: 2025-03-14
 *     id: MR-20250314-101500
 *     ---
 *     # EV Charging Market Analysis
 *     ...
 * @endcode
 *
 * Two grammars are offered and callers pick one per entry point:
 * - extract_frontmatter(): the block is mandatory. A missing opening or
 *   closing delimiter is an error.
 * - extract_permissive(): a document without a complete block is returned
 *   unchanged as the body, with empty metadata.
 *
 * When a block is present both grammars apply the same validation: the YAML
 * must parse to a mapping and must define "title" and "date". Extraction
 * yields either a complete metadata map or an error, never a partial map.
 */

#include "rcp/result.hpp"
#include "rcp/error.hpp"
#include "rcp/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rcp::metadata {

    /**
     * Extracts a mandatory metadata block.
     *
     * Leading whitespace is skipped. The first line must be "---" (trailing
     * blanks tolerated) and a later line equal to "---" closes the block.
     *
     * @return MissingFrontmatter, UnterminatedFrontmatter, MetadataParseError,
     *         MissingRequiredField, TooLarge, or the metadata and the body that
     *         follows the closing delimiter line.
     */
    [[nodiscard]] Result<ExtractedDocument> extract_frontmatter(
        std::string_view document,
        std::size_t max_bytes = kMaxProcessBytes
    );

    /**
     * Extracts an optional metadata block.
     *
     * Without a complete block the result is empty metadata and the original
     * document, byte for byte. A block that is present must still be valid.
     */
    [[nodiscard]] Result<ExtractedDocument> extract_permissive(
        std::string_view document,
        std::size_t max_bytes = kMaxProcessBytes
    );

    /**
     * Parses the YAML between the delimiters and checks required fields.
     *
     * Scalars are copied verbatim, null values become "", nested sequences
     * and maps are kept as flow-style YAML text.
     */
    [[nodiscard]] Result<ReportMetadata> parse_metadata_block(std::string_view block);

    /**
     * Required keys absent from metadata, in declaration order.
     */
    [[nodiscard]] std::vector<std::string> missing_required_fields(const ReportMetadata& metadata);

    /**
     * Builds "---\n<yaml>\n---\n<body>", the inverse of extract_frontmatter().
     */
    [[nodiscard]] std::string serialize_frontmatter(const ReportMetadata& metadata, std::string_view body);

}  // namespace rcp::metadata

#endif //REPORTCONTENTPIPELINE_METADATA_EXTRACTOR_HPP
