//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/metadata/metadata_extractor.hpp"
#include "rcp/utils/string_utils.hpp"
#include "rcp/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>

namespace rcp::metadata
{
    namespace {

        enum class BlockStatus {
            Found,
            NoOpening,
            Unterminated
        };

        /**
         * Location of a delimited block inside a document.
         */
        struct BlockSpan {
            BlockStatus status = BlockStatus::NoOpening;
            std::string_view yaml;
            std::string_view body;
        };

        bool is_delimiter_line(std::string_view line) {
            return string_utils::trim_right(line) == kMetadataDelimiter;
        }

        BlockSpan locate_block(std::string_view document) {
            BlockSpan span;

            const auto start = document.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) {
                return span;
            }

            const auto opening_end = document.find('\n', start);
            const auto opening = document.substr(
                start, opening_end == std::string_view::npos ? std::string_view::npos : opening_end - start);
            if (!is_delimiter_line(opening)) {
                return span;
            }

            span.status = BlockStatus::Unterminated;
            if (opening_end == std::string_view::npos) {
                return span;
            }

            const std::size_t block_start = opening_end + 1;
            std::size_t line_start = block_start;
            while (line_start <= document.size()) {
                const auto line_end = document.find('\n', line_start);
                const auto line = document.substr(
                    line_start,
                    line_end == std::string_view::npos ? std::string_view::npos : line_end - line_start);

                if (is_delimiter_line(line)) {
                    span.status = BlockStatus::Found;
                    span.yaml = document.substr(block_start, line_start - block_start);
                    span.body = line_end == std::string_view::npos
                        ? std::string_view{}
                        : document.substr(line_end + 1);
                    return span;
                }

                if (line_end == std::string_view::npos) {
                    break;
                }
                line_start = line_end + 1;
            }

            return span;
        }

        std::string node_to_string(const YAML::Node& node) {
            if (node.IsNull()) {
                return {};
            }
            if (node.IsScalar()) {
                return node.Scalar();
            }
            YAML::Emitter out;
            out << YAML::Flow << node;
            return out.c_str();
        }

        std::optional<Error> check_size(std::string_view document, const std::size_t max_bytes) {
            if (document.size() > max_bytes) {
                return Error::too_large(
                    "Document of " + std::to_string(document.size()) +
                    " bytes exceeds limit of " + std::to_string(max_bytes) + " bytes",
                    "metadata extraction"
                );
            }
            return std::nullopt;
        }

        Result<ExtractedDocument> build_document(const BlockSpan& span) {
            auto metadata = parse_metadata_block(span.yaml);
            if (metadata.is_err()) {
                return Result<ExtractedDocument>::failure(metadata.error());
            }
            return Result<ExtractedDocument>::success(
                ExtractedDocument{std::move(metadata).value(), std::string(span.body)}
            );
        }

    }  // namespace

    Result<ReportMetadata> parse_metadata_block(std::string_view block) {
        YAML::Node root;
        try {
            root = YAML::Load(std::string(block));
        } catch (const YAML::Exception& e) {
            return Result<ReportMetadata>::failure(
                Error(ErrorCode::MetadataParseError, "Malformed metadata block", e.what())
            );
        }

        ReportMetadata metadata;
        if (root.IsDefined() && !root.IsNull()) {
            if (!root.IsMap()) {
                return Result<ReportMetadata>::failure(
                    Error(ErrorCode::MetadataParseError, "Metadata block must be a key-value mapping")
                );
            }

            for (const auto& entry : root) {
                if (!entry.first.IsScalar()) {
                    return Result<ReportMetadata>::failure(
                        Error(ErrorCode::MetadataParseError, "Metadata keys must be plain strings")
                    );
                }
                metadata[entry.first.Scalar()] = node_to_string(entry.second);
            }
        }

        if (const auto missing = missing_required_fields(metadata); !missing.empty()) {
            return Result<ReportMetadata>::failure(
                Error(ErrorCode::MissingRequiredField,
                      "Metadata is missing required field(s)",
                      string_utils::join(missing, ", "))
            );
        }

        return Result<ReportMetadata>::success(std::move(metadata));
    }

    std::vector<std::string> missing_required_fields(const ReportMetadata& metadata) {
        std::vector<std::string> missing;
        for (const auto key : kRequiredMetadataKeys) {
            if (metadata.find(std::string(key)) == metadata.end()) {
                missing.emplace_back(key);
            }
        }
        return missing;
    }

    Result<ExtractedDocument> extract_frontmatter(std::string_view document, const std::size_t max_bytes) {
        if (auto too_large = check_size(document, max_bytes)) {
            return Result<ExtractedDocument>::failure(*too_large);
        }

        const auto span = locate_block(document);
        switch (span.status) {
            case BlockStatus::NoOpening:
                return Result<ExtractedDocument>::failure(
                    Error(ErrorCode::MissingFrontmatter, "Document does not start with a '---' metadata block")
                );
            case BlockStatus::Unterminated:
                return Result<ExtractedDocument>::failure(
                    Error(ErrorCode::UnterminatedFrontmatter, "Metadata block has no closing '---' line")
                );
            case BlockStatus::Found:
                break;
        }

        return build_document(span);
    }

    Result<ExtractedDocument> extract_permissive(std::string_view document, const std::size_t max_bytes) {
        if (auto too_large = check_size(document, max_bytes)) {
            return Result<ExtractedDocument>::failure(*too_large);
        }

        const auto span = locate_block(document);
        if (span.status != BlockStatus::Found) {
            logging::logger()->debug("No metadata block found; using whole document as body");
            return Result<ExtractedDocument>::success(
                ExtractedDocument{ReportMetadata{}, std::string(document)}
            );
        }

        return build_document(span);
    }

    std::string serialize_frontmatter(const ReportMetadata& metadata, std::string_view body) {
        YAML::Emitter out;
        out << YAML::BeginMap;
        for (const auto& [key, value] : metadata) {
            out << YAML::Key << key << YAML::Value << value;
        }
        out << YAML::EndMap;

        std::string result;
        result.reserve(body.size() + 64);
        result += kMetadataDelimiter;
        result += '\n';
        result += out.c_str();
        result += '\n';
        result += kMetadataDelimiter;
        result += '\n';
        result += body;
        return result;
    }

}  // namespace rcp::metadata
