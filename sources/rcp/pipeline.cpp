//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/pipeline.hpp"
#include "rcp/export/pdf_exporter.hpp"
#include "rcp/metadata/metadata_extractor.hpp"
#include "rcp/process/process_runner.hpp"
#include "rcp/sanitize/escape_sanitizer.hpp"
#include "rcp/logging.hpp"

namespace rcp::pipeline
{
    std::string sanitize(std::string_view text) {
        return sanitize::sanitize(text);
    }

    Result<ExtractedDocument> extract_frontmatter(std::string_view document) {
        return metadata::extract_frontmatter(document);
    }

    Result<ExtractedDocument> extract_permissive(std::string_view document) {
        return metadata::extract_permissive(document);
    }

    Result<std::string> render(std::string_view body, const render::RenderOptions& options) {
        return render::Renderer(options).render(body);
    }

    Result<ProcessedDocument> process_document(std::string_view raw, const ProcessOptions& options) {
        if (raw.size() > options.render.max_bytes) {
            return Result<ProcessedDocument>::failure(
                Error::too_large("Document of " + std::to_string(raw.size()) + " bytes exceeds limit of " +
                                 std::to_string(options.render.max_bytes) + " bytes", "process")
            );
        }

        const std::string cleaned = sanitize::sanitize(raw);
        logging::logger()->debug("Sanitized document: {} -> {} bytes", raw.size(), cleaned.size());

        auto extracted = options.policy == MetadataPolicy::Frontmatter
            ? metadata::extract_frontmatter(cleaned, options.render.max_bytes)
            : metadata::extract_permissive(cleaned, options.render.max_bytes);
        if (extracted.is_err()) {
            return Result<ProcessedDocument>::failure(extracted.error());
        }

        auto html = render::Renderer(options.render).render(extracted.value().body);
        if (html.is_err()) {
            return Result<ProcessedDocument>::failure(html.error());
        }

        auto& doc = extracted.value();
        return Result<ProcessedDocument>::success(
            ProcessedDocument{std::move(doc.metadata), std::move(doc.body), std::move(html).value()}
        );
    }

    Result<fs::path> export_pdf(std::string_view body, const fs::path& destination, const Config& config) {
        return exporters::PdfExporter(config).export_pdf(body, destination);
    }

    Result<void> open_with_default_app(const fs::path& path) {
        return process::open_with_default_app(path);
    }

    Result<void> apply_config(const Config& config) {
        if (auto level = logging::set_level(config.log_level); level.is_err()) {
            return Result<void>::failure(
                Error::config_error(level.error().message(), "general.log_level = " + config.log_level)
            );
        }
        return Result<void>::success();
    }

}  // namespace rcp::pipeline
