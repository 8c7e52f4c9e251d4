//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/export/pdf_exporter.hpp"
#include "rcp/format/report_formatter.hpp"
#include "rcp/process/process_runner.hpp"
#include "rcp/sanitize/escape_sanitizer.hpp"
#include "rcp/utils/file_utils.hpp"
#include "rcp/utils/string_utils.hpp"
#include "rcp/logging.hpp"

#include <sstream>

namespace rcp::exporters
{
    PdfExporter::PdfExporter()
        : PdfExporter(ExportConfig{}) {}

    PdfExporter::PdfExporter(ExportConfig config, render::Renderer renderer)
        : config_(std::move(config))
        , renderer_(std::move(renderer)) {}

    PdfExporter::PdfExporter(const Config& config)
        : PdfExporter(config.export_, render::Renderer(render::render_options_from(config))) {}

    std::string PdfExporter::build_document(std::string_view html_fragment, std::string_view title) {
        std::ostringstream html;
        html << R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <title>)HTML" << string_utils::escape_html(title) << R"HTML(</title>
    <style>
        @page { size: A4; margin: 20mm; }
        body {
            font-family: "DejaVu Serif", Georgia, serif;
            font-size: 11pt;
            line-height: 1.5;
            color: #1a1a1a;
        }
        h1, h2, h3, h4 {
            font-family: "DejaVu Sans", Helvetica, Arial, sans-serif;
            color: #0b2545;
            page-break-after: avoid;
        }
        h1 { font-size: 22pt; border-bottom: 2px solid #0b2545; padding-bottom: 4pt; }
        h2 { font-size: 16pt; margin-top: 18pt; }
        h3 { font-size: 13pt; }
        p, li { orphans: 3; widows: 3; }
        table { border-collapse: collapse; width: 100%; margin: 10pt 0; page-break-inside: avoid; }
        th, td { border: 1px solid #b0b7c3; padding: 4pt 6pt; text-align: left; vertical-align: top; }
        th { background: #e8edf3; }
        pre, code { font-family: "DejaVu Sans Mono", Menlo, monospace; font-size: 9pt; }
        pre { background: #f4f6f8; padding: 6pt; white-space: pre-wrap; page-break-inside: avoid; }
        blockquote { border-left: 3px solid #b0b7c3; margin-left: 0; padding-left: 10pt; color: #444; }
        hr { border: none; border-top: 1px solid #b0b7c3; margin: 14pt 0; }
        .report-metadata { color: #555; font-size: 9pt; margin-bottom: 12pt; }
        .confidentiality { font-weight: bold; text-transform: uppercase; letter-spacing: 1px; }
    </style>
</head>
<body>
)HTML" << html_fragment << R"HTML(
</body>
</html>
)HTML";
        return html.str();
    }

    std::vector<std::string> PdfExporter::converter_command(const fs::path& html, const fs::path& destination) const {
        return {
            config_.converter,
            "--page-size", config_.page_size,
            "--margin-top", config_.margin,
            "--margin-bottom", config_.margin,
            "--margin-left", config_.margin,
            "--margin-right", config_.margin,
            "--encoding", config_.encoding,
            html.string(),
            destination.string(),
        };
    }

    Result<fs::path> PdfExporter::export_pdf(std::string_view body, const fs::path& destination,
                                             std::string_view title) const {
        const std::string cleaned = sanitize::sanitize(body);
        if (string_utils::trim(cleaned).empty()) {
            return Result<fs::path>::failure(Error::empty_input("Nothing to export"));
        }

        auto fragment = renderer_.render(cleaned);
        if (fragment.is_err()) {
            return Result<fs::path>::failure(fragment.error());
        }

        const std::string document_title = title.empty()
            ? format::scrape_header_metadata(cleaned).title
            : std::string(title);

        const fs::path& temp_html = config_.temp_html;
        if (auto written = file_utils::write_file(temp_html, build_document(fragment.value(), document_title));
            written.is_err()) {
            return Result<fs::path>::failure(written.error());
        }

        const auto remove_temp = [&temp_html] {
            if (auto cleanup = file_utils::remove_if_exists(temp_html); cleanup.is_err()) {
                logging::logger()->warn("Could not remove {}: {}", temp_html.string(), cleanup.error().to_string());
            }
        };

        if (!process::probe(config_.converter)) {
            remove_temp();
            return Result<fs::path>::failure(
                Error(ErrorCode::ToolNotFound, "PDF converter is not available", config_.converter)
            );
        }

        auto run = process::run(converter_command(temp_html, destination));
        remove_temp();

        if (run.is_err()) {
            return Result<fs::path>::failure(run.error());
        }

        if (!run.value().success()) {
            return Result<fs::path>::failure(
                Error(ErrorCode::ToolFailed,
                      "PDF converter exited with status " + std::to_string(run.value().exit_code),
                      run.value().stderr_output)
            );
        }

        std::error_code ec;
        if (!fs::exists(destination, ec)) {
            return Result<fs::path>::failure(
                Error(ErrorCode::OutputMissing, "PDF converter reported success but wrote no file",
                      destination.string())
            );
        }

        logging::logger()->info("Exported PDF to {}", destination.string());
        return Result<fs::path>::success(destination);
    }

}  // namespace rcp::exporters
