//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_PDF_EXPORTER_HPP
#define REPORTCONTENTPIPELINE_PDF_EXPORTER_HPP

/**
 * @file pdf_exporter.hpp
 * @brief PDF export through an external HTML-to-PDF converter.
 *
 * The body is rendered to HTML, wrapped in a print stylesheet, written to a
 * scratch file and handed to the converter (wkhtmltopdf by default):
 *
 * @code
 *     wkhtmltopdf --page-size A4 --margin-top 20mm --margin-bottom 20mm \
 *                 --margin-left 20mm --margin-right 20mm --encoding UTF-8 \
 *                 /tmp/rcp_export.html report.pdf
 * @endcode
 *
 * The converter runs synchronously with no timeout.
 */

#include "rcp/result.hpp"
#include "rcp/error.hpp"
#include "rcp/types.hpp"
#include "rcp/config.hpp"
#include "rcp/render/renderer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rcp::exporters {

    class PdfExporter {
    public:
        PdfExporter();
        explicit PdfExporter(ExportConfig config, render::Renderer renderer = render::Renderer());

        /**
         * Uses the [export] section and a renderer built from [render] and [limits].
         */
        explicit PdfExporter(const Config& config);

        /**
         * Exports a markdown body as a PDF at destination.
         *
         * @param title Document title; when empty the first heading of the
         *              body is used.
         * @return EmptyInput, TooLarge, RenderPanic, IoError, ToolNotFound,
         *         ToolFailed (context holds the converter's stderr),
         *         OutputMissing, or destination.
         */
        Result<fs::path> export_pdf(std::string_view body, const fs::path& destination,
                                    std::string_view title = {}) const;

        /**
         * Complete print-ready HTML document around a rendered fragment.
         */
        [[nodiscard]] static std::string build_document(std::string_view html_fragment, std::string_view title);

        /**
         * Full converter command line for the given input and output.
         */
        [[nodiscard]] std::vector<std::string> converter_command(const fs::path& html, const fs::path& destination) const;

        [[nodiscard]] const ExportConfig& config() const noexcept { return config_; }

    private:
        ExportConfig config_;
        render::Renderer renderer_;
    };

}  // namespace rcp::exporters

#endif //REPORTCONTENTPIPELINE_PDF_EXPORTER_HPP
