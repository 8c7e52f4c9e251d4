//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_RENDERER_HPP
#define REPORTCONTENTPIPELINE_RENDERER_HPP

/**
 * @file renderer.hpp
 * @brief Markdown to HTML conversion, isolated from engine faults.
 *
 * The renderer sanitizes its input, validates it, and hands it to a
 * conversion engine running in a separate execution context. An engine
 * that throws (thread isolation) or crashes (process isolation) is reported
 * as RenderPanic instead of taking the caller down.
 *
 * Usage:
 * @code
 *     render::Renderer renderer({.isolation = IsolationMode::Process});
 *     auto html = renderer.render("# Q3 Outlook\n\nRevenue grew 8%.");
 *     if (html.is_ok()) {
 *         std::cout << html.value();
 *     }
 * @endcode
 */

#include "rcp/result.hpp"
#include "rcp/error.hpp"
#include "rcp/types.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace rcp {
    struct Config;
}

namespace rcp::render {

    /**
     * Converts markdown to an HTML fragment. May throw; the renderer
     * contains whatever happens inside.
     */
    using ConversionEngine = std::function<std::string(std::string_view markdown)>;

    struct RenderOptions {
        IsolationMode isolation = IsolationMode::Thread;
        bool superscript = true;
        std::size_t max_bytes = kMaxProcessBytes;
    };

    /**
     * Options from the [render] and [limits] configuration sections.
     */
    RenderOptions render_options_from(const Config& config);

    /**
     * Default engine: md4c-html with tables, strikethrough, permissive
     * autolinks and task lists. Raw HTML passes through.
     *
     * @throws std::runtime_error if md4c reports a parse failure.
     */
    std::string md4c_convert(std::string_view markdown);

    /**
     * Rewrites ^text^ as <sup>text</sup>, leaving code spans and fenced
     * code blocks alone. text must be non-empty and contain no whitespace.
     */
    std::string apply_superscript(std::string_view markdown);

    class Renderer {
    public:
        Renderer();
        explicit Renderer(RenderOptions options, ConversionEngine engine = md4c_convert);

        /**
         * Renders a markdown body to HTML.
         *
         * @return EmptyInput, TooLarge, RenderPanic, EmptyOutput, or non-empty HTML.
         */
        [[nodiscard]] Result<std::string> render(std::string_view body) const;

        [[nodiscard]] const RenderOptions& options() const noexcept { return options_; }

    private:
        [[nodiscard]] Result<std::string> convert_in_thread(const std::string& markdown) const;
        [[nodiscard]] Result<std::string> convert_in_process(const std::string& markdown) const;

        RenderOptions options_;
        ConversionEngine engine_;
    };

}  // namespace rcp::render

#endif //REPORTCONTENTPIPELINE_RENDERER_HPP
