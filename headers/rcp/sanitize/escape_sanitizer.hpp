//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_ESCAPE_SANITIZER_HPP
#define REPORTCONTENTPIPELINE_ESCAPE_SANITIZER_HPP

/**
 * @file escape_sanitizer.hpp
 * @brief Removal of terminal control sequences from report text.
 *
 * Generated report text often carries ANSI styling that leaked out of a
 * terminal session, either as real ESC bytes or as their printable spelling
 * ("ESC[1m", "^[[0m") after the control byte was lost. Everything that looks
 * like a control sequence is stripped before text reaches the renderer or a
 * terminal. Removal errs on the side of stripping too much.
 *
 * Passes, each applied to the output of the previous one:
 * 1. ESC '[' parameters final-letter (CSI)
 * 2. the same grammar spelled as literal "ESC[" or "^[["
 * 3. a fixed list of formatting tokens (reset, bold, compound colors)
 * 4. catch-all: introducer, optional '[' '(' ')', parameters, terminator
 * 5. stray C0 control bytes other than tab, newline and carriage return
 *
 * Passes 1, 2 and 4 are linear scans with no limit on parameter length.
 *
 * The pass list is repeated until the text stops changing, which makes
 * sanitize() idempotent.
 */

#include "rcp/result.hpp"
#include "rcp/error.hpp"
#include "rcp/types.hpp"

#include <string>
#include <string_view>

namespace rcp::sanitize {

    /**
     * Returns text with all control-sequence-shaped content removed.
     * Never fails.
     */
    [[nodiscard]] std::string sanitize(std::string_view text);

    /**
     * True if sanitize() would change text.
     */
    [[nodiscard]] bool contains_escape_sequences(std::string_view text);

    /**
     * Rewrites a file with its escape sequences removed.
     *
     * The file is only rewritten (atomically) when something was removed.
     *
     * @param path File to clean.
     * @param max_bytes Size ceiling for the file.
     * @return true if the file changed, false if it was already clean.
     */
    Result<bool> sanitize_file(const fs::path& path, std::uintmax_t max_bytes = kMaxReadBytes);

}  // namespace rcp::sanitize

#endif //REPORTCONTENTPIPELINE_ESCAPE_SANITIZER_HPP
