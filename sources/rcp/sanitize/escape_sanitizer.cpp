//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/sanitize/escape_sanitizer.hpp"
#include "rcp/utils/file_utils.hpp"
#include "rcp/logging.hpp"

#include <array>
#include <regex>

namespace rcp::sanitize
{
    namespace {

        constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::optimize;
        constexpr char kEsc = '\x1B';

        const std::regex& bare_token_pattern() {
            static const std::regex re(
                R"(\[(?:0|1|4|22|24|39|49)m|\[[0-9]{1,3}(?:;[0-9]{1,3}){1,4}m)", kRegexFlags);
            return re;
        }

        bool is_word_char(const char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
        }

        bool is_ascii_letter(const char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        }

        bool is_csi_parameter(const char c) {
            return (c >= '0' && c <= '9') || c == ';' || c == '?';
        }

        bool is_bracket(const char c) {
            return c == '[' || c == '(' || c == ')';
        }

        /// Final byte of a sequence: '@'-'Z', '\\', '^'-'~'.
        bool is_terminator(const char c) {
            return (c >= '@' && c <= 'Z') || c == '\\' || (c >= '^' && c <= '~');
        }

        /// Length of the introducer (ESC byte, "ESC", "^[") at pos, or 0.
        std::size_t introducer_at(const std::string_view text, const std::size_t pos) {
            if (text[pos] == kEsc) {
                return 1;
            }
            if (text.substr(pos, 3) == "ESC") {
                return 3;
            }
            if (text.substr(pos, 2) == "^[") {
                return 2;
            }
            return 0;
        }

        /// Removes introducer '[' parameters final-letter, any parameter count.
        std::string strip_csi(const std::string_view text) {
            std::string out;
            out.reserve(text.size());

            std::size_t i = 0;
            while (i < text.size()) {
                const std::size_t intro = introducer_at(text, i);
                if (intro != 0 && i + intro < text.size() && text[i + intro] == '[') {
                    std::size_t end = i + intro + 1;
                    while (end < text.size() && is_csi_parameter(text[end])) {
                        ++end;
                    }
                    if (end < text.size() && is_ascii_letter(text[end])) {
                        i = end + 1;
                        continue;
                    }
                }
                out.push_back(text[i]);
                ++i;
            }
            return out;
        }

        /**
         * Removes introducer, optional '[' '(' ')', any non-terminator run and
         * the terminator. The printable spellings need the bracket, and "ESC"
         * must start a word.
         */
        std::string strip_introduced(const std::string_view text) {
            std::string out;
            out.reserve(text.size());

            std::size_t i = 0;
            while (i < text.size()) {
                std::size_t body = 0;
                if (text[i] == kEsc) {
                    body = i + 1;
                } else if (const std::size_t intro = introducer_at(text, i);
                           intro != 0 && i + intro < text.size() && is_bracket(text[i + intro]) &&
                           (intro == 2 || i == 0 || !is_word_char(text[i - 1]))) {
                    body = i + intro + 1;
                }

                if (body == 0) {
                    out.push_back(text[i]);
                    ++i;
                    continue;
                }

                std::size_t end = body;
                while (end < text.size() && !is_terminator(text[end])) {
                    ++end;
                }
                if (end == text.size()) {
                    // No terminator remains, so no later introducer can close either.
                    out.append(text.substr(i));
                    return out;
                }
                i = end + 1;
            }
            return out;
        }

        /// Tokens seen in leaked report output, removed verbatim.
        constexpr std::array<std::string_view, 12> kKnownTokens = {
            "ESC[0m", "ESC[1m", "ESC[4m", "ESC[22m", "ESC[39m", "ESC[49m",
            "\x1B[0m", "\x1B[1m", "\x1B[4m", "\x1B[22m", "\x1B[39m", "\x1B[49m",
        };

        void erase_all(std::string& text, const std::string_view token) {
            std::size_t pos = text.find(token);
            while (pos != std::string::npos) {
                text.erase(pos, token.size());
                pos = text.find(token, pos);
            }
        }

        bool is_stray_control(const unsigned char c) {
            if (c == '\t' || c == '\n' || c == '\r') {
                return false;
            }
            return c < 0x20 || c == 0x7F;
        }

        std::string run_passes(std::string text) {
            text = strip_csi(text);

            for (const auto token : kKnownTokens) {
                erase_all(text, token);
            }
            text = std::regex_replace(text, bare_token_pattern(), "");

            text = strip_introduced(text);

            std::erase_if(text, [](const char c) {
                return is_stray_control(static_cast<unsigned char>(c));
            });
            return text;
        }

    }  // namespace

    std::string sanitize(std::string_view text) {
        std::string current(text);
        while (true) {
            std::string next = run_passes(current);
            if (next == current) {
                return next;
            }
            current = std::move(next);
        }
    }

    bool contains_escape_sequences(std::string_view text) {
        return run_passes(std::string(text)) != text;
    }

    Result<bool> sanitize_file(const fs::path& path, const std::uintmax_t max_bytes) {
        auto content = file_utils::read_file(path, max_bytes);
        if (content.is_err()) {
            return Result<bool>::failure(content.error());
        }

        const std::string cleaned = sanitize(content.value());
        if (cleaned == content.value()) {
            return Result<bool>::success(false);
        }

        if (auto written = file_utils::write_file_atomic(path, cleaned); written.is_err()) {
            return Result<bool>::failure(written.error());
        }

        logging::logger()->debug("Removed {} bytes of escape sequences from {}",
                                 content.value().size() - cleaned.size(), path.string());
        return Result<bool>::success(true);
    }

}  // namespace rcp::sanitize
