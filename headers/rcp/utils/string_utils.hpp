//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_STRING_UTILS_HPP
#define REPORTCONTENTPIPELINE_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief Small text helpers shared by the pipeline stages.
 */

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace rcp::string_utils {

    /// Strips spaces, tabs and line endings from the end of s.
    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits text into lines on '\n'. A trailing '\r' stays on its line;
     * a final newline does not produce an empty trailing entry.
     */
    inline std::vector<std::string_view> split_lines(std::string_view text) {
        std::vector<std::string_view> lines;
        std::size_t start = 0;
        while (start < text.size()) {
            const auto end = text.find('\n', start);
            if (end == std::string_view::npos) {
                lines.push_back(text.substr(start));
                break;
            }
            lines.push_back(text.substr(start, end - start));
            start = end + 1;
        }
        return lines;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::ostringstream oss;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                oss << delimiter;
            }
            oss << part;
            first = false;
        }
        return oss.str();
    }

    /**
     * Checks that s is well-formed UTF-8 (no overlongs, no surrogates,
     * nothing above U+10FFFF).
     */
    inline bool is_valid_utf8(const std::string_view s) noexcept {
        std::size_t i = 0;
        while (i < s.size()) {
            const auto c = static_cast<unsigned char>(s[i]);
            std::size_t extra;
            std::uint32_t cp;
            if (c < 0x80) {
                ++i;
                continue;
            } else if ((c & 0xE0) == 0xC0) {
                extra = 1;
                cp = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2;
                cp = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3;
                cp = c & 0x07;
            } else {
                return false;
            }
            if (i + extra >= s.size()) {
                return false;
            }
            for (std::size_t k = 1; k <= extra; ++k) {
                const auto cc = static_cast<unsigned char>(s[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    return false;
                }
                cp = (cp << 6) | (cc & 0x3F);
            }
            constexpr std::uint32_t min_for_length[] = {0, 0x80, 0x800, 0x10000};
            if (cp < min_for_length[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }

    /**
     * Escapes the five HTML-significant characters.
     */
    inline std::string escape_html(const std::string_view s) {
        std::string result;
        result.reserve(s.size());
        for (const char c : s) {
            switch (c) {
                case '&':  result += "&amp;"; break;
                case '<':  result += "&lt;"; break;
                case '>':  result += "&gt;"; break;
                case '"':  result += "&quot;"; break;
                case '\'': result += "&#39;"; break;
                default:   result += c;
            }
        }
        return result;
    }

}  // namespace rcp::string_utils

#endif //REPORTCONTENTPIPELINE_STRING_UTILS_HPP
