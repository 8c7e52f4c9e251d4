//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/format/report_formatter.hpp"
#include "rcp/metadata/metadata_extractor.hpp"
#include "rcp/utils/string_utils.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>

namespace rcp::format
{
    namespace {

        std::string format_local_time(const Clock::time_point tp, const char* pattern) {
            const auto time_t_val = Clock::to_time_t(tp);
            std::tm time_info{};
#ifdef _WIN32
            localtime_s(&time_info, &time_t_val);
#else
            localtime_r(&time_t_val, &time_info);
#endif
            std::ostringstream ss;
            ss << std::put_time(&time_info, pattern);
            return ss.str();
        }

        /**
         * Text after label up to the next newline or '<', trimmed.
         */
        std::optional<std::string> labelled_value(std::string_view content, const std::string_view label) {
            const auto pos = content.find(label);
            if (pos == std::string_view::npos) {
                return std::nullopt;
            }
            const auto start = pos + label.size();
            const auto end = content.find_first_of("\n<", start);
            const auto value = content.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
            return std::string(string_utils::trim(value));
        }

    }  // namespace

    std::string report_id(const Clock::time_point now) {
        return format_local_time(now, "MR-%Y%m%d-%H%M%S");
    }

    std::string format_report(std::string_view content, std::string_view title, const Clock::time_point now) {
        std::ostringstream out;
        out << "# " << title << " Market Analysis\n\n"
            << "<div class=\"report-metadata\">\n"
            << "<p class=\"report-date\">Generated on: " << format_local_time(now, "%B %d, %Y") << "</p>\n"
            << "<p class=\"report-id\">Report ID: " << report_id(now) << "</p>\n"
            << "<p class=\"confidentiality\">CONFIDENTIAL DOCUMENT</p>\n"
            << "</div>\n\n"
            << "---\n\n"
            << content;
        return out.str();
    }

    std::string format_report_frontmatter(std::string_view content, std::string_view title,
                                          const Clock::time_point now) {
        const std::string full_title = std::string(title) + " Market Analysis";
        const std::string timestamp = format_local_time(now, "%Y-%m-%d %H:%M:%S");

        const ReportMetadata metadata = {
            {"id", report_id(now)},
            {"title", full_title},
            {"date", timestamp},
        };

        std::string body = "\n# " + full_title + "\nGenerated on: " + timestamp + "\n\n";
        body += content;
        return metadata::serialize_frontmatter(metadata, body);
    }

    HeaderMetadata scrape_header_metadata(std::string_view content) {
        HeaderMetadata header;

        for (const auto line : string_utils::split_lines(content)) {
            const auto trimmed = string_utils::trim(line);
            if (trimmed.empty() || trimmed.front() != '#') {
                continue;
            }
            const auto text_start = trimmed.find_first_not_of('#');
            if (text_start == std::string_view::npos) {
                continue;
            }
            if (const auto heading = string_utils::trim(trimmed.substr(text_start)); !heading.empty()) {
                header.title = std::string(heading);
                break;
            }
        }

        if (auto date = labelled_value(content, "Generated on:"); date && !date->empty()) {
            header.date = std::move(*date);
        }
        if (auto id = labelled_value(content, "Report ID:"); id && !id->empty()) {
            header.id = std::move(*id);
        }
        return header;
    }

    std::string report_file_name(std::string_view topic, const Clock::time_point now, std::string_view extension) {
        std::string name;
        name.reserve(topic.size() + 24);
        for (const char c : string_utils::trim(topic)) {
            if (c == ' ' || c == '/' || c == '\\') {
                name += '_';
            } else {
                name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
        }
        name += format_local_time(now, "_%Y%m%d_%H%M%S");
        name += extension;
        return name;
    }

}  // namespace rcp::format
