//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_CONFIG_HPP
#define REPORTCONTENTPIPELINE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Pipeline configuration loaded from TOML.
 *
 * Every key is optional; missing keys keep the defaults below. Example:
 * @code
 *     [general]
 *     log_level = "debug"
 *
 *     [storage]
 *     reports_dir = "reports"
 *
 *     [render]
 *     isolation = "process"
 *
 *     [export]
 *     converter = "/usr/local/bin/wkhtmltopdf"
 * @endcode
 */

#include "rcp/result.hpp"
#include "rcp/error.hpp"
#include "rcp/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace rcp {

    struct LimitsConfig {
        std::size_t max_process_bytes = kMaxProcessBytes;
        std::uintmax_t max_read_bytes = kMaxReadBytes;
    };

    struct StorageConfig {
        fs::path reports_dir = "reports";
        std::string extension = ".md";
    };

    struct RenderConfig {
        IsolationMode isolation = IsolationMode::Thread;
        bool superscript = true;
    };

    /**
     * Converter invocation. Geometry and encoding are passed verbatim as
     * --page-size, --margin-{top,bottom,left,right} and --encoding.
     */
    struct ExportConfig {
        std::string converter = "wkhtmltopdf";
        fs::path temp_html = fs::path("/tmp") / "rcp_export.html";
        std::string page_size = "A4";
        std::string margin = "20mm";
        std::string encoding = "UTF-8";
    };

    struct Config {
        std::string log_level = "info";
        LimitsConfig limits;
        StorageConfig storage;
        RenderConfig render;
        ExportConfig export_;

        /**
         * Loads configuration from a TOML file.
         *
         * @return NotFound if the file is missing, ConfigError if it does not parse.
         */
        [[nodiscard]] static Result<Config> load_from_file(const fs::path& path);

        [[nodiscard]] static Result<Config> load_from_string(const std::string& content);

        /**
         * Effective configuration as JSON, for diagnostics.
         */
        [[nodiscard]] nlohmann::json to_json() const;
    };

    const char* isolation_mode_to_string(IsolationMode mode) noexcept;

    Result<IsolationMode> isolation_mode_from_string(const std::string& value);

}  // namespace rcp

#endif //REPORTCONTENTPIPELINE_CONFIG_HPP
