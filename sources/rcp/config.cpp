//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/config.hpp"
#include "rcp/utils/file_utils.hpp"

#include <toml++/toml.h>

#include <cstdint>
#include <sstream>

namespace rcp
{
    namespace {

        /// Config files are small; anything bigger is a mistake.
        constexpr std::uintmax_t kMaxConfigBytes = 1024 * 1024;

        /**
         * Copies an optional TOML value into out. A present key of the
         * wrong type is a ConfigError; a missing key leaves out untouched.
         */
        template<typename T, typename NodeView>
        Result<void> read_value(NodeView node, const std::string& key, T& out) {
            if (!node) {
                return Result<void>::success();
            }
            const auto value = node.template value<T>();
            if (!value) {
                return Result<void>::failure(
                    Error::config_error("Configuration value has the wrong type", key)
                );
            }
            out = *value;
            return Result<void>::success();
        }

        template<typename NodeView>
        Result<void> read_size(NodeView node, const std::string& key, std::uintmax_t& out) {
            std::int64_t value = static_cast<std::int64_t>(out);
            if (auto read = read_value(node, key, value); read.is_err()) {
                return read;
            }
            if (value <= 0) {
                return Result<void>::failure(
                    Error::config_error("Size limits must be positive", key)
                );
            }
            out = static_cast<std::uintmax_t>(value);
            return Result<void>::success();
        }

    }  // namespace

    const char* isolation_mode_to_string(const IsolationMode mode) noexcept {
        switch (mode) {
            case IsolationMode::Thread:  return "thread";
            case IsolationMode::Process: return "process";
        }
        return "thread";
    }

    Result<IsolationMode> isolation_mode_from_string(const std::string& value) {
        if (value == "thread") {
            return Result<IsolationMode>::success(IsolationMode::Thread);
        }
        if (value == "process") {
            return Result<IsolationMode>::success(IsolationMode::Process);
        }
        return Result<IsolationMode>::failure(
            Error::config_error("Unknown isolation mode '" + value + "'", "render.isolation")
        );
    }

    Result<Config> Config::load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path, kMaxConfigBytes);
        if (content.is_err()) {
            return Result<Config>::failure(content.error());
        }
        return load_from_string(content.value());
    }

    Result<Config> Config::load_from_string(const std::string& content) {
        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& e) {
            std::ostringstream where;
            where << "line " << e.source().begin.line << ", column " << e.source().begin.column;
            return Result<Config>::failure(
                Error::config_error("Invalid TOML: " + std::string(e.description()), where.str())
            );
        }

        Config config;
        std::uintmax_t max_process = config.limits.max_process_bytes;
        std::string reports_dir = config.storage.reports_dir.string();
        std::string isolation = isolation_mode_to_string(config.render.isolation);
        std::string temp_html = config.export_.temp_html.string();

        const Result<void> steps[] = {
            read_value(tbl["general"]["log_level"], "general.log_level", config.log_level),
            read_size(tbl["limits"]["max_process_bytes"], "limits.max_process_bytes", max_process),
            read_size(tbl["limits"]["max_read_bytes"], "limits.max_read_bytes", config.limits.max_read_bytes),
            read_value(tbl["storage"]["reports_dir"], "storage.reports_dir", reports_dir),
            read_value(tbl["storage"]["extension"], "storage.extension", config.storage.extension),
            read_value(tbl["render"]["isolation"], "render.isolation", isolation),
            read_value(tbl["render"]["superscript"], "render.superscript", config.render.superscript),
            read_value(tbl["export"]["converter"], "export.converter", config.export_.converter),
            read_value(tbl["export"]["temp_html"], "export.temp_html", temp_html),
            read_value(tbl["export"]["page_size"], "export.page_size", config.export_.page_size),
            read_value(tbl["export"]["margin"], "export.margin", config.export_.margin),
            read_value(tbl["export"]["encoding"], "export.encoding", config.export_.encoding),
        };

        for (const auto& step : steps) {
            if (step.is_err()) {
                return Result<Config>::failure(step.error());
            }
        }

        auto mode = isolation_mode_from_string(isolation);
        if (mode.is_err()) {
            return Result<Config>::failure(mode.error());
        }

        if (config.storage.extension.empty() || config.storage.extension.front() != '.') {
            return Result<Config>::failure(
                Error::config_error("Report extension must start with '.'", "storage.extension")
            );
        }

        config.limits.max_process_bytes = static_cast<std::size_t>(max_process);
        config.storage.reports_dir = reports_dir;
        config.render.isolation = mode.value();
        config.export_.temp_html = temp_html;

        return Result<Config>::success(std::move(config));
    }

    nlohmann::json Config::to_json() const {
        return {
            {"general", {{"log_level", log_level}}},
            {"limits", {
                {"max_process_bytes", limits.max_process_bytes},
                {"max_read_bytes", limits.max_read_bytes}
            }},
            {"storage", {
                {"reports_dir", storage.reports_dir.string()},
                {"extension", storage.extension}
            }},
            {"render", {
                {"isolation", isolation_mode_to_string(render.isolation)},
                {"superscript", render.superscript}
            }},
            {"export", {
                {"converter", export_.converter},
                {"temp_html", export_.temp_html.string()},
                {"page_size", export_.page_size},
                {"margin", export_.margin},
                {"encoding", export_.encoding}
            }}
        };
    }

}  // namespace rcp
