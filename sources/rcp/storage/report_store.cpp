//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/storage/report_store.hpp"
#include "rcp/config.hpp"
#include "rcp/sanitize/escape_sanitizer.hpp"
#include "rcp/utils/file_utils.hpp"
#include "rcp/utils/string_utils.hpp"
#include "rcp/logging.hpp"

#include <algorithm>

namespace rcp
{
    ReportStore::ReportStore(fs::path root, std::string extension, const std::uintmax_t max_read_bytes)
        : root_(std::move(root))
        , extension_(std::move(extension))
        , max_read_bytes_(max_read_bytes) {}

    ReportStore::ReportStore(const Config& config)
        : ReportStore(config.storage.reports_dir, config.storage.extension, config.limits.max_read_bytes) {}

    Result<fs::path> ReportStore::path_for(const std::string& name) const {
        if (string_utils::trim(name).empty()) {
            return Result<fs::path>::failure(
                Error::invalid_argument("Report name must not be empty", "name")
            );
        }

        const fs::path relative(name);
        if (relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
            return Result<fs::path>::failure(
                Error::invalid_argument("Report name must be relative to the reports directory", name)
            );
        }

        for (const auto& part : relative) {
            if (part == "..") {
                return Result<fs::path>::failure(
                    Error::invalid_argument("Report name must not leave the reports directory", name)
                );
            }
        }

        if (!relative.has_filename()) {
            return Result<fs::path>::failure(
                Error::invalid_argument("Report name must name a file", name)
            );
        }

        return Result<fs::path>::success(root_ / relative);
    }

    Result<fs::path> ReportStore::save(const std::string& name, std::string_view content) const {
        auto path = path_for(name);
        if (path.is_err()) {
            return path;
        }

        if (auto written = file_utils::write_file_atomic(path.value(), content); written.is_err()) {
            return Result<fs::path>::failure(written.error().with_context(name));
        }

        logging::logger()->debug("Saved report {} ({} bytes)", path.value().string(), content.size());
        return path;
    }

    Result<std::string> ReportStore::read(const std::string& name) const {
        auto path = path_for(name);
        if (path.is_err()) {
            return Result<std::string>::failure(path.error());
        }
        return file_utils::read_file(path.value(), max_read_bytes_);
    }

    Result<bool> ReportStore::remove(const std::string& name) const {
        auto path = path_for(name);
        if (path.is_err()) {
            return Result<bool>::failure(path.error());
        }

        auto removed = file_utils::remove_if_exists(path.value());
        if (removed.is_ok() && removed.value()) {
            logging::logger()->debug("Deleted report {}", path.value().string());
        }
        return removed;
    }

    Result<std::vector<std::string>> ReportStore::list() const {
        return list_reports(root_, extension_);
    }

    bool ReportStore::exists(const std::string& name) const {
        const auto path = path_for(name);
        if (path.is_err()) {
            return false;
        }
        std::error_code ec;
        return fs::is_regular_file(path.value(), ec);
    }

    Result<bool> ReportStore::sanitize_in_place(const std::string& name) const {
        auto path = path_for(name);
        if (path.is_err()) {
            return Result<bool>::failure(path.error());
        }
        return sanitize::sanitize_file(path.value(), max_read_bytes_);
    }

    Result<std::vector<std::string>> list_reports(const fs::path& dir, const std::string& extension) {
        std::error_code ec;
        if (!fs::exists(dir, ec)) {
            return Result<std::vector<std::string>>::failure(
                Error::not_found("Reports directory does not exist", dir.string())
            );
        }
        if (!fs::is_directory(dir, ec)) {
            return Result<std::vector<std::string>>::failure(
                Error::io_error("Reports path is not a directory", dir.string())
            );
        }

        std::vector<std::string> names;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            return Result<std::vector<std::string>>::failure(
                Error::io_error("Failed to list reports: " + ec.message(), dir.string())
            );
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec) || it->path().extension() != extension) {
                continue;
            }

            std::string file_name = it->path().filename().string();
            if (!string_utils::is_valid_utf8(file_name)) {
                logging::logger()->warn("Skipping report with undecodable name in {}", dir.string());
                continue;
            }
            names.push_back(std::move(file_name));
        }

        if (ec) {
            return Result<std::vector<std::string>>::failure(
                Error::io_error("Failed to list reports: " + ec.message(), dir.string())
            );
        }

        std::ranges::sort(names);
        return Result<std::vector<std::string>>::success(std::move(names));
    }

}  // namespace rcp
