//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_REPORT_STORE_HPP
#define REPORTCONTENTPIPELINE_REPORT_STORE_HPP

/**
 * @file report_store.hpp
 * @brief File-based persistence for finished reports.
 *
 * Reports are flat files under a root directory, addressed by file name
 * relative to the root (e.g. "ev-charging-2025-03-14.md"). Writes are
 * atomic: a reader sees either the previous content or the new content at
 * the final path, never a partial file. A crash mid-write can leave
 * "*.tmp" files behind; they never appear in list().
 */

#include "rcp/result.hpp"
#include "rcp/error.hpp"
#include "rcp/types.hpp"

#include <string>
#include <vector>

namespace rcp {

    struct Config;

    /**
     * Storage manager for report files.
     */
    class ReportStore {
    public:
        explicit ReportStore(fs::path root,
                             std::string extension = ".md",
                             std::uintmax_t max_read_bytes = kMaxReadBytes);

        /**
         * Uses storage.reports_dir, storage.extension and limits.max_read_bytes.
         */
        explicit ReportStore(const Config& config);

        /**
         * Saves content under name, replacing any existing report.
         *
         * @return Final path of the report, InvalidArgument for a name that
         *         is empty or escapes the root, IoError if the write fails.
         */
        Result<fs::path> save(const std::string& name, std::string_view content) const;

        /**
         * Reads a stored report.
         *
         * @return NotFound, NotAFile, TooLarge, IoError, or the content.
         */
        [[nodiscard]] Result<std::string> read(const std::string& name) const;

        /**
         * Deletes a report.
         *
         * @return true if removed, false if it did not exist, NotAFile if
         *         the name is a directory.
         */
        Result<bool> remove(const std::string& name) const;

        /**
         * Names of stored reports (with extension), sorted.
         *
         * @return NotFound if the root directory does not exist.
         */
        [[nodiscard]] Result<std::vector<std::string>> list() const;

        [[nodiscard]] bool exists(const std::string& name) const;

        /**
         * Resolves name to a path under the root.
         *
         * @return InvalidArgument if name is empty, absolute, or contains "..".
         */
        [[nodiscard]] Result<fs::path> path_for(const std::string& name) const;

        /**
         * Strips escape sequences from a stored report, rewriting it atomically.
         *
         * @return true if the report changed.
         */
        Result<bool> sanitize_in_place(const std::string& name) const;

        [[nodiscard]] const fs::path& root() const noexcept { return root_; }
        [[nodiscard]] const std::string& extension() const noexcept { return extension_; }

    private:
        fs::path root_;
        std::string extension_;
        std::uintmax_t max_read_bytes_;
    };

    /**
     * Lists report files with the given extension in dir without constructing
     * a store.
     */
    Result<std::vector<std::string>> list_reports(const fs::path& dir, const std::string& extension = ".md");

}  // namespace rcp

#endif //REPORTCONTENTPIPELINE_REPORT_STORE_HPP
