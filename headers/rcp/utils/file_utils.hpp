//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_FILE_UTILS_HPP
#define REPORTCONTENTPIPELINE_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system helpers used by the store, the exporter and the config loader.
 *
 * All operations use Result<T, Error> for error handling.
 */

#include "rcp/result.hpp"
#include "rcp/error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace rcp::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads a regular file, refusing anything larger than max_bytes.
     *
     * The size is taken from filesystem metadata before the file is opened,
     * so an oversized file is rejected without reading its content.
     *
     * @return NotFound only when path does not exist. Other stat failures
     *         are IoError. Otherwise NotAFile, TooLarge, or the file content.
     */
    Result<std::string> read_file(const fs::path& path, std::uintmax_t max_bytes);

    /**
     * Writes content to path so that no reader ever sees a partial file.
     *
     * Data goes to a uniquely named temporary file in the same directory,
     * is flushed to disk, then renamed over path. Parent directories are
     * created. If the rename fails the temporary file is removed best-effort.
     */
    Result<void> write_file_atomic(const fs::path& path, std::string_view content);

    /**
     * Name of the temporary sibling used by write_file_atomic.
     * Always ends in ".tmp".
     */
    fs::path make_temp_sibling(const fs::path& path);

    /**
     * Writes content to path directly (truncating). Used for scratch files
     * that are not externally visible artifacts.
     */
    Result<void> write_file(const fs::path& path, std::string_view content);

    /**
     * Removes a file if it exists. A directory is left alone and reported
     * as NotAFile.
     *
     * @return true if a file was removed, false if there was nothing to remove.
     */
    Result<bool> remove_if_exists(const fs::path& path);

}  // namespace rcp::file_utils

#endif //REPORTCONTENTPIPELINE_FILE_UTILS_HPP
