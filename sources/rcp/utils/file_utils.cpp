//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/utils/file_utils.hpp"
#include "rcp/logging.hpp"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

#ifndef _WIN32
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace rcp::file_utils
{
    namespace {

        Result<void> ensure_parent(const fs::path& path) {
            const auto parent = path.parent_path();
            if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
                fs::create_directories(parent, ec);
                if (ec) {
                    return Result<void>::failure(
                        Error::io_error("Failed to create directory: " + ec.message(), parent.string())
                    );
                }
            }
            return Result<void>::success();
        }

#ifndef _WIN32
        std::string errno_message() {
            return std::strerror(errno);
        }

        /**
         * write(2) loop that survives short writes and EINTR.
         */
        bool write_all(const int fd, std::string_view content) {
            const char* data = content.data();
            std::size_t remaining = content.size();
            while (remaining > 0) {
                const ssize_t n = ::write(fd, data, remaining);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return false;
                }
                data += n;
                remaining -= static_cast<std::size_t>(n);
            }
            return true;
        }
#endif

    }  // namespace

    Result<std::string> read_file(const fs::path& path, const std::uintmax_t max_bytes) {
        std::error_code ec;
        const auto status = fs::status(path, ec);
        if (status.type() == fs::file_type::not_found) {
            return Result<std::string>::failure(
                Error::not_found("File not found", path.string())
            );
        }
        if (ec) {
            return Result<std::string>::failure(
                Error::io_error("Failed to stat file: " + ec.message(), path.string())
            );
        }

        if (!fs::is_regular_file(status)) {
            return Result<std::string>::failure(
                Error(ErrorCode::NotAFile, "Path is not a regular file", path.string())
            );
        }

        const auto size = fs::file_size(path, ec);
        if (ec) {
            return Result<std::string>::failure(
                Error::io_error("Failed to get file size: " + ec.message(), path.string())
            );
        }

        if (size > max_bytes) {
            return Result<std::string>::failure(
                Error::too_large(
                    "File size " + std::to_string(size) + " bytes exceeds limit of " +
                    std::to_string(max_bytes) + " bytes",
                    path.string()
                )
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string>::success(oss.str());
    }

    fs::path make_temp_sibling(const fs::path& path) {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        std::ostringstream suffix;
        suffix << '.' << std::hex << std::setw(16) << std::setfill('0') << rng() << ".tmp";

        auto temp = path;
        temp += suffix.str();
        return temp;
    }

    Result<void> write_file_atomic(const fs::path& path, std::string_view content) {
        if (auto parent = ensure_parent(path); parent.is_err()) {
            return parent;
        }

        const auto temp = make_temp_sibling(path);

#ifdef _WIN32
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return Result<void>::failure(
                    Error::io_error("Failed to open temporary file", temp.string())
                );
            }
            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            file.flush();
            if (!file) {
                file.close();
                std::error_code ignored;
                fs::remove(temp, ignored);
                return Result<void>::failure(
                    Error::io_error("Failed to write temporary file", temp.string())
                );
            }
        }
#else
        const int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0) {
            return Result<void>::failure(
                Error::io_error("Failed to open temporary file: " + errno_message(), temp.string())
            );
        }

        bool ok = write_all(fd, content) && ::fsync(fd) == 0;
        std::string failure = ok ? std::string() : errno_message();
        if (::close(fd) != 0 && ok) {
            ok = false;
            failure = errno_message();
        }

        if (!ok) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Result<void>::failure(
                Error::io_error("Failed to write temporary file: " + failure, temp.string())
            );
        }
#endif

        std::error_code ec;
        fs::rename(temp, path, ec);
        if (ec) {
            std::error_code cleanup_ec;
            fs::remove(temp, cleanup_ec);
            if (cleanup_ec) {
                logging::logger()->warn("Could not remove temporary file {}: {}",
                                        temp.string(), cleanup_ec.message());
            }
            return Result<void>::failure(
                Error::io_error("Failed to move file into place: " + ec.message(), path.string())
            );
        }

        return Result<void>::success();
    }

    Result<void> write_file(const fs::path& path, std::string_view content) {
        if (auto parent = ensure_parent(path); parent.is_err()) {
            return parent;
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Result<void>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));

        if (!file) {
            return Result<void>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void>::success();
    }

    Result<bool> remove_if_exists(const fs::path& path) {
        std::error_code ec;
        const auto status = fs::symlink_status(path, ec);
        if (status.type() == fs::file_type::not_found) {
            return Result<bool>::success(false);
        }
        if (ec) {
            return Result<bool>::failure(
                Error::io_error("Failed to stat file: " + ec.message(), path.string())
            );
        }
        if (fs::is_directory(status)) {
            return Result<bool>::failure(
                Error(ErrorCode::NotAFile, "Path is a directory", path.string())
            );
        }

        const bool removed = fs::remove(path, ec);
        if (ec) {
            return Result<bool>::failure(
                Error::io_error("Failed to delete file: " + ec.message(), path.string())
            );
        }

        return Result<bool>::success(removed);
    }

}  // namespace rcp::file_utils
