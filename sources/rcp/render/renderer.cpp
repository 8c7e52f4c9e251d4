//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/render/renderer.hpp"
#include "rcp/config.hpp"
#include "rcp/sanitize/escape_sanitizer.hpp"
#include "rcp/utils/string_utils.hpp"
#include "rcp/logging.hpp"

extern "C" {
#include <md4c-html.h>
}

#include <cctype>
#include <chrono>
#include <cstring>
#include <future>
#include <stdexcept>
#include <thread>

#ifndef _WIN32
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace rcp::render
{
    namespace {

        constexpr unsigned kParserFlags =
            MD_FLAG_TABLES |
            MD_FLAG_STRIKETHROUGH |
            MD_FLAG_PERMISSIVEAUTOLINKS |
            MD_FLAG_TASKLISTS;

        void append_chunk(const MD_CHAR* data, const MD_SIZE size, void* userdata) {
            static_cast<std::string*>(userdata)->append(data, size);
        }

        /// Length of the run of c starting at pos.
        std::size_t run_length(std::string_view s, std::size_t pos, const char c) {
            const std::size_t start = pos;
            while (pos < s.size() && s[pos] == c) {
                ++pos;
            }
            return pos - start;
        }

        struct Fence {
            char marker = 0;
            std::size_t length = 0;
        };

        /**
         * Recognizes an opening or closing code fence: up to three spaces of
         * indentation and three or more backticks or tildes.
         */
        Fence fence_of(std::string_view line) {
            std::size_t indent = 0;
            while (indent < line.size() && indent < 3 && line[indent] == ' ') {
                ++indent;
            }
            if (indent >= line.size() || (line[indent] != '`' && line[indent] != '~')) {
                return {};
            }
            const std::size_t length = run_length(line, indent, line[indent]);
            if (length < 3) {
                return {};
            }
            return {line[indent], length};
        }

        void superscript_line(std::string_view line, std::string& out) {
            std::size_t i = 0;
            while (i < line.size()) {
                const char c = line[i];

                if (c == '\\' && i + 1 < line.size()) {
                    out.append(line.substr(i, 2));
                    i += 2;
                    continue;
                }

                if (c == '`') {
                    const std::size_t ticks = run_length(line, i, '`');
                    std::size_t search = i + ticks;
                    std::size_t close = std::string_view::npos;
                    while ((search = line.find('`', search)) != std::string_view::npos) {
                        const std::size_t n = run_length(line, search, '`');
                        if (n == ticks) {
                            close = search;
                            break;
                        }
                        search += n;
                    }
                    const std::size_t end = close == std::string_view::npos ? i + ticks : close + ticks;
                    out.append(line.substr(i, end - i));
                    i = end;
                    continue;
                }

                if (c == '^') {
                    std::size_t j = i + 1;
                    while (j < line.size() && line[j] != '^' && line[j] != '`' &&
                           !std::isspace(static_cast<unsigned char>(line[j]))) {
                        ++j;
                    }
                    if (j < line.size() && line[j] == '^' && j > i + 1) {
                        out += "<sup>";
                        out.append(line.substr(i + 1, j - i - 1));
                        out += "</sup>";
                        i = j + 1;
                        continue;
                    }
                }

                out += c;
                ++i;
            }
        }

        Error panic(std::string message, std::string context) {
            return {ErrorCode::RenderPanic, std::move(message), std::move(context)};
        }

#ifndef _WIN32
        bool write_all(const int fd, const char* data, std::size_t size) {
            while (size > 0) {
                const ssize_t n = ::write(fd, data, size);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return false;
                }
                data += n;
                size -= static_cast<std::size_t>(n);
            }
            return true;
        }

        /// Reply framing between the conversion child and its parent.
        constexpr char kReplyOk = 'O';
        constexpr char kReplyError = 'E';
#endif

    }  // namespace

    RenderOptions render_options_from(const Config& config) {
        RenderOptions options;
        options.isolation = config.render.isolation;
        options.superscript = config.render.superscript;
        options.max_bytes = config.limits.max_process_bytes;
        return options;
    }

    std::string md4c_convert(std::string_view markdown) {
        std::string html;
        html.reserve(markdown.size() + markdown.size() / 2);

        const int rc = md_html(markdown.data(), static_cast<MD_SIZE>(markdown.size()),
                               append_chunk, &html, kParserFlags, 0);
        if (rc != 0) {
            throw std::runtime_error("md4c failed to parse the document");
        }
        return html;
    }

    std::string apply_superscript(std::string_view markdown) {
        std::string out;
        out.reserve(markdown.size());

        Fence open_fence;
        std::size_t start = 0;
        while (start < markdown.size()) {
            auto end = markdown.find('\n', start);
            const bool has_newline = end != std::string_view::npos;
            if (!has_newline) {
                end = markdown.size();
            }
            const auto line = markdown.substr(start, end - start);

            if (const auto fence = fence_of(line); fence.marker != 0) {
                if (open_fence.marker == 0) {
                    open_fence = fence;
                } else if (fence.marker == open_fence.marker && fence.length >= open_fence.length) {
                    open_fence = {};
                }
                out.append(line);
            } else if (open_fence.marker != 0) {
                out.append(line);
            } else {
                superscript_line(line, out);
            }

            if (has_newline) {
                out += '\n';
            }
            start = end + 1;
        }
        return out;
    }

    Renderer::Renderer()
        : Renderer(RenderOptions{}) {}

    Renderer::Renderer(RenderOptions options, ConversionEngine engine)
        : options_(options)
        , engine_(std::move(engine)) {}

    Result<std::string> Renderer::render(std::string_view body) const {
        if (body.size() > options_.max_bytes) {
            return Result<std::string>::failure(
                Error::too_large("Body of " + std::to_string(body.size()) + " bytes exceeds limit of " +
                                 std::to_string(options_.max_bytes) + " bytes", "render")
            );
        }

        std::string markdown = sanitize::sanitize(body);
        if (string_utils::trim(markdown).empty()) {
            return Result<std::string>::failure(Error::empty_input("Nothing to render"));
        }

        if (options_.superscript) {
            markdown = apply_superscript(markdown);
        }

        const auto start = std::chrono::steady_clock::now();
        auto html = options_.isolation == IsolationMode::Process
            ? convert_in_process(markdown)
            : convert_in_thread(markdown);
        if (html.is_err()) {
            logging::logger()->warn("Rendering failed: {}", html.error().to_string());
            return html;
        }

        if (string_utils::trim(html.value()).empty()) {
            return Result<std::string>::failure(
                Error(ErrorCode::EmptyOutput, "Conversion produced no output")
            );
        }

        logging::logger()->debug("Rendered {} bytes of markdown to {} bytes of HTML in {} us",
                                 markdown.size(), html.value().size(),
                                 std::chrono::duration_cast<std::chrono::microseconds>(
                                     std::chrono::steady_clock::now() - start).count());
        return html;
    }

    Result<std::string> Renderer::convert_in_thread(const std::string& markdown) const {
        std::packaged_task<std::string()> task([this, &markdown] {
            return engine_(markdown);
        });
        auto future = task.get_future();

        std::thread worker(std::move(task));
        worker.join();

        try {
            return Result<std::string>::success(future.get());
        } catch (const std::exception& e) {
            return Result<std::string>::failure(panic("Conversion engine failed", e.what()));
        } catch (...) {
            return Result<std::string>::failure(panic("Conversion engine failed", "non-standard exception"));
        }
    }

#ifdef _WIN32
    Result<std::string> Renderer::convert_in_process(const std::string& markdown) const {
        logging::logger()->warn("Process isolation is unavailable on this platform; using a thread");
        return convert_in_thread(markdown);
    }
#else
    Result<std::string> Renderer::convert_in_process(const std::string& markdown) const {
        int fds[2];
#if defined(__linux__)
        const int piped = ::pipe2(fds, O_CLOEXEC);
#else
        const int piped = ::pipe(fds);
#endif
        if (piped != 0) {
            return Result<std::string>::failure(
                Error::io_error("Failed to create pipe", std::strerror(errno))
            );
        }

        const pid_t pid = ::fork();
        if (pid < 0) {
            ::close(fds[0]);
            ::close(fds[1]);
            return Result<std::string>::failure(
                Error::io_error("Failed to fork", std::strerror(errno))
            );
        }

        if (pid == 0) {
            ::close(fds[0]);
            char tag = kReplyOk;
            std::string payload;
            int status = 0;
            try {
                payload = engine_(markdown);
            } catch (const std::exception& e) {
                tag = kReplyError;
                payload = e.what();
                status = 1;
            }
            const bool sent = write_all(fds[1], &tag, 1) && write_all(fds[1], payload.data(), payload.size());
            ::close(fds[1]);
            ::_exit(sent ? status : 2);
        }

        ::close(fds[1]);

        std::string reply;
        char buffer[8192];
        while (true) {
            const ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
            if (n > 0) {
                reply.append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                break;
            }
        }
        ::close(fds[0]);

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return Result<std::string>::failure(
                    Error::io_error("Failed to wait for conversion process", std::strerror(errno))
                );
            }
        }

        if (WIFSIGNALED(status)) {
            const int sig = WTERMSIG(status);
            return Result<std::string>::failure(
                panic("Conversion process terminated by signal " + std::to_string(sig), ::strsignal(sig))
            );
        }

        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0 || reply.empty() || reply.front() != kReplyOk) {
            const std::string detail = !reply.empty() && reply.front() == kReplyError
                ? reply.substr(1)
                : "exit status " + std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1);
            return Result<std::string>::failure(panic("Conversion engine failed", detail));
        }

        return Result<std::string>::success(reply.substr(1));
    }
#endif

}  // namespace rcp::render
