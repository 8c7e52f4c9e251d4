//
// Created by gregorian-rayne on 10/18/26.
//

#include "rcp/process/process_runner.hpp"
#include "rcp/logging.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace rcp::process
{
    namespace {

#ifdef _WIN32
        std::string quote_argument(const std::string& arg) {
            if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
                return arg;
            }
            std::string quoted = "\"";
            for (const char c : arg) {
                if (c == '"' || c == '\\') {
                    quoted += '\\';
                }
                quoted += c;
            }
            quoted += '"';
            return quoted;
        }

        /**
         * Windows has no fork; the command line goes through _popen with
         * stderr folded into stdout. Both output fields receive the text.
         */
        Result<CommandResult> run_impl(const std::vector<std::string>& argv) {
            CommandResult result;
            const auto start_time = std::chrono::steady_clock::now();

            std::string command;
            for (const auto& arg : argv) {
                if (!command.empty()) {
                    command += ' ';
                }
                command += quote_argument(arg);
            }
            command += " 2>&1";

            FILE* pipe = _popen(command.c_str(), "r");
            if (!pipe) {
                return Result<CommandResult>::failure(
                    Error(ErrorCode::ToolNotFound, "Failed to start program", argv.front())
                );
            }

            char buffer[4096];
            while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
                result.stdout_output += buffer;
            }
            result.exit_code = _pclose(pipe);
            result.stderr_output = result.stdout_output;

            // cmd.exe reports an unknown program as exit status 9009
            if (result.exit_code == 9009) {
                return Result<CommandResult>::failure(
                    Error(ErrorCode::ToolNotFound, "Program not found", argv.front())
                );
            }

            result.execution_time = std::chrono::duration_cast<Duration>(
                std::chrono::steady_clock::now() - start_time);
            return Result<CommandResult>::success(std::move(result));
        }
#else
        void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        /**
         * Owns the three pipes between parent and child. [0] is the read end.
         */
        struct Pipes {
            int out[2] = {-1, -1};
            int err[2] = {-1, -1};
            int exec_status[2] = {-1, -1};

            ~Pipes() {
                for (int* p : {out, err, exec_status}) {
                    close_fd(p[0]);
                    close_fd(p[1]);
                }
            }

            bool open() {
                return open_cloexec(out) && open_cloexec(err) && open_cloexec(exec_status);
            }

        private:
            static bool open_cloexec(int (&fds)[2]) {
#if defined(__linux__)
                return ::pipe2(fds, O_CLOEXEC) == 0;
#else
                if (::pipe(fds) != 0) {
                    return false;
                }
                return ::fcntl(fds[0], F_SETFD, FD_CLOEXEC) == 0 &&
                       ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) == 0;
#endif
            }
        };

        /// Drains stdout and stderr until both reach end of file.
        void collect_output(int& out_fd, int& err_fd, CommandResult& result) {
            char buffer[4096];
            while (out_fd >= 0 || err_fd >= 0) {
                pollfd fds[2] = {
                    {out_fd, POLLIN, 0},
                    {err_fd, POLLIN, 0},
                };
                if (::poll(fds, 2, -1) < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    break;
                }

                for (int i = 0; i < 2; ++i) {
                    int& fd = i == 0 ? out_fd : err_fd;
                    if (fd < 0 || fds[i].revents == 0) {
                        continue;
                    }
                    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
                    if (n > 0) {
                        (i == 0 ? result.stdout_output : result.stderr_output).append(buffer, static_cast<std::size_t>(n));
                    } else if (n == 0 || errno != EINTR) {
                        close_fd(fd);
                    }
                }
            }
            close_fd(out_fd);
            close_fd(err_fd);
        }

        Result<CommandResult> run_impl(const std::vector<std::string>& argv) {
            CommandResult result;
            const auto start_time = std::chrono::steady_clock::now();

            Pipes pipes;
            if (!pipes.open()) {
                return Result<CommandResult>::failure(
                    Error::io_error("Failed to create pipes", std::strerror(errno))
                );
            }

            std::vector<char*> args;
            args.reserve(argv.size() + 1);
            for (const auto& arg : argv) {
                args.push_back(const_cast<char*>(arg.c_str()));
            }
            args.push_back(nullptr);

            const pid_t pid = ::fork();
            if (pid < 0) {
                return Result<CommandResult>::failure(
                    Error::io_error("Failed to fork", std::strerror(errno))
                );
            }

            if (pid == 0) {
                // Child: only async-signal-safe calls from here on
                ::dup2(pipes.out[1], STDOUT_FILENO);
                ::dup2(pipes.err[1], STDERR_FILENO);

                ::execvp(args[0], args.data());

                const int exec_errno = errno;
                [[maybe_unused]] const auto written = ::write(pipes.exec_status[1], &exec_errno, sizeof(exec_errno));
                ::_exit(127);
            }

            close_fd(pipes.out[1]);
            close_fd(pipes.err[1]);
            close_fd(pipes.exec_status[1]);

            collect_output(pipes.out[0], pipes.err[0], result);

            int exec_errno = 0;
            ssize_t n;
            do {
                n = ::read(pipes.exec_status[0], &exec_errno, sizeof(exec_errno));
            } while (n < 0 && errno == EINTR);

            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    return Result<CommandResult>::failure(
                        Error::io_error("Failed to wait for child process", std::strerror(errno))
                    );
                }
            }

            if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
                return Result<CommandResult>::failure(
                    Error(ErrorCode::ToolNotFound,
                          "Cannot execute '" + argv.front() + "'",
                          std::strerror(exec_errno))
                );
            }

            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = -WTERMSIG(status);
            }

            result.execution_time = std::chrono::duration_cast<Duration>(
                std::chrono::steady_clock::now() - start_time);
            return Result<CommandResult>::success(std::move(result));
        }
#endif

    }  // namespace

    Result<CommandResult> run(const std::vector<std::string>& argv) {
        if (argv.empty() || argv.front().empty()) {
            return Result<CommandResult>::failure(
                Error::invalid_argument("No program given", "argv")
            );
        }

        logging::logger()->debug("Running {} with {} argument(s)", argv.front(), argv.size() - 1);
        auto result = run_impl(argv);
        if (result.is_ok()) {
            logging::logger()->debug("{} exited with {} after {} ms", argv.front(), result.value().exit_code,
                                     std::chrono::duration_cast<std::chrono::milliseconds>(
                                         result.value().execution_time).count());
        }
        return result;
    }

    bool probe(const std::string& program) {
        const auto result = run({program, "--version"});
        return result.is_ok() && result.value().success();
    }

    Result<void> open_with_default_app(const fs::path& path) {
#ifdef _WIN32
        const std::vector<std::string> argv = {"cmd", "/c", "start", "", path.string()};
#elif defined(__APPLE__)
        const std::vector<std::string> argv = {"open", path.string()};
#else
        const std::vector<std::string> argv = {"xdg-open", path.string()};
#endif

        auto result = run(argv);
        if (result.is_err()) {
            logging::logger()->warn("Could not open {}: {}", path.string(), result.error().to_string());
            return Result<void>::failure(result.error());
        }
        if (!result.value().success()) {
            const Error error(ErrorCode::ToolFailed,
                              "Default application exited with status " +
                              std::to_string(result.value().exit_code),
                              result.value().stderr_output);
            logging::logger()->warn("Could not open {}: {}", path.string(), error.to_string());
            return Result<void>::failure(error);
        }
        return Result<void>::success();
    }

}  // namespace rcp::process
