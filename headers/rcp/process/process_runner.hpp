//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef REPORTCONTENTPIPELINE_PROCESS_RUNNER_HPP
#define REPORTCONTENTPIPELINE_PROCESS_RUNNER_HPP

/**
 * @file process_runner.hpp
 * @brief Running external programs.
 *
 * Programs are started directly from an argument vector; no shell is
 * involved, so arguments never need quoting. The runner blocks until the
 * child exits.
 */

#include "rcp/result.hpp"
#include "rcp/error.hpp"
#include "rcp/types.hpp"

#include <string>
#include <vector>

namespace rcp::process {

    /**
     * Outcome of a finished child process.
     */
    struct CommandResult {
        int exit_code = -1;          ///< Exit status, or -signal if killed by a signal
        std::string stdout_output;
        std::string stderr_output;
        Duration execution_time = Duration::zero();

        [[nodiscard]] bool success() const noexcept { return exit_code == 0; }
    };

    /**
     * Runs argv[0] with the given arguments, resolving it through PATH.
     *
     * A non-zero exit is not an error at this level; inspect exit_code.
     *
     * @return ToolNotFound if the program cannot be executed, IoError if the
     *         child could not be created, otherwise the collected output.
     */
    Result<CommandResult> run(const std::vector<std::string>& argv);

    /**
     * True if `program --version` runs and exits with status 0.
     */
    bool probe(const std::string& program);

    /**
     * Opens path with the platform's default application: xdg-open on
     * Linux, open on macOS, cmd /c start on Windows.
     *
     * Failure is logged once as a warning and returned.
     */
    Result<void> open_with_default_app(const fs::path& path);

}  // namespace rcp::process

#endif //REPORTCONTENTPIPELINE_PROCESS_RUNNER_HPP
