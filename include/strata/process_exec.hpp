#pragma once

#include "strata/console.hpp"
#include "strata/utility.hpp"

#include <optional>
#include <string>
#include <vector>

namespace strata {

struct Command {
    std::vector<std::string> args; ///< First argument is the executable.
    bool privileged = false;       ///< Run through the configured escalation command.
    bool quiet = false;            ///< Do not echo captured output.
    bool quiet_cmd = false;        ///< Do not echo the command line.
    std::optional<std::string> working_dir = std::nullopt;
};

struct CommandOutput {
    std::vector<std::string> lines; ///< Captured stdout, one entry per line.
    std::string err;                ///< Captured stderr.
    int status = 0;
};

std::string join_args(const std::vector<std::string> &args);

/**
 * @brief The single capability through which every external tool is executed.
 *
 * Layer, mount and namespace operations all go through a runner so that the
 * privileged side effects can be substituted in tests.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Executes a command and waits for it.
     *
     * @return The captured output and exit status, or
     *         `ErrorKind::ExternalCommandFailure` when the process could not be
     *         started at all. A non-zero exit status is not an error here.
     */
    virtual Result<CommandOutput> run(const Command &cmd) = 0;

    /**
     * @brief Like `run`, but a non-zero exit status becomes
     *        `ErrorKind::ExternalCommandFailure` carrying the captured stderr.
     */
    Result<CommandOutput> run_checked(const Command &cmd);
};

/**
 * @brief Runs commands as subprocesses using reproc++.
 *
 * Privileged commands are prefixed with the escalation command (e.g. `sudo`).
 */
class ReprocRunner final : public CommandRunner {
public:
    ReprocRunner(Console &console, std::vector<std::string> privilege_command);

    Result<CommandOutput> run(const Command &cmd) override;

private:
    Console &console_;
    std::vector<std::string> privilege_command_;
};

} // namespace strata
