/**
 * @file command_executor.hpp
 * @brief Local process execution for macfence
 * @author macfence Development Team
 * @date 2026
 *
 * This file contains the CommandExecutor class which runs local processes
 * (ssh, scp and friends) with a hard time limit and returns a structured
 * result. It is the only place in macfence that creates processes; the SSH
 * transport builds its command lines and hands them over here.
 */

#pragma once

#include <string>
#include <vector>

namespace macfence {

/**
 * @struct CommandResult
 * @brief Outcome of one local process run
 *
 * stdout is kept byte for byte (it may carry a whole config.xml); stderr has
 * its trailing newlines removed.
 */
struct CommandResult {
    bool success = false;           ///< Exit status was 0
    bool timed_out = false;         ///< Killed by the time limit (exit 124)
    int exit_code = -1;             ///< Exit status, 128+N for signal N, -1 if never started
    std::string stdout_output;
    std::string stderr_output;
    std::string command;            ///< Shell command line as run

    bool isSuccess() const {
        return success && exit_code == 0;
    }

    /**
     * @brief One-line description of a failed run, for logs
     * @return Empty when the run succeeded
     */
    std::string getErrorMessage() const {
        if (isSuccess()) {
            return "";
        }
        if (timed_out) {
            return "Command timed out: " + command;
        }

        std::string message = "'" + command + "' exited with " + std::to_string(exit_code);
        if (!stderr_output.empty()) {
            message += ": " + stderr_output;
        }
        return message;
    }
};

/**
 * @class CommandExecutor
 * @brief Time-limited command executor with structured results and logging
 *
 * All methods are static. Commands run through /bin/sh via popen(), wrapped
 * in coreutils `timeout` when a limit is given, so a hung child is killed
 * and reported as a failure instead of blocking the caller. Execution
 * problems are reported through CommandResult; nothing here throws.
 */
class CommandExecutor {
public:
    /// Exit status `timeout` uses when the limit expired
    static constexpr int kTimeoutExitCode = 124;

    /**
     * @brief Execute a command given as an argument vector
     * @param args Command arguments (first is the program, rest are arguments)
     * @param timeout_seconds Time limit in seconds, 0 for none
     * @return CommandResult with execution details
     *
     * Every argument is shell-escaped, so values are passed literally.
     */
    static CommandResult execute(const std::vector<std::string>& args, int timeout_seconds = 0);

    /**
     * @brief Execute a command from a single shell string
     * @param command Full command string to execute
     * @param timeout_seconds Time limit in seconds, 0 for none
     * @return CommandResult with execution details
     *
     * The string is interpreted by the shell, so pipes and redirection are
     * available but escaping is the caller's responsibility.
     */
    static CommandResult execute(const std::string& command, int timeout_seconds = 0);

    /**
     * @brief Check if a program is available on PATH
     * @param program Program name
     * @return true if `command -v` finds it
     */
    static bool isCommandAvailable(const std::string& program);

    /// Join arguments into one shell command line, escaping each of them
    static std::string argsToCommand(const std::vector<std::string>& args);

    /**
     * @brief Quote one argument for /bin/sh
     *
     * Plain words such as /conf/config.xml or root@192.168.123.1 come back
     * unchanged; anything else is wrapped in single quotes, with embedded
     * quotes spliced as '"'"'. The empty string becomes ''.
     */
    static std::string escapeShellArg(const std::string& arg);

private:
    /**
     * @brief Core execution method used by all public methods
     * @param command Shell command string
     * @param timeout_seconds Time limit in seconds, 0 for none
     * @return CommandResult with execution details
     *
     * Captures stdout through the pipe and stderr through a private
     * temporary file created with mkstemp().
     */
    static CommandResult executeInternal(const std::string& command, int timeout_seconds);
};

} // namespace macfence
