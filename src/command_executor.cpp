#include "command_executor.hpp"
#include "logger.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace macfence {

namespace {

const char* const kComponent = "CommandExecutor";

// Removes the stderr capture file when execution leaves scope
class TempFileGuard {
public:
    explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!path_.empty()) {
            ::unlink(path_.c_str());
        }
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::string tempDirectory() {
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir != nullptr && *tmpdir != '\0') {
        return tmpdir;
    }
    return "/tmp";
}

} // namespace

CommandResult CommandExecutor::execute(const std::vector<std::string>& args, int timeout_seconds) {
    if (args.empty()) {
        CommandResult result;
        result.success = false;
        result.exit_code = -1;
        result.stderr_output = "No command specified";
        result.command = "";
        return result;
    }

    return executeInternal(argsToCommand(args), timeout_seconds);
}

CommandResult CommandExecutor::execute(const std::string& command, int timeout_seconds) {
    if (command.empty()) {
        CommandResult result;
        result.stderr_output = "No command specified";
        return result;
    }
    return executeInternal(command, timeout_seconds);
}

bool CommandExecutor::isCommandAvailable(const std::string& program) {
    // 'command -v' is POSIX and also resolves shell builtins
    CommandResult result = executeInternal("command -v " + escapeShellArg(program) + " >/dev/null", 0);
    return result.isSuccess();
}

CommandResult CommandExecutor::executeInternal(const std::string& command, int timeout_seconds) {
    CommandResult result;
    result.command = command;

    Logger::debug(kComponent, "Executing command: " + command);

    // stderr is captured separately so that remote stdout (a whole XML
    // document) is never interleaved with ssh diagnostics
    std::string pattern = tempDirectory() + "/macfence_stderr_XXXXXX";
    std::vector<char> path_buffer(pattern.begin(), pattern.end());
    path_buffer.push_back('\0');
    int fd = ::mkstemp(path_buffer.data());
    if (fd < 0) {
        result.stderr_output = "Failed to create stderr capture file";
        Logger::error(kComponent, result.stderr_output + " for command: " + command);
        return result;
    }
    ::close(fd);
    TempFileGuard stderr_file(path_buffer.data());

    std::string shell_command;
    if (timeout_seconds > 0) {
        // -k: follow up with SIGKILL if the child ignores SIGTERM
        shell_command = "timeout -k 5 " + std::to_string(timeout_seconds) + " sh -c " +
                        escapeShellArg(command);
    } else {
        shell_command = "sh -c " + escapeShellArg(command);
    }
    shell_command += " 2>" + escapeShellArg(stderr_file.path()) + " </dev/null";

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(shell_command.c_str(), "r"), pclose);
    if (!pipe) {
        result.stderr_output = "Failed to execute command: " + command;
        Logger::error(kComponent, "Failed to create pipe for command: " + command);
        return result;
    }

    std::array<char, 4096> buffer;
    std::string output;
    size_t bytes_read;
    while ((bytes_read = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        output.append(buffer.data(), bytes_read);
    }

    int status = pclose(pipe.release());
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    std::ifstream stderr_stream(stderr_file.path());
    if (stderr_stream) {
        std::ostringstream stderr_content;
        stderr_content << stderr_stream.rdbuf();
        result.stderr_output = stderr_content.str();
    }

    // Remove trailing newlines from stderr; stdout is kept byte-exact
    while (!result.stderr_output.empty() && result.stderr_output.back() == '\n') {
        result.stderr_output.pop_back();
    }

    result.stdout_output = output;
    result.timed_out = timeout_seconds > 0 && result.exit_code == kTimeoutExitCode;
    result.success = (result.exit_code == 0);

    if (result.success) {
        Logger::debug(kComponent, "Command completed successfully (output: " +
                                  std::to_string(output.length()) + " bytes)");
    } else if (result.timed_out) {
        Logger::error(kComponent, "Command timed out after " + std::to_string(timeout_seconds) +
                                  "s: " + command);
    } else {
        Logger::debug(kComponent, "Command failed with exit code: " + std::to_string(result.exit_code));
        if (!result.stderr_output.empty()) {
            Logger::debug(kComponent, "Stderr: " + result.stderr_output);
        }
    }

    return result;
}

std::string CommandExecutor::argsToCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        return "";
    }

    std::ostringstream command;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            command << " ";
        }
        command << escapeShellArg(args[i]);
    }

    return command.str();
}

std::string CommandExecutor::escapeShellArg(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    // If argument contains no special characters, return as-is
    if (arg.find_first_of(" \t\n\r\"'\\$`|&;<>(){}[]?*~#!") == std::string::npos) {
        return arg;
    }

    // Escape argument with single quotes
    std::string escaped = "'";
    for (char c : arg) {
        if (c == '\'') {
            escaped += "'\"'\"'";  // End quote, escaped single quote, start quote
        } else {
            escaped += c;
        }
    }
    escaped += "'";

    return escaped;
}

} // namespace macfence
