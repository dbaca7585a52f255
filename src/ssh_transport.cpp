#include "ssh_transport.hpp"
#include "command_executor.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace macfence {

namespace {

const char* const kComponent = "SshTransport";

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n\f\v";
    size_t start = value.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

std::string failureDescription(const CommandResult& result) {
    if (result.timed_out) {
        return "Command timed out";
    }
    std::string reason = trim(result.stderr_output);
    if (reason.empty()) {
        reason = trim(result.stdout_output);
    }
    if (reason.empty()) {
        reason = "exit code " + std::to_string(result.exit_code);
    }
    return reason;
}

} // namespace

SshTransport::SshTransport(SshSettings settings)
    : settings_(std::move(settings)) {
}

std::vector<std::string> SshTransport::commonOptions() const {
    std::vector<std::string> options;
    if (!settings_.identity_file.empty()) {
        options.push_back("-i");
        options.push_back(settings_.identity_file);
    }
    // Never prompt: a missing key must fail, not hang on a password prompt
    options.push_back("-o");
    options.push_back("BatchMode=yes");
    options.push_back("-o");
    options.push_back("ConnectTimeout=" + std::to_string(std::max(1, std::min(settings_.timeout_seconds, 15))));
    return options;
}

std::vector<std::string> SshTransport::buildSshCommand(const std::string& command) const {
    std::vector<std::string> args = {"ssh"};
    std::vector<std::string> options = commonOptions();
    args.insert(args.end(), options.begin(), options.end());
    args.push_back("-p");
    args.push_back(std::to_string(settings_.port));
    args.push_back(settings_.user + "@" + settings_.host);
    args.push_back(command);
    return args;
}

std::vector<std::string> SshTransport::buildScpCommand(const std::string& local_path,
                                                       const std::string& remote_path) const {
    std::vector<std::string> args = {"scp", "-q"};
    std::vector<std::string> options = commonOptions();
    args.insert(args.end(), options.begin(), options.end());
    args.push_back("-P");
    args.push_back(std::to_string(settings_.port));
    args.push_back(local_path);
    args.push_back(settings_.user + "@" + settings_.host + ":" + remote_path);
    return args;
}

TransportResult SshTransport::run(const std::string& command) {
    Logger::debug(kComponent, "Remote command on " + describe() + ": " + command);

    CommandResult result = CommandExecutor::execute(buildSshCommand(command), settings_.timeout_seconds);

    TransportResult transport_result;
    transport_result.ok = result.isSuccess();
    transport_result.output = transport_result.ok ? trim(result.stdout_output)
                                                  : failureDescription(result);
    if (!transport_result.ok) {
        Logger::debug(kComponent, result.getErrorMessage());
    }
    return transport_result;
}

bool SshTransport::pushFile(const std::string& content, const std::string& remote_path) {
    const char* tmpdir = std::getenv("TMPDIR");
    std::string pattern = std::string(tmpdir != nullptr && *tmpdir != '\0' ? tmpdir : "/tmp") +
                          "/macfence_push_XXXXXX";
    std::vector<char> path_buffer(pattern.begin(), pattern.end());
    path_buffer.push_back('\0');

    int fd = ::mkstemp(path_buffer.data());
    if (fd < 0) {
        Logger::error(kComponent, std::string("Unable to create temporary file: ") + std::strerror(errno));
        return false;
    }
    const std::string local_path = path_buffer.data();

    // Written with the mkstemp descriptor so the file stays private (0600)
    size_t written = 0;
    bool write_ok = true;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            write_ok = false;
            break;
        }
        written += static_cast<size_t>(n);
    }
    if (::close(fd) != 0) {
        write_ok = false;
    }

    bool pushed = false;
    if (!write_ok) {
        Logger::error(kComponent, "Failed to write temporary file " + local_path);
    } else {
        CommandResult result = CommandExecutor::execute(buildScpCommand(local_path, remote_path),
                                                        settings_.timeout_seconds);
        pushed = result.isSuccess();
        if (!pushed) {
            Logger::error(kComponent, "Failed to copy file to " + describe() + ":" + remote_path +
                                      ": " + failureDescription(result));
        }
    }

    ::unlink(local_path.c_str());
    return pushed;
}

std::string SshTransport::describe() const {
    return settings_.user + "@" + settings_.host + ":" + std::to_string(settings_.port);
}

} // namespace macfence
