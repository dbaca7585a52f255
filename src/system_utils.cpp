#include "system_utils.hpp"
#include "command_executor.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace macfence {

std::string SystemUtils::getCurrentUser() {
    uid_t uid = getuid();
    struct passwd* pw = getpwuid(uid);
    if (pw) {
        return std::string(pw->pw_name);
    }
    return "unknown";
}

std::string SystemUtils::expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;
    }

    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return path;
    }
    return std::string(home) + path.substr(1);
}

bool SystemUtils::isReadableFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    std::ifstream file(path);
    return file.is_open();
}

std::vector<std::string> SystemUtils::validateSystemRequirements(const FirewallSettings& settings) {
    std::vector<std::string> errors;

    // ssh/scp do the transport, timeout bounds every call
    for (const char* tool : {"ssh", "scp", "timeout"}) {
        if (!CommandExecutor::isCommandAvailable(tool)) {
            errors.push_back(std::string(tool) + " command not found in system PATH");
        }
    }
    if (!errors.empty()) {
        const char* path = std::getenv("PATH");
        if (path) {
            errors.push_back("Debug: Current PATH: " + std::string(path));
        }
    }

    if (!settings.identity_file.empty() && !isReadableFile(settings.identity_file)) {
        errors.push_back("Identity file is not readable: " + settings.identity_file);
        errors.push_back("Debug: running as user '" + getCurrentUser() + "'");
    }

    return errors;
}

void SystemUtils::printSystemInfo(std::ostream& out, const AppConfig& config) {
    out << "System Information:\n";
    out << "==================\n";
    out << "User: " << getCurrentUser() << "\n";

    try {
        out << "Working directory: " << std::filesystem::current_path().string() << "\n";
    } catch (const std::filesystem::filesystem_error&) {
        out << "Working directory: <unable to determine>\n";
    }

    out << "Device store: " << config.store.path << "\n";
    out << "Firewall: " << config.firewall.user << "@" << config.firewall.host
        << ":" << config.firewall.port << "\n";
    out << "Identity file: "
        << (config.firewall.identity_file.empty() ? "<ssh default>" : config.firewall.identity_file)
        << "\n";
    out << "\n";
}

} // namespace macfence
