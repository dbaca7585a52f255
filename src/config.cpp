#include "config.hpp"
#include <algorithm>
#include <cctype>

namespace macfence {

std::vector<ApplyStep> defaultApplySteps() {
    return {
        {"restart-configd", "configctl webgui restart configd", true},
        {"filter-reload", "configctl filter reload", true},
        {"configure-firewall", "/usr/local/etc/rc.configure_firewall", false},
        {"filter-configure", "/usr/local/etc/rc.filter_configure", false},
    };
}

// ApplyStep implementation
bool ApplyStep::isValid() const {
    return getErrorMessage().empty();
}

std::string ApplyStep::getErrorMessage() const {
    if (command.empty()) {
        return "Apply step '" + name + "' has an empty command";
    }
    return "";
}

// StoreSettings implementation
bool StoreSettings::isValid() const {
    return !path.empty();
}

std::string StoreSettings::getErrorMessage() const {
    if (path.empty()) {
        return "Store path cannot be empty";
    }
    return "";
}

// FirewallSettings implementation
bool FirewallSettings::isValid() const {
    return getErrorMessage().empty();
}

std::string FirewallSettings::getErrorMessage() const {
    if (host.empty()) {
        return "Firewall host cannot be empty";
    }
    if (user.empty()) {
        return "Firewall user cannot be empty";
    }
    if (port < 1 || port > 65535) {
        return "Firewall port must be between 1-65535";
    }
    if (timeout_seconds < 1) {
        return "Timeout must be at least 1 second";
    }
    if (config_path.empty() || staging_path.empty()) {
        return "Remote config_path and staging_path cannot be empty";
    }
    if (config_path == staging_path) {
        return "staging_path must differ from config_path";
    }
    if (alias_name.empty()) {
        return "Alias name cannot be empty";
    }
    if (rule_marker.empty()) {
        return "Rule marker cannot be empty";
    }
    if (interface.empty()) {
        return "Interface cannot be empty";
    }

    bool has_hard_step = false;
    for (const auto& step : apply) {
        std::string error = step.getErrorMessage();
        if (!error.empty()) {
            return error;
        }
        if (!step.best_effort) {
            has_hard_step = true;
        }
    }
    if (!has_hard_step) {
        return "Apply chain needs at least one step that is not best_effort";
    }
    return "";
}

// AppConfig implementation
bool AppConfig::isValid() const {
    return store.isValid() && firewall.isValid();
}

std::string AppConfig::getErrorMessage() const {
    std::string error = store.getErrorMessage();
    if (!error.empty()) {
        return "Store section: " + error;
    }
    error = firewall.getErrorMessage();
    if (!error.empty()) {
        return "Firewall section: " + error;
    }
    return "";
}

} // namespace macfence

// YAML conversion implementations
namespace YAML {

using namespace macfence;

namespace {

template<typename T>
void readOptional(const Node& node, const char* key, T& field) {
    if (node[key]) {
        field = node[key].as<T>();
    }
}

} // namespace

// LogLevel conversion
Node convert<LogLevel>::encode(const LogLevel& level) {
    std::string name = Logger::logLevelToString(level);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return Node(name);
}

bool convert<LogLevel>::decode(const Node& node, LogLevel& level) {
    if (!node.IsScalar()) return false;
    return Logger::parseLogLevel(node.as<std::string>(), level);
}

// ApplyStep conversion
Node convert<ApplyStep>::encode(const ApplyStep& step) {
    Node node;
    node["name"] = step.name;
    node["command"] = step.command;
    if (step.best_effort) {
        node["best_effort"] = true;
    }
    return node;
}

bool convert<ApplyStep>::decode(const Node& node, ApplyStep& step) {
    if (!node.IsMap() || !node["command"]) return false;

    step.command = node["command"].as<std::string>();
    step.name = node["name"] ? node["name"].as<std::string>() : step.command;
    step.best_effort = node["best_effort"] ? node["best_effort"].as<bool>() : false;
    return true;
}

// StoreSettings conversion
Node convert<StoreSettings>::encode(const StoreSettings& settings) {
    Node node;
    node["path"] = settings.path;
    if (!settings.backup_dir.empty()) {
        node["backup_dir"] = settings.backup_dir;
    }
    return node;
}

bool convert<StoreSettings>::decode(const Node& node, StoreSettings& settings) {
    if (node.IsNull()) return true;
    if (!node.IsMap()) return false;

    readOptional(node, "path", settings.path);
    readOptional(node, "backup_dir", settings.backup_dir);
    return true;
}

// FirewallSettings conversion
Node convert<FirewallSettings>::encode(const FirewallSettings& settings) {
    Node node;
    node["host"] = settings.host;
    node["user"] = settings.user;
    node["port"] = settings.port;
    node["identity_file"] = settings.identity_file;
    node["timeout"] = settings.timeout_seconds;
    node["config_path"] = settings.config_path;
    node["staging_path"] = settings.staging_path;
    node["backup_prefix"] = settings.backup_prefix;
    node["alias_name"] = settings.alias_name;
    node["rule_marker"] = settings.rule_marker;
    node["interface"] = settings.interface;
    node["legacy_substring_match"] = settings.legacy_substring_match;
    for (const auto& step : settings.apply) {
        node["apply"].push_back(step);
    }
    return node;
}

bool convert<FirewallSettings>::decode(const Node& node, FirewallSettings& settings) {
    if (node.IsNull()) return true;
    if (!node.IsMap()) return false;

    readOptional(node, "host", settings.host);
    readOptional(node, "user", settings.user);
    readOptional(node, "port", settings.port);
    readOptional(node, "identity_file", settings.identity_file);
    readOptional(node, "timeout", settings.timeout_seconds);
    readOptional(node, "config_path", settings.config_path);
    readOptional(node, "staging_path", settings.staging_path);
    readOptional(node, "backup_prefix", settings.backup_prefix);
    readOptional(node, "alias_name", settings.alias_name);
    readOptional(node, "rule_marker", settings.rule_marker);
    readOptional(node, "interface", settings.interface);
    readOptional(node, "legacy_substring_match", settings.legacy_substring_match);

    if (node["apply"]) {
        if (!node["apply"].IsSequence()) return false;
        settings.apply.clear();
        for (const auto& step_node : node["apply"]) {
            settings.apply.push_back(step_node.as<ApplyStep>());
        }
    }
    return true;
}

// AppConfig conversion
Node convert<AppConfig>::encode(const AppConfig& config) {
    Node node;
    node["log_level"] = config.log_level;
    node["store"] = config.store;
    node["firewall"] = config.firewall;
    return node;
}

bool convert<AppConfig>::decode(const Node& node, AppConfig& config) {
    // An empty document means "all defaults"
    if (node.IsNull()) return true;
    if (!node.IsMap()) return false;

    readOptional(node, "log_level", config.log_level);
    if (node["store"]) {
        config.store = node["store"].as<StoreSettings>();
    }
    if (node["firewall"]) {
        config.firewall = node["firewall"].as<FirewallSettings>();
    }
    return true;
}

} // namespace YAML
