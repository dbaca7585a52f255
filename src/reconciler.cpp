#include "reconciler.hpp"
#include "command_executor.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <ctime>
#include <filesystem>

namespace macfence {

namespace {

const char* const kComponent = "Reconciler";

std::string backupTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local);
    return buffer;
}

} // namespace

std::string reconcileStageToString(ReconcileStage stage) {
    switch (stage) {
        case ReconcileStage::Idle:
            return "Idle";
        case ReconcileStage::BackingUp:
            return "BackingUp";
        case ReconcileStage::FetchingRemote:
            return "FetchingRemote";
        case ReconcileStage::Patching:
            return "Patching";
        case ReconcileStage::Serializing:
            return "Serializing";
        case ReconcileStage::Pushing:
            return "Pushing";
        case ReconcileStage::Applying:
            return "Applying";
        case ReconcileStage::Done:
            return "Done";
    }
    return "Unknown";
}

std::string reconcileErrorToString(ReconcileError error) {
    switch (error) {
        case ReconcileError::None:
            return "None";
        case ReconcileError::NoEnabledDevices:
            return "NoEnabledDevices";
        case ReconcileError::RemoteBackupFailed:
            return "RemoteBackupFailed";
        case ReconcileError::RemoteFetchFailed:
            return "RemoteFetchFailed";
        case ReconcileError::MalformedDocument:
            return "MalformedDocument";
        case ReconcileError::RuleNotFound:
            return "RuleNotFound";
        case ReconcileError::RemotePushFailed:
            return "RemotePushFailed";
        case ReconcileError::ApplyExhausted:
            return "ApplyExhausted";
    }
    return "Unknown";
}

std::string ReconcileFailure::toString() const {
    if (!hasError()) {
        return "";
    }
    return reconcileErrorToString(error) + " during " + reconcileStageToString(stage) + ": " + message;
}

Reconciler::Reconciler(const DeviceRegistry& registry, FirewallTransport& transport, FirewallSettings settings)
    : registry_(registry)
    , transport_(transport)
    , settings_(std::move(settings)) {
}

bool Reconciler::fail(ReconcileError error, ReconcileStage stage, const std::string& message) {
    last_failure_.error = error;
    last_failure_.stage = stage;
    last_failure_.message = message;
    Logger::error(kComponent, last_failure_.toString());
    return false;
}

void Reconciler::clearFailure() {
    last_failure_ = ReconcileFailure();
}

bool Reconciler::syncAlias() {
    std::lock_guard<std::mutex> guard(mutex_);
    clearFailure();

    FirewallExport snapshot = registry_.exportSnapshot();
    if (snapshot.mac_list.empty()) {
        return fail(ReconcileError::NoEnabledDevices, ReconcileStage::Idle,
                    "No enabled devices to write into alias " + settings_.alias_name);
    }

    bool ok = runPass("sync alias", true, [&](FirewallConfigDocument& document) {
        document.upsertAlias(settings_.alias_name, snapshot.mac_list, snapshot.description);
        return true;
    });
    if (ok) {
        Logger::info(kComponent, "Alias " + settings_.alias_name + " now holds " +
                                 std::to_string(snapshot.mac_list.size()) + " device(s)");
        for (const auto& device : snapshot.devices) {
            Logger::debug(kComponent, "  " + device.name + ": " + device.mac);
        }
    }
    return ok;
}

bool Reconciler::ensureBlockRule(bool enabled) {
    std::lock_guard<std::mutex> guard(mutex_);
    clearFailure();

    bool ok = runPass("ensure block rule", true, [&](FirewallConfigDocument& document) {
        document.upsertBlockRule(settings_.alias_name, settings_.rule_marker, enabled,
                                 settings_.interface, settings_.legacy_substring_match);
        return true;
    });
    if (ok) {
        Logger::info(kComponent, "Block rule " + settings_.rule_marker + " in place (" +
                                 (enabled ? "enabled" : "disabled") + ")");
    }
    return ok;
}

bool Reconciler::setEnforcement(bool enabled) {
    std::lock_guard<std::mutex> guard(mutex_);
    clearFailure();

    bool ok = runPass("set enforcement", false, [&](FirewallConfigDocument& document) {
        if (!document.setRuleEnabled(settings_.rule_marker, enabled, settings_.legacy_substring_match)) {
            return fail(ReconcileError::RuleNotFound, ReconcileStage::Patching,
                        "No firewall rule matches '" + settings_.rule_marker +
                        "'; create it with setup first");
        }
        return true;
    });
    if (ok) {
        Logger::info(kComponent, std::string("Parental controls ") + (enabled ? "enabled" : "disabled"));
    }
    return ok;
}

std::optional<FirewallStatus> Reconciler::status() {
    std::lock_guard<std::mutex> guard(mutex_);
    clearFailure();

    std::optional<FirewallConfigDocument> document = fetchDocument();
    if (!document) {
        return std::nullopt;
    }

    FirewallStatus result;
    result.alias_exists = document->findAlias(settings_.alias_name) != nullptr;
    FirewallConfigDocument::Node rule = document->findRuleByMarker(settings_.rule_marker,
                                                                   settings_.legacy_substring_match);
    result.rule_exists = rule != nullptr;
    result.rule_enabled = result.rule_exists && FirewallConfigDocument::isRuleEnabled(rule);
    result.device_count = registry_.listEnabled().size();
    result.controls_active = result.alias_exists && result.rule_exists && result.rule_enabled;
    result.last_checked = currentIsoTimestamp();
    return result;
}

bool Reconciler::runPass(const std::string& operation, bool backup_first, const Patch& patch) {
    Logger::debug(kComponent, "Starting pass: " + operation + " on " + transport_.describe());

    if (backup_first && !backupRemote()) {
        return false;
    }

    std::optional<FirewallConfigDocument> document = fetchDocument();
    if (!document) {
        return false;
    }

    Logger::debug(kComponent, "Patching configuration");
    try {
        if (!patch(*document)) {
            return false;
        }
    } catch (const MalformedDocumentError& e) {
        return fail(ReconcileError::MalformedDocument, ReconcileStage::Patching, e.what());
    }

    if (!pushDocument(*document)) {
        return false;
    }

    if (!runApplyChain()) {
        return false;
    }

    Logger::debug(kComponent, "Pass finished: " + operation);
    return true;
}

bool Reconciler::backupRemote() {
    Logger::debug(kComponent, "Backing up remote configuration");

    std::filesystem::path config(settings_.config_path);
    std::filesystem::path backup = config.parent_path() /
                                   (settings_.backup_prefix + backupTimestamp() + ".xml");

    TransportResult result = transport_.run("cp " + CommandExecutor::escapeShellArg(config.string()) + " " +
                                            CommandExecutor::escapeShellArg(backup.string()));
    if (!result.ok) {
        return fail(ReconcileError::RemoteBackupFailed, ReconcileStage::BackingUp,
                    "Failed to backup configuration: " + result.output);
    }
    Logger::info(kComponent, "Remote configuration backed up to " + backup.string());
    return true;
}

std::optional<FirewallConfigDocument> Reconciler::fetchDocument() {
    Logger::debug(kComponent, "Fetching " + settings_.config_path);

    TransportResult result = transport_.run("cat " + CommandExecutor::escapeShellArg(settings_.config_path));
    if (!result.ok) {
        fail(ReconcileError::RemoteFetchFailed, ReconcileStage::FetchingRemote,
             "Failed to get configuration: " + result.output);
        return std::nullopt;
    }
    if (result.output.empty()) {
        fail(ReconcileError::RemoteFetchFailed, ReconcileStage::FetchingRemote,
             "Remote configuration is empty");
        return std::nullopt;
    }

    try {
        return FirewallConfigDocument::parse(result.output);
    } catch (const MalformedDocumentError& e) {
        fail(ReconcileError::MalformedDocument, ReconcileStage::FetchingRemote, e.what());
        return std::nullopt;
    }
}

bool Reconciler::pushDocument(const FirewallConfigDocument& document) {
    std::string content;
    try {
        content = document.serialize();
    } catch (const MalformedDocumentError& e) {
        return fail(ReconcileError::MalformedDocument, ReconcileStage::Serializing, e.what());
    }

    Logger::debug(kComponent, "Pushing " + std::to_string(content.size()) + " bytes to " +
                              settings_.staging_path);
    if (!transport_.pushFile(content, settings_.staging_path)) {
        return fail(ReconcileError::RemotePushFailed, ReconcileStage::Pushing,
                    "Failed to copy configuration to " + settings_.staging_path);
    }

    TransportResult moved = transport_.run("mv " + CommandExecutor::escapeShellArg(settings_.staging_path) + " " +
                                           CommandExecutor::escapeShellArg(settings_.config_path));
    if (!moved.ok) {
        return fail(ReconcileError::RemotePushFailed, ReconcileStage::Pushing,
                    "Failed to install configuration: " + moved.output);
    }
    return true;
}

bool Reconciler::runApplyChain() {
    bool applied = false;
    std::string last_output;

    for (const auto& step : settings_.apply) {
        // Once a hard step has succeeded only best-effort steps still run
        if (applied && !step.best_effort) {
            continue;
        }

        Logger::debug(kComponent, "Apply step " + step.name + ": " + step.command);
        TransportResult result = transport_.run(step.command);

        if (step.best_effort) {
            if (!result.ok) {
                Logger::warning(kComponent, "Apply step " + step.name + " failed: " + result.output);
            }
            continue;
        }

        if (result.ok) {
            Logger::info(kComponent, "Configuration applied via " + step.name);
            applied = true;
        } else {
            Logger::warning(kComponent, "Apply step " + step.name + " failed: " + result.output);
            last_output = result.output;
        }
    }

    if (!applied) {
        return fail(ReconcileError::ApplyExhausted, ReconcileStage::Applying,
                    "All apply steps failed; last error: " + last_output);
    }
    return true;
}

} // namespace macfence
