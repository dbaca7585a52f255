/**
 * @file reconciler.hpp
 * @brief Pushes the device registry onto the firewall as an alias + block rule
 * @author macfence Development Team
 * @date 2026
 *
 * A reconciliation pass is one synchronous call:
 *
 *   backup → fetch → parse → patch → serialize → push → apply
 *
 * Each pass either completes or stops at the first failing stage and
 * records a ReconcileFailure. Nothing is retried inside a pass.
 */

#pragma once

#include "config.hpp"
#include "device_registry.hpp"
#include "firewall_config.hpp"
#include "firewall_transport.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace macfence {

enum class ReconcileStage {
    Idle,
    BackingUp,
    FetchingRemote,
    Patching,
    Serializing,
    Pushing,
    Applying,
    Done
};

enum class ReconcileError {
    None,
    NoEnabledDevices,    ///< Nothing to block; the firewall was not contacted
    RemoteBackupFailed,  ///< Copying config.xml aside failed; nothing was changed
    RemoteFetchFailed,
    MalformedDocument,
    RuleNotFound,        ///< Enforcement toggled before the block rule exists
    RemotePushFailed,
    ApplyExhausted       ///< Every hard apply step failed
};

std::string reconcileStageToString(ReconcileStage stage);
std::string reconcileErrorToString(ReconcileError error);

/**
 * @struct ReconcileFailure
 * @brief Why and where the last pass stopped
 */
struct ReconcileFailure {
    ReconcileError error = ReconcileError::None;
    ReconcileStage stage = ReconcileStage::Idle;
    std::string message;

    bool hasError() const { return error != ReconcileError::None; }

    /// "<Stage>: <message>", empty without an error
    std::string toString() const;
};

/**
 * @struct FirewallStatus
 * @brief Read-only view of the enforcement state on the firewall
 */
struct FirewallStatus {
    bool alias_exists = false;
    bool rule_exists = false;
    bool rule_enabled = false;
    std::size_t device_count = 0;   ///< Enabled devices in the local registry
    bool controls_active = false;   ///< alias_exists && rule_exists && rule_enabled
    std::string last_checked;
};

/**
 * @class Reconciler
 * @brief Applies the registry to the firewall configuration document
 *
 * Operations return false on failure and leave the reason in
 * getLastFailure(). Passes are serialized by an internal mutex, so a
 * Reconciler may be shared between threads.
 */
class Reconciler {
public:
    /**
     * @brief Construct a reconciler
     * @param registry Source of the enabled device list
     * @param transport Channel to the firewall
     * @param settings Remote paths, names and the apply chain
     */
    Reconciler(const DeviceRegistry& registry, FirewallTransport& transport, FirewallSettings settings);

    /**
     * @brief Write all enabled devices into the MAC alias
     * @return true if the alias was pushed and applied
     *
     * With no enabled devices the pass fails with NoEnabledDevices before
     * any remote command is run.
     */
    bool syncAlias();

    /**
     * @brief Create or rewrite the block rule that references the alias
     * @param enabled Initial enforcement state of the rule
     * @return true if the rule was pushed and applied
     */
    bool ensureBlockRule(bool enabled);

    /**
     * @brief Turn enforcement on or off by flipping the rule's disabled flag
     * @return true if the change was pushed and applied
     *
     * Fails with RuleNotFound when the rule does not exist yet;
     * ensureBlockRule() has to run first. No remote backup is taken.
     */
    bool setEnforcement(bool enabled);

    /**
     * @brief Fetch the remote configuration and report the enforcement state
     * @return The status, or std::nullopt if fetching or parsing failed
     */
    std::optional<FirewallStatus> status();

    /**
     * @brief Failure of the most recent operation
     */
    const ReconcileFailure& getLastFailure() const { return last_failure_; }

    /**
     * @brief Get error message from last operation
     * @return std::string Error message, empty if no error
     */
    std::string getLastError() const { return last_failure_.toString(); }

    const FirewallSettings& settings() const { return settings_; }

private:
    using Patch = std::function<bool(FirewallConfigDocument&)>;

    const DeviceRegistry& registry_;
    FirewallTransport& transport_;
    FirewallSettings settings_;
    ReconcileFailure last_failure_;
    std::mutex mutex_;

    bool runPass(const std::string& operation, bool backup_first, const Patch& patch);
    bool backupRemote();
    std::optional<FirewallConfigDocument> fetchDocument();
    bool pushDocument(const FirewallConfigDocument& document);
    bool runApplyChain();

    bool fail(ReconcileError error, ReconcileStage stage, const std::string& message);
    void clearFailure();
};

} // namespace macfence
