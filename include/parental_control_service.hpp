/**
 * @file parental_control_service.hpp
 * @brief Process-wide entry point for device management and firewall sync
 * @author macfence Development Team
 * @date 2026
 *
 * ParentalControlService owns every collaborator (store, registry, transport,
 * reconciler) and is the only API that front ends call. One instance is
 * built per process from an AppConfig and passed to whoever needs it.
 */

#pragma once

#include "config.hpp"
#include "device_registry.hpp"
#include "firewall_transport.hpp"
#include "reconciler.hpp"
#include "registry_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace macfence {

/**
 * @class ParentalControlService
 * @brief Device CRUD plus firewall reconciliation behind one object
 *
 * Registry operations throw the MacfenceError family. Firewall operations
 * return false / std::nullopt and leave the reason in
 * lastFirewallFailure().
 */
class ParentalControlService {
public:
    /**
     * @brief Build the service
     * @param config Effective configuration
     * @param transport Firewall channel; null creates an SshTransport from
     *        config.firewall
     * @throws PersistError if the store file cannot be created
     */
    explicit ParentalControlService(AppConfig config,
                                    std::unique_ptr<FirewallTransport> transport = nullptr);

    ParentalControlService(const ParentalControlService&) = delete;
    ParentalControlService& operator=(const ParentalControlService&) = delete;

    // Device registry
    std::vector<DeviceRecord> listDevices() const;
    StoreLoadResult listDevicesWithWarnings() const;
    std::optional<DeviceRecord> getDevice(int id) const;
    DeviceRecord addDevice(const std::string& name, const std::string& mac);
    DeviceRecord updateDevice(int id, const DeviceUpdate& changes);
    void deleteDevice(int id);
    FirewallExport exportForFirewall() const;
    ImportResult importFromText(const std::string& text);
    DeviceStats getStats() const;

    // Firewall
    /**
     * @brief Write the enabled devices into the firewall alias
     */
    bool syncToFirewall();

    /**
     * @brief First-time setup: sync the alias, then create the block rule
     *        disabled so that enforcement stays off until enabled
     */
    bool setupFirewall();

    /// Flip the block rule only; the alias is left as it is
    bool setEnforcement(bool enabled);

    /**
     * @brief Sync the alias, then switch the block rule on or off
     *
     * Enforcement never goes live against a stale device list. Turning
     * controls off still succeeds with an empty registry, in which case the
     * alias is left untouched.
     */
    bool toggleControls(bool enabled);
    std::optional<FirewallStatus> getStatus();

    /**
     * @brief Run a harmless command on the firewall
     * @return Transport result; output is the echoed text on success
     */
    TransportResult testConnection();

    const ReconcileFailure& lastFirewallFailure() const { return reconciler_.getLastFailure(); }

    const AppConfig& config() const { return config_; }
    FirewallTransport& transport() { return *transport_; }

private:
    AppConfig config_;
    RegistryStore store_;
    DeviceRegistry registry_;
    std::unique_ptr<FirewallTransport> transport_;
    Reconciler reconciler_;
};

} // namespace macfence
