/**
 * @file device_registry.hpp
 * @brief Device CRUD, import and export for macfence
 * @author macfence Development Team
 * @date 2026
 *
 * This file contains the DeviceRegistry class, the validated front door to
 * the device store. Every read re-parses the store; every mutation runs as
 * lock → load → validate → write, so validation and conflict errors are
 * raised before anything is changed.
 */

#pragma once

#include "device.hpp"
#include "registry_store.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace macfence {

/// Alias name used on the firewall unless configured otherwise
constexpr const char* kDefaultAliasName = "ParentalControlMACs";

/**
 * @struct DeviceUpdate
 * @brief Partial update; unset fields are left untouched
 */
struct DeviceUpdate {
    std::optional<std::string> name;
    std::optional<std::string> mac;
    std::optional<bool> enabled;

    bool empty() const { return !name && !mac && !enabled; }
};

/**
 * @struct FirewallExport
 * @brief Snapshot of enabled devices in the shape the firewall alias needs
 */
struct FirewallExport {
    std::string alias_name;             ///< Name of the MAC alias
    std::string alias_type = "mac";     ///< Alias type on the firewall
    std::string description;            ///< "Parental Controls MAC Addresses (N devices)"
    std::vector<std::string> mac_list;  ///< Canonical MACs, store order
    std::vector<DeviceRecord> devices;  ///< Enabled devices

    /// MACs joined with newlines, the alias content format
    std::string content() const;
};

/**
 * @struct ImportResult
 * @brief Outcome of a bulk import
 */
struct ImportResult {
    int added_count = 0;
    std::vector<std::string> errors; ///< One "Line N: reason" entry per rejected line
};

struct DeviceStats {
    std::size_t total_devices = 0;
    std::size_t enabled_devices = 0;
    std::size_t disabled_devices = 0;
    std::string last_updated; ///< Latest updated/added timestamp, empty without devices
};

/**
 * @class DeviceRegistry
 * @brief Validated device list backed by a RegistryStore
 *
 * Mutations are serialized by an in-process mutex and by the store's
 * cross-process lock. The registry itself holds no device state.
 *
 * Disabled devices are not kept: the store only holds enabled devices, so
 * update(id, enabled=false) removes the device's line and releases its id.
 * Enabling a device again means adding it again, which assigns a new id.
 */
class DeviceRegistry {
public:
    explicit DeviceRegistry(RegistryStore& store, std::string alias_name = kDefaultAliasName);

    /**
     * @brief All devices in the store
     * @return Devices in store order; bad lines are skipped with a warning
     */
    std::vector<DeviceRecord> list() const;

    /**
     * @brief All devices plus the warnings produced while parsing
     */
    StoreLoadResult listWithWarnings() const;

    /**
     * @brief Only enabled devices (currently the same as list())
     */
    std::vector<DeviceRecord> listEnabled() const;

    /**
     * @brief Look up one device
     * @param id Device id
     * @return The device, or std::nullopt if absent
     */
    std::optional<DeviceRecord> get(int id) const;

    /**
     * @brief Register a new device
     * @param name Device name, cleaned by normalizeName()
     * @param mac MAC in any common notation
     * @return The stored record with its new id
     * @throws ValidationError on a bad name or MAC
     * @throws ConflictError (DuplicateMac, DuplicateName) if already registered
     * @throws PersistError if the store cannot be written
     */
    DeviceRecord add(const std::string& name, const std::string& mac);

    /**
     * @brief Change name, MAC and/or enabled state of a device
     * @param id Device id
     * @param changes Fields to change
     * @return The updated record
     * @throws NotFoundError if no device has this id
     * @throws ValidationError, ConflictError, PersistError as for add()
     *
     * Setting a device's MAC or name to its own current value is not a
     * conflict.
     */
    DeviceRecord update(int id, const DeviceUpdate& changes);

    /**
     * @brief Delete a device
     * @param id Device id
     * @throws NotFoundError if no device has this id
     * @throws PersistError if the store cannot be written
     */
    void remove(int id);

    /**
     * @brief Snapshot of enabled devices for the firewall alias; no side effects
     */
    FirewallExport exportSnapshot() const;

    /**
     * @brief Best-effort bulk import
     * @param text One device per line, "id|name<TAB>mac" or "name,mac"
     * @return Number of devices added and one error per rejected line
     *
     * Each line goes through add(); a failing line never stops the ones
     * after it and nothing is thrown.
     */
    ImportResult importText(const std::string& text);

    /**
     * @brief Device counts and the most recent change timestamp
     */
    DeviceStats stats() const;

    const std::string& aliasName() const { return alias_name_; }

private:
    RegistryStore& store_;
    std::string alias_name_;
    mutable std::mutex mutex_;

    static void checkConflicts(const std::vector<DeviceRecord>& devices,
                               int self_id,
                               const std::optional<std::string>& name,
                               const std::optional<std::string>& mac);
};

} // namespace macfence
