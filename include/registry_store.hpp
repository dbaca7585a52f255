/**
 * @file registry_store.hpp
 * @brief Persistence of the device list for macfence
 * @author macfence Development Team
 * @date 2026
 *
 * This file contains the RegistryStore class, which reads and writes the
 * line-oriented device file:
 *
 *     {id}|{name}<TAB>{original_mac}<TAB>
 *
 * one line per enabled device, ascending id, with a trailing newline. Every
 * write is preceded by a timestamped backup copy and performed as
 * write-to-temp followed by rename, so a crash never leaves a torn file.
 */

#pragma once

#include "device.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace macfence {

/**
 * @struct StoreLoadResult
 * @brief Devices parsed from the store plus one warning per skipped line
 *
 * Parsing is best-effort: a malformed line never aborts the load, it is
 * skipped and described in `warnings`.
 */
struct StoreLoadResult {
    std::vector<DeviceRecord> devices;
    std::vector<std::string> warnings;
};

/**
 * @class RegistryStore
 * @brief Reads, writes and backs up the device file
 *
 * The store does not cache anything; each load() re-reads the file. Writers
 * that need read-modify-write consistency across processes take the
 * advisory lock returned by lock() for the whole cycle.
 */
class RegistryStore {
public:
    /**
     * @class WriteLock
     * @brief Exclusive advisory lock on "<store>.lock", released on destruction
     */
    class WriteLock {
    public:
        explicit WriteLock(int fd) : fd_(fd) {}
        ~WriteLock();
        WriteLock(WriteLock&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
        WriteLock(const WriteLock&) = delete;
        WriteLock& operator=(const WriteLock&) = delete;
        WriteLock& operator=(WriteLock&&) = delete;

    private:
        int fd_;
    };

    /**
     * @brief Construct a store for the given file
     * @param store_path Path of the device file
     * @param backup_dir Backup directory; empty means "<store dir>/backups"
     */
    explicit RegistryStore(std::filesystem::path store_path,
                           std::filesystem::path backup_dir = {});

    /**
     * @brief Create the store directory and an empty store file if missing
     * @throws PersistError if the file cannot be created
     */
    void ensureExists() const;

    /**
     * @brief Load all devices from disk
     * @return Parsed devices and warnings; a missing file yields no devices
     * @throws PersistError if the file exists but cannot be read
     */
    StoreLoadResult load() const;

    /**
     * @brief Persist devices, replacing the store atomically
     * @param devices Devices to write; disabled devices are left out
     * @throws PersistError if the new content cannot be written or renamed
     *
     * The current file is first copied to the backup directory. A failed
     * backup is logged and does not prevent the write.
     */
    void save(const std::vector<DeviceRecord>& devices) const;

    /**
     * @brief Copy the current store into the backup directory
     * @return Path of the backup, or std::nullopt if there was nothing to
     *         back up or the copy failed (a warning is logged)
     */
    std::optional<std::filesystem::path> backup() const;

    /**
     * @brief Acquire the cross-process write lock
     * @return Lock held until the returned object is destroyed
     * @throws PersistError if the lock file cannot be opened or locked
     */
    WriteLock lock() const;

    /**
     * @brief Parse store content
     * @param content Full file content
     * @return Devices and warnings
     *
     * A line with fewer than two tab-separated fields, an invalid MAC, an
     * invalid name, or an id/MAC/name already used by an earlier line is
     * skipped with a warning. A missing or non-numeric id falls back to
     * the line number.
     */
    static StoreLoadResult parse(const std::string& content);

    /**
     * @brief Render devices in store format
     * @param devices Devices in any order
     * @return Enabled devices sorted by id, one line each, trailing newline
     */
    static std::string format(const std::vector<DeviceRecord>& devices);

    const std::filesystem::path& path() const { return store_path_; }
    const std::filesystem::path& backupDirectory() const { return backup_dir_; }

private:
    std::filesystem::path store_path_;
    std::filesystem::path backup_dir_;
};

} // namespace macfence
