/**
 * @file device.hpp
 * @brief Device record and input normalization for macfence
 * @author macfence Development Team
 * @date 2026
 *
 * A device is a named hardware address the operator wants the firewall to
 * block. This file holds the record type and the normalization rules every
 * MAC address and device name passes through before it is stored or
 * compared.
 */

#pragma once

#include <cstddef>
#include <string>

namespace macfence {

/// Longest device name kept after cleaning; longer names are truncated
constexpr std::size_t kMaxDeviceNameLength = 50;

/**
 * @struct DeviceRecord
 * @brief A single registered device
 *
 * `mac` is always canonical (XX:XX:XX:XX:XX:XX, upper case). `original_mac`
 * is the string the operator typed and is what the store file keeps.
 */
struct DeviceRecord {
    int id = 0;                   ///< Positive, unique, assigned as max(existing)+1
    std::string name;             ///< Cleaned name, unique ignoring case
    std::string mac;              ///< Canonical MAC address, unique
    std::string original_mac;     ///< Raw MAC as entered
    bool enabled = true;          ///< Only enabled devices are stored and synced
    std::string added_date;       ///< ISO-8601, informational
    std::string updated_date;     ///< ISO-8601, informational, empty if never updated
};

/**
 * @brief Normalize a MAC address to canonical form
 * @param raw MAC in any common notation (AA-BB-CC-DD-EE-FF, AABBCCDDEEFF, aa:bb:...)
 * @return Canonical "AA:BB:CC:DD:EE:FF"
 * @throws ValidationError (InvalidMacFormat) unless exactly 12 hex digits remain
 *
 * Every character that is not a hex digit is discarded first, so the
 * function is idempotent.
 */
std::string normalizeMac(const std::string& raw);

/**
 * @brief Check whether a MAC address normalizes successfully
 * @param raw MAC in any common notation
 * @return true if normalizeMac() would succeed
 */
bool isValidMac(const std::string& raw);

/**
 * @brief Clean a device name
 * @param raw Name as entered
 * @return Name with surrounding whitespace trimmed, characters outside
 *         [A-Za-z0-9_- ] and whitespace removed, truncated to 50 characters
 * @throws ValidationError (InvalidName) if nothing is left
 */
std::string normalizeName(const std::string& raw);

/**
 * @brief Case-insensitive name comparison used for duplicate detection
 */
bool namesEqual(const std::string& a, const std::string& b);

/**
 * @brief Current local time as ISO-8601 ("2026-01-31T14:05:09")
 */
std::string currentIsoTimestamp();

} // namespace macfence
