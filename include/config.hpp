/**
 * @file config.hpp
 * @brief Configuration structures and YAML serialization for macfence
 * @author macfence Development Team
 * @date 2026
 *
 * This file contains the configuration model for macfence: where the device
 * store lives, how to reach the firewall, which names the alias and block
 * rule carry, and the ordered list of commands that make a pushed
 * configuration take effect. It also provides YAML serialization through
 * yaml-cpp template specializations.
 *
 * Every key is optional. A default-constructed AppConfig reproduces the
 * stock household setup (OPNsense at 192.168.123.1, root over ssh).
 */

#pragma once

#include "logger.hpp"
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace macfence {

/**
 * @struct ApplyStep
 * @brief One command of the apply fallback chain
 *
 * Best-effort steps always run and only warn when they fail. Hard steps
 * are tried in order until one succeeds.
 */
struct ApplyStep {
    std::string name;          ///< Label used in logs ("filter-reload")
    std::string command;       ///< Remote shell command
    bool best_effort = false;  ///< Failure is a warning, never a pass failure

    bool isValid() const;
    std::string getErrorMessage() const;
};

/**
 * @brief The stock OPNsense apply chain
 * @return configd restart and filter reload (best effort), then
 *         rc.configure_firewall and rc.filter_configure
 */
std::vector<ApplyStep> defaultApplySteps();

/**
 * @struct StoreSettings
 * @brief Location of the device store and its backups
 */
struct StoreSettings {
    std::string path = "mac_addresses/mac_addresses.txt";
    std::string backup_dir;  ///< Empty means "<store dir>/backups"

    bool isValid() const;
    std::string getErrorMessage() const;
};

/**
 * @struct FirewallSettings
 * @brief Everything needed to reach and patch the firewall
 */
struct FirewallSettings {
    std::string host = "192.168.123.1";
    std::string user = "root";
    int port = 22;
    std::string identity_file = "~/.ssh/id_ed25519_opnsense";
    int timeout_seconds = 30;  ///< Per remote command ("timeout" in YAML)

    std::string config_path = "/conf/config.xml";
    std::string staging_path = "/tmp/new_config.xml";
    std::string backup_prefix = "config_backup_parental_controls_";

    std::string alias_name = "ParentalControlMACs";
    std::string rule_marker = "ParentalControlBlock";
    std::string interface = "lan";
    bool legacy_substring_match = true;

    std::vector<ApplyStep> apply = defaultApplySteps();

    /**
     * @brief Validate the firewall settings
     * @return true if host, paths and names are usable and the apply
     *         chain contains at least one hard step
     */
    bool isValid() const;

    /**
     * @brief Get detailed error message for invalid settings
     * @return Human-readable error description or empty string if valid
     */
    std::string getErrorMessage() const;
};

/**
 * @struct AppConfig
 * @brief Root configuration structure for macfence
 */
struct AppConfig {
    LogLevel log_level = LogLevel::Info;
    StoreSettings store;
    FirewallSettings firewall;

    bool isValid() const;
    std::string getErrorMessage() const;
};

}  // namespace macfence

/**
 * @namespace YAML
 * @brief YAML serialization template specializations
 */
namespace YAML {

/**
 * @brief YAML conversion for LogLevel enum
 *
 * Accepts "none", "error", "warning", "info" and "debug".
 */
template<>
struct convert<macfence::LogLevel> {
    static Node encode(const macfence::LogLevel& level);
    static bool decode(const Node& node, macfence::LogLevel& level);
};

template<>
struct convert<macfence::ApplyStep> {
    static Node encode(const macfence::ApplyStep& step);
    static bool decode(const Node& node, macfence::ApplyStep& step);
};

template<>
struct convert<macfence::StoreSettings> {
    static Node encode(const macfence::StoreSettings& settings);
    static bool decode(const Node& node, macfence::StoreSettings& settings);
};

/**
 * @brief YAML conversion for FirewallSettings struct
 *
 * Missing keys keep their defaults. An explicit "apply" list replaces the
 * default apply chain entirely.
 */
template<>
struct convert<macfence::FirewallSettings> {
    static Node encode(const macfence::FirewallSettings& settings);
    static bool decode(const Node& node, macfence::FirewallSettings& settings);
};

template<>
struct convert<macfence::AppConfig> {
    /**
     * @brief Encode AppConfig to YAML node
     * @param config Root configuration to encode
     * @return YAML node containing the complete configuration
     */
    static Node encode(const macfence::AppConfig& config);

    /**
     * @brief Decode YAML node to AppConfig
     * @param node YAML map, or null for an empty file
     * @param config Output configuration
     * @return true if conversion successful
     */
    static bool decode(const Node& node, macfence::AppConfig& config);
};

}  // namespace YAML
