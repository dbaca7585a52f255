/**
 * @file system_utils.hpp
 * @brief Host environment checks for macfence
 * @author macfence Development Team
 * @date 2026
 *
 * This file contains the SystemUtils class responsible for checking that the
 * local machine can talk to the firewall at all: the ssh tool chain is
 * installed and the identity file is readable.
 */

#pragma once

#include "config.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace macfence {

/**
 * @class SystemUtils
 * @brief Static helpers for the host side of the ssh link
 */
class SystemUtils {
public:
    /**
     * @brief Name of the user macfence runs as
     * @return String containing the current username, "unknown" if unresolvable
     */
    static std::string getCurrentUser();

    /**
     * @brief Expand a leading "~" or "~/" to $HOME
     * @param path Path as written in the configuration
     * @return Expanded path; unchanged if it has no leading "~" or HOME is unset
     *
     * "~user" forms are left untouched.
     */
    static std::string expandHome(const std::string& path);

    /**
     * @brief Check that a file exists and can be opened for reading
     */
    static bool isReadableFile(const std::string& path);

    /**
     * @brief Validate everything the ssh transport needs on this host
     * @param settings Firewall settings (identity file)
     * @return Vector of error messages, empty if all requirements are met
     *
     * Checks that ssh, scp and timeout are on PATH and that the identity
     * file, when one is configured, is readable.
     */
    static std::vector<std::string> validateSystemRequirements(const FirewallSettings& settings);

    /**
     * @brief Print user, working directory and resolved settings
     * @param out Destination stream
     * @param config Effective configuration
     */
    static void printSystemInfo(std::ostream& out, const AppConfig& config);
};

} // namespace macfence
