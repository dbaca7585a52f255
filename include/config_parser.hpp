/**
 * @file config_parser.hpp
 * @brief YAML configuration parsing for macfence
 * @author macfence Development Team
 * @date 2026
 *
 * This file contains the ConfigParser class responsible for turning YAML
 * configuration files into validated AppConfig objects and writing them
 * back out.
 */

#pragma once

#include "config.hpp"
#include <string>

namespace macfence {

/**
 * @class ConfigParser
 * @brief Reads and writes macfence.yaml
 *
 * Every key is optional; a missing section keeps its defaults. A loaded
 * configuration is validated before it is returned, and paths starting with
 * "~" are expanded against $HOME.
 */
class ConfigParser {
public:
    /**
     * @brief Load configuration from a YAML file
     * @param filename Path to the YAML configuration file
     * @return Parsed and validated configuration
     * @throws std::runtime_error if the file cannot be read, is not valid
     *         YAML, or fails validation
     */
    static AppConfig loadFromFile(const std::string& filename);

    /**
     * @brief Load configuration from YAML text
     * @throws std::runtime_error on bad YAML or invalid settings
     *
     * An empty string yields the built-in defaults.
     */
    static AppConfig loadFromString(const std::string& yaml_content);

    /**
     * @brief Save configuration to a YAML file
     * @param config Configuration object to save
     * @param filename Path where to save the YAML file
     * @throws std::runtime_error if file cannot be written
     */
    static void saveToFile(const AppConfig& config, const std::string& filename);

private:
    static AppConfig finalize(AppConfig config);
};

} // namespace macfence
