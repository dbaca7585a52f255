#include "config_parser.hpp"
#include "system_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace macfence {

AppConfig ConfigParser::finalize(AppConfig config) {
    if (!config.isValid()) {
        throw std::runtime_error("Invalid configuration: " + config.getErrorMessage());
    }

    config.store.path = SystemUtils::expandHome(config.store.path);
    config.store.backup_dir = SystemUtils::expandHome(config.store.backup_dir);
    config.firewall.identity_file = SystemUtils::expandHome(config.firewall.identity_file);
    return config;
}

AppConfig ConfigParser::loadFromFile(const std::string& filename) {
    try {
        // LoadFile throws YAML::BadFile for a missing or unreadable file
        YAML::Node yamlNode = YAML::LoadFile(filename);
        return finalize(yamlNode.as<AppConfig>());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error in " + filename + ": " + std::string(e.what()));
    } catch (const std::exception& e) {
        throw std::runtime_error("Configuration loading error: " + std::string(e.what()));
    }
}

AppConfig ConfigParser::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yamlNode = YAML::Load(yaml_content);
        return finalize(yamlNode.as<AppConfig>());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    } catch (const std::exception& e) {
        throw std::runtime_error("Configuration loading error: " + std::string(e.what()));
    }
}

void ConfigParser::saveToFile(const AppConfig& config, const std::string& filename) {
    try {
        YAML::Node yamlNode = YAML::convert<AppConfig>::encode(config);

        std::ofstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Unable to open file for writing: " + filename);
        }
        file << yamlNode << '\n';
        if (!file) {
            throw std::runtime_error("Failed to write " + filename);
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Configuration saving error: " + std::string(e.what()));
    }
}

} // namespace macfence
