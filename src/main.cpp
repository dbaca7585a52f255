#include <iostream>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <filesystem>
#include "cli_parser.hpp"
#include "config_parser.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "parental_control_service.hpp"
#include "system_utils.hpp"

namespace {

using macfence::CLIParser;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInvalid = 3;
constexpr int kExitNotFound = 4;
constexpr int kExitPersist = 5;

void printDevice(const macfence::DeviceRecord& device) {
    std::cout << "ID:       " << device.id << "\n";
    std::cout << "Name:     " << device.name << "\n";
    std::cout << "MAC:      " << device.mac << "\n";
    std::cout << "Entered:  " << device.original_mac << "\n";
    std::cout << "Enabled:  " << (device.enabled ? "yes" : "no") << "\n";
}

int reportFirewallFailure(macfence::ParentalControlService& service) {
    std::cerr << "Error: " << service.lastFirewallFailure().toString() << std::endl;
    return kExitFailure;
}

std::string readImportSource(const std::string& source) {
    if (source == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(source);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open import file: " + source);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

int runCommand(macfence::ParentalControlService& service, const CLIParser::Options& options) {
    switch (options.command) {
        case CLIParser::Command::List: {
            auto devices = service.listDevices();
            if (devices.empty()) {
                std::cout << "No devices registered." << std::endl;
                return kExitOk;
            }
            for (const auto& device : devices) {
                std::cout << device.id << "\t" << device.mac << "\t" << device.name << "\n";
            }
            std::cout << std::flush;
            return kExitOk;
        }

        case CLIParser::Command::Show: {
            auto device = service.getDevice(options.device_id);
            if (!device) {
                throw macfence::NotFoundError("Device with ID " + std::to_string(options.device_id) +
                                              " not found");
            }
            printDevice(*device);
            return kExitOk;
        }

        case CLIParser::Command::Add: {
            auto device = service.addDevice(*options.name, *options.mac);
            std::cout << "Added device " << device.id << ": " << device.name << " (" << device.mac << ")"
                      << std::endl;
            return kExitOk;
        }

        case CLIParser::Command::Update: {
            macfence::DeviceUpdate changes;
            changes.name = options.name;
            changes.mac = options.mac;
            if (options.enable) {
                changes.enabled = true;
            } else if (options.disable) {
                changes.enabled = false;
            }
            auto device = service.updateDevice(options.device_id, changes);
            if (device.enabled) {
                std::cout << "Updated device " << device.id << ": " << device.name << " (" << device.mac
                          << ")" << std::endl;
            } else {
                std::cout << "Disabled device " << device.id << ": " << device.name
                          << " (removed from the store; add it again to re-enable)" << std::endl;
            }
            return kExitOk;
        }

        case CLIParser::Command::Delete:
            service.deleteDevice(options.device_id);
            std::cout << "Deleted device " << options.device_id << std::endl;
            return kExitOk;

        case CLIParser::Command::Export: {
            auto snapshot = service.exportForFirewall();
            std::cout << "# " << snapshot.alias_name << " (" << snapshot.alias_type << "): "
                      << snapshot.description << "\n";
            for (const auto& mac : snapshot.mac_list) {
                std::cout << mac << "\n";
            }
            std::cout << std::flush;
            return kExitOk;
        }

        case CLIParser::Command::Import: {
            auto result = service.importFromText(readImportSource(options.import_source));
            std::cout << "Imported " << result.added_count << " device(s)" << std::endl;
            for (const auto& error : result.errors) {
                std::cerr << "  " << error << "\n";
            }
            std::cerr << std::flush;
            return result.errors.empty() ? kExitOk : kExitInvalid;
        }

        case CLIParser::Command::Stats: {
            auto stats = service.getStats();
            std::cout << "total_devices: " << stats.total_devices << "\n";
            std::cout << "enabled_devices: " << stats.enabled_devices << "\n";
            std::cout << "disabled_devices: " << stats.disabled_devices << "\n";
            std::cout << "last_updated: " << (stats.last_updated.empty() ? "-" : stats.last_updated)
                      << std::endl;
            return kExitOk;
        }

        case CLIParser::Command::Sync:
            if (!service.syncToFirewall()) {
                return reportFirewallFailure(service);
            }
            std::cout << "Firewall alias " << service.config().firewall.alias_name << " updated." << std::endl;
            return kExitOk;

        case CLIParser::Command::Setup:
            if (!service.setupFirewall()) {
                return reportFirewallFailure(service);
            }
            std::cout << "Parental controls set up (rule created disabled; run 'enable' to activate)."
                      << std::endl;
            return kExitOk;

        case CLIParser::Command::Enable:
        case CLIParser::Command::Disable: {
            bool enable = options.command == CLIParser::Command::Enable;
            if (!service.toggleControls(enable)) {
                return reportFirewallFailure(service);
            }
            std::cout << "Parental controls " << (enable ? "enabled" : "disabled") << "." << std::endl;
            return kExitOk;
        }

        case CLIParser::Command::Status: {
            auto status = service.getStatus();
            if (!status) {
                return reportFirewallFailure(service);
            }
            std::cout << "alias_exists: " << (status->alias_exists ? "true" : "false") << "\n";
            std::cout << "rule_exists: " << (status->rule_exists ? "true" : "false") << "\n";
            std::cout << "rule_enabled: " << (status->rule_enabled ? "true" : "false") << "\n";
            std::cout << "device_count: " << status->device_count << "\n";
            std::cout << "controls_active: " << (status->controls_active ? "true" : "false") << "\n";
            std::cout << "last_checked: " << status->last_checked << std::endl;
            return kExitOk;
        }

        case CLIParser::Command::Ping: {
            auto result = service.testConnection();
            if (!result.ok) {
                std::cerr << "Connection to " << service.transport().describe() << " failed: "
                          << result.output << std::endl;
                return kExitFailure;
            }
            std::cout << "Connected to " << service.transport().describe() << ": " << result.output
                      << std::endl;
            return kExitOk;
        }

        case CLIParser::Command::Check:
        case CLIParser::Command::None:
            break;
    }

    std::cerr << "Internal error: command not handled." << std::endl;
    return kExitFailure;
}

} // namespace

int main(int argc, char* argv[]) {
    // stdout carries command output only; all logging goes to stderr
    macfence::Logger::setInfoStream(std::cerr);

    try {
        auto options = CLIParser::parse(argc, argv);

        if (options.help) {
            CLIParser::printUsage(argv[0], std::cout);
            return kExitOk;
        }

        // Without -c every setting has its built-in default
        macfence::AppConfig config = options.config_file
            ? macfence::ConfigParser::loadFromFile(options.config_file->string())
            : macfence::ConfigParser::loadFromString("");

        if (options.store_file) {
            config.store.path = macfence::SystemUtils::expandHome(*options.store_file);
        }

        macfence::LogLevel level = config.log_level;
        if (options.verbose) {
            level = macfence::LogLevel::Debug;
        } else if (options.quiet) {
            level = macfence::LogLevel::Error;
        }
        macfence::Logger::setLogLevel(level);

        if (options.command == CLIParser::Command::Check) {
            macfence::SystemUtils::printSystemInfo(std::cout, config);
            auto errors = macfence::SystemUtils::validateSystemRequirements(config.firewall);
            if (!errors.empty()) {
                for (const auto& error : errors) {
                    std::cerr << error << "\n";
                }
                std::cerr << "\nSystem validation failed." << std::endl;
                return kExitFailure;
            }
            std::cout << "System validation passed." << std::endl;
            return kExitOk;
        }

        macfence::ParentalControlService service(config);
        return runCommand(service, options);

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help for usage information." << std::endl;
        return kExitUsage;
    } catch (const macfence::ValidationError& e) {
        std::cerr << "Invalid input [" << macfence::errorCodeToString(e.code()) << "]: " << e.what()
                  << std::endl;
        return kExitInvalid;
    } catch (const macfence::ConflictError& e) {
        std::cerr << "Conflict [" << macfence::errorCodeToString(e.code()) << "]: " << e.what()
                  << std::endl;
        return kExitInvalid;
    } catch (const macfence::NotFoundError& e) {
        std::cerr << "Not found [" << macfence::errorCodeToString(e.code()) << "]: " << e.what()
                  << std::endl;
        return kExitNotFound;
    } catch (const macfence::PersistError& e) {
        std::cerr << "Storage error [" << macfence::errorCodeToString(e.code()) << "]: " << e.what()
                  << std::endl;
        std::cerr << "The device list may not have been changed." << std::endl;
        return kExitPersist;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "File system error: " << e.what() << std::endl;
        return kExitFailure;
    } catch (const std::runtime_error& e) {
        std::cerr << "Runtime error: " << e.what() << std::endl;
        return kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return kExitFailure;
    }
}
