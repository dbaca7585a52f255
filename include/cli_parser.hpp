/**
 * @file cli_parser.hpp
 * @brief Command line argument parsing for macfence
 * @author macfence Development Team
 * @date 2026
 *
 * This file contains the CLIParser class responsible for parsing and validating
 * command line arguments for the macfence application.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace macfence {

/**
 * @class CLIParser
 * @brief Command line interface parser for macfence
 *
 * The CLIParser class provides static methods for parsing command line arguments,
 * validating option combinations, and displaying help information. It uses getopt_long
 * for option processing; the first positional argument selects the command.
 */
class CLIParser {
public:
    enum class Command {
        None,
        List,
        Show,
        Add,
        Update,
        Delete,
        Export,
        Import,
        Stats,
        Sync,
        Setup,
        Enable,
        Disable,
        Status,
        Ping,
        Check
    };

    /**
     * @struct Options
     * @brief Container for parsed command line options
     */
    struct Options {
        std::optional<std::filesystem::path> config_file; ///< Path to YAML configuration file
        std::optional<std::string> store_file;  ///< Overrides store.path from the configuration
        std::optional<std::string> name;        ///< -n, new device name
        std::optional<std::string> mac;         ///< -m, new device MAC
        bool enable = false;        ///< -e, update: enable the device
        bool disable = false;       ///< -d, update: disable (remove) the device
        bool verbose = false;       ///< Debug logging
        bool quiet = false;         ///< Errors only
        bool help = false;          ///< Display help information

        Command command = Command::None;
        int device_id = 0;          ///< show, update, delete
        std::string import_source;  ///< import: file path or "-" for stdin
    };

    /**
     * @brief Parse command line arguments into Options structure
     * @param argc Number of command line arguments
     * @param argv Array of command line argument strings
     * @return Parsed options structure
     * @throws std::invalid_argument if parsing fails or the combination is invalid
     *
     * Options may appear before or after the command
     * ("macfence update 3 -n Tablet").
     */
    static Options parse(int argc, char* argv[]);

    /**
     * @brief Map a command word to its Command value
     * @return Command::None for an unknown word
     */
    static Command parseCommand(const std::string& word);

    static std::string commandToString(Command command);

    /**
     * @brief Print usage information
     * @param program_name Name of the program executable
     * @param out Destination stream
     */
    static void printUsage(const std::string& program_name, std::ostream& out);

private:
    /**
     * @brief Check positional arguments and option combinations for the command
     * @param options Options with command set; device_id/import_source/name/mac are filled in
     * @param args Positional arguments after the command word
     * @throws std::invalid_argument if options are inconsistent
     */
    static void validateOptions(Options& options, const std::vector<std::string>& args);

    static int parseDeviceId(const std::string& value);
};

} // namespace macfence
