#include "cli_parser.hpp"
#include <stdexcept>
#include <getopt.h>

namespace macfence {

namespace {

struct CommandName {
    const char* word;
    CLIParser::Command command;
};

const CommandName kCommands[] = {
    {"list", CLIParser::Command::List},
    {"show", CLIParser::Command::Show},
    {"add", CLIParser::Command::Add},
    {"update", CLIParser::Command::Update},
    {"delete", CLIParser::Command::Delete},
    {"export", CLIParser::Command::Export},
    {"import", CLIParser::Command::Import},
    {"stats", CLIParser::Command::Stats},
    {"sync", CLIParser::Command::Sync},
    {"setup", CLIParser::Command::Setup},
    {"enable", CLIParser::Command::Enable},
    {"disable", CLIParser::Command::Disable},
    {"status", CLIParser::Command::Status},
    {"ping", CLIParser::Command::Ping},
    {"check", CLIParser::Command::Check},
};

void expectArgs(const std::string& command, const std::vector<std::string>& args, size_t count,
                const std::string& usage) {
    if (args.size() != count) {
        throw std::invalid_argument("'" + command + "' expects " + usage);
    }
}

} // namespace

CLIParser::Command CLIParser::parseCommand(const std::string& word) {
    for (const auto& entry : kCommands) {
        if (word == entry.word) {
            return entry.command;
        }
    }
    return Command::None;
}

std::string CLIParser::commandToString(Command command) {
    for (const auto& entry : kCommands) {
        if (entry.command == command) {
            return entry.word;
        }
    }
    return "none";
}

CLIParser::Options CLIParser::parse(int argc, char* argv[]) {
    Options options;

    static struct option long_options[] = {
        {"config",  required_argument, 0, 'c'},
        {"store",   required_argument, 0, 's'},
        {"name",    required_argument, 0, 'n'},
        {"mac",     required_argument, 0, 'm'},
        {"enable",  no_argument,       0, 'e'},
        {"disable", no_argument,       0, 'd'},
        {"verbose", no_argument,       0, 'v'},
        {"quiet",   no_argument,       0, 'q'},
        {"help",    no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // 0 makes glibc re-initialize its scan state, so parse() can run more than once
    optind = 0;

    int option_index = 0;
    int c;
    while ((c = getopt_long(argc, argv, "c:s:n:m:edvqh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                options.config_file = std::filesystem::path(optarg);
                break;
            case 's':
                options.store_file = std::string(optarg);
                break;
            case 'n':
                options.name = std::string(optarg);
                break;
            case 'm':
                options.mac = std::string(optarg);
                break;
            case 'e':
                options.enable = true;
                break;
            case 'd':
                options.disable = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                break;
            case '?':
                // getopt_long has already printed the offending option
                throw std::invalid_argument("Unknown option or missing option argument");
            default:
                throw std::invalid_argument("Invalid argument parsing");
        }
    }

    if (options.help) {
        return options;
    }

    if (optind >= argc) {
        throw std::invalid_argument("No command specified");
    }

    std::string word = argv[optind];
    options.command = parseCommand(word);
    if (options.command == Command::None) {
        throw std::invalid_argument("Unknown command: " + word);
    }

    std::vector<std::string> args(argv + optind + 1, argv + argc);
    validateOptions(options, args);

    return options;
}

int CLIParser::parseDeviceId(const std::string& value) {
    size_t consumed = 0;
    int id = 0;
    try {
        id = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid device ID: " + value);
    }
    if (consumed != value.size() || id < 1) {
        throw std::invalid_argument("Invalid device ID: " + value);
    }
    return id;
}

void CLIParser::validateOptions(Options& options, const std::vector<std::string>& args) {
    const std::string command = commandToString(options.command);

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("--verbose conflicts with --quiet");
    }

    bool takes_fields = options.command == Command::Add || options.command == Command::Update;
    if (!takes_fields && (options.name || options.mac)) {
        throw std::invalid_argument("--name and --mac are only valid with 'add' and 'update'");
    }
    if (options.command != Command::Update && (options.enable || options.disable)) {
        throw std::invalid_argument("--enable and --disable are only valid with 'update'");
    }

    switch (options.command) {
        case Command::Show:
        case Command::Delete:
            expectArgs(command, args, 1, "a device ID");
            options.device_id = parseDeviceId(args[0]);
            break;

        case Command::Add:
            if (args.size() == 2) {
                if (options.name || options.mac) {
                    throw std::invalid_argument("'add' takes NAME MAC or --name/--mac, not both");
                }
                options.name = args[0];
                options.mac = args[1];
            } else if (!args.empty() || !options.name || !options.mac) {
                throw std::invalid_argument("'add' expects NAME MAC");
            }
            break;

        case Command::Update:
            expectArgs(command, args, 1, "a device ID");
            options.device_id = parseDeviceId(args[0]);
            if (options.enable && options.disable) {
                throw std::invalid_argument("--enable conflicts with --disable");
            }
            if (!options.name && !options.mac && !options.enable && !options.disable) {
                throw std::invalid_argument("'update' needs at least one of --name, --mac, --enable, --disable");
            }
            break;

        case Command::Import:
            expectArgs(command, args, 1, "a file name or '-' for standard input");
            options.import_source = args[0];
            break;

        case Command::None:
            throw std::invalid_argument("No command specified");

        default:
            expectArgs(command, args, 0, "no arguments");
            break;
    }
}

void CLIParser::printUsage(const std::string& program_name, std::ostream& out) {
    out << "Usage: " << program_name << " [OPTIONS] COMMAND [ARGS]\n\n";
    out << "Manage parental-control devices and push them to an OPNsense firewall\n\n";
    out << "Device commands:\n";
    out << "  list                 List registered devices\n";
    out << "  show ID              Show one device\n";
    out << "  add NAME MAC         Register a device\n";
    out << "  update ID            Change a device (--name, --mac, --enable, --disable)\n";
    out << "  delete ID            Remove a device\n";
    out << "  export               Print the alias content for the firewall\n";
    out << "  import FILE|-        Import \"name,mac\" or \"id|name<TAB>mac\" lines\n";
    out << "  stats                Device counts\n\n";
    out << "Firewall commands:\n";
    out << "  sync                 Write enabled devices into the MAC alias\n";
    out << "  setup                Sync the alias and create the block rule (disabled)\n";
    out << "  enable               Sync the alias, then turn parental controls on\n";
    out << "  disable              Sync the alias, then turn parental controls off\n";
    out << "  status               Show alias/rule state on the firewall\n";
    out << "  ping                 Test the ssh connection\n";
    out << "  check                Check local ssh tooling and identity file\n\n";
    out << "Options:\n";
    out << "  -c, --config FILE    YAML configuration file\n";
    out << "  -s, --store FILE     Device store file (overrides the configuration)\n";
    out << "  -n, --name NAME      Device name for add/update\n";
    out << "  -m, --mac MAC        Device MAC for add/update\n";
    out << "  -e, --enable         update: enable the device\n";
    out << "  -d, --disable        update: disable the device (removes it from the store)\n";
    out << "  -v, --verbose        Debug logging\n";
    out << "  -q, --quiet          Only log errors\n";
    out << "  -h, --help           Show this help message\n\n";
    out << "Examples:\n";
    out << "  " << program_name << " add \"Kids Tablet\" aa-bb-cc-dd-ee-01\n";
    out << "  " << program_name << " -c /etc/macfence.yaml setup\n";
    out << "  " << program_name << " update 3 --name \"Switch\"\n";
    out << "  " << program_name << " enable\n";
}

} // namespace macfence
