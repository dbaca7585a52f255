#include "cli_parser.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace macfence;
using Command = CLIParser::Command;

namespace {

// getopt_long may permute argv, so each call gets its own writable copies
CLIParser::Options parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "macfence");
    std::vector<std::vector<char>> buffers;
    for (const auto& arg : args) {
        buffers.emplace_back(arg.begin(), arg.end());
        buffers.back().push_back('\0');
    }
    std::vector<char*> argv;
    for (auto& buffer : buffers) {
        argv.push_back(buffer.data());
    }
    argv.push_back(nullptr);
    return CLIParser::parse(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST(CLIParserTest, ParsesSimpleCommands) {
    EXPECT_EQ(parseArgs({"list"}).command, Command::List);
    EXPECT_EQ(parseArgs({"export"}).command, Command::Export);
    EXPECT_EQ(parseArgs({"stats"}).command, Command::Stats);
    EXPECT_EQ(parseArgs({"sync"}).command, Command::Sync);
    EXPECT_EQ(parseArgs({"setup"}).command, Command::Setup);
    EXPECT_EQ(parseArgs({"enable"}).command, Command::Enable);
    EXPECT_EQ(parseArgs({"disable"}).command, Command::Disable);
    EXPECT_EQ(parseArgs({"status"}).command, Command::Status);
    EXPECT_EQ(parseArgs({"ping"}).command, Command::Ping);
    EXPECT_EQ(parseArgs({"check"}).command, Command::Check);
}

TEST(CLIParserTest, GlobalOptions) {
    CLIParser::Options options = parseArgs({"-c", "/etc/macfence.yaml", "--store", "/tmp/devices.txt",
                                            "-v", "list"});
    ASSERT_TRUE(options.config_file.has_value());
    EXPECT_EQ(options.config_file->string(), "/etc/macfence.yaml");
    ASSERT_TRUE(options.store_file.has_value());
    EXPECT_EQ(*options.store_file, "/tmp/devices.txt");
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.command, Command::List);
}

TEST(CLIParserTest, AddWithPositionalArguments) {
    CLIParser::Options options = parseArgs({"add", "Kids Tablet", "aa-bb-cc-dd-ee-01"});
    EXPECT_EQ(options.command, Command::Add);
    EXPECT_EQ(options.name, std::string("Kids Tablet"));
    EXPECT_EQ(options.mac, std::string("aa-bb-cc-dd-ee-01"));
}

TEST(CLIParserTest, AddWithOptions) {
    CLIParser::Options options = parseArgs({"add", "--name", "Switch", "-m", "AABBCCDDEE02"});
    EXPECT_EQ(options.name, std::string("Switch"));
    EXPECT_EQ(options.mac, std::string("AABBCCDDEE02"));
}

TEST(CLIParserTest, AddRejectsIncompleteOrMixedInput) {
    EXPECT_THROW(parseArgs({"add", "Only Name"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"add", "-n", "Switch"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"add", "-n", "Switch", "Tablet", "AABBCCDDEE02"}), std::invalid_argument);
}

TEST(CLIParserTest, UpdateTakesIdAndFields) {
    CLIParser::Options options = parseArgs({"update", "3", "-n", "Living Room"});
    EXPECT_EQ(options.command, Command::Update);
    EXPECT_EQ(options.device_id, 3);
    EXPECT_EQ(options.name, std::string("Living Room"));
    EXPECT_FALSE(options.mac.has_value());

    CLIParser::Options disable = parseArgs({"update", "--disable", "7"});
    EXPECT_EQ(disable.device_id, 7);
    EXPECT_TRUE(disable.disable);
}

TEST(CLIParserTest, UpdateValidation) {
    EXPECT_THROW(parseArgs({"update", "3"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"update", "-e", "-d", "3"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"update", "-n", "Tablet"}), std::invalid_argument);
}

TEST(CLIParserTest, DeviceIdMustBePositiveInteger) {
    EXPECT_EQ(parseArgs({"show", "12"}).device_id, 12);
    EXPECT_EQ(parseArgs({"delete", "1"}).device_id, 1);

    EXPECT_THROW(parseArgs({"show", "0"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"show", "abc"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"delete", "4x"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"delete"}), std::invalid_argument);
}

TEST(CLIParserTest, ImportSource) {
    EXPECT_EQ(parseArgs({"import", "-"}).import_source, "-");
    EXPECT_EQ(parseArgs({"import", "devices.csv"}).import_source, "devices.csv");
    EXPECT_THROW(parseArgs({"import"}), std::invalid_argument);
}

TEST(CLIParserTest, RejectsMisplacedOptions) {
    EXPECT_THROW(parseArgs({"list", "-n", "Tablet"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"sync", "--enable"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"-v", "-q", "list"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"list", "extra"}), std::invalid_argument);
}

TEST(CLIParserTest, RejectsMissingOrUnknownCommand) {
    EXPECT_THROW(parseArgs({}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"-v"}), std::invalid_argument);

    try {
        parseArgs({"frobnicate"});
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_EQ(std::string(e.what()), "Unknown command: frobnicate");
    }
}

TEST(CLIParserTest, HelpNeedsNoCommand) {
    CLIParser::Options options = parseArgs({"--help"});
    EXPECT_TRUE(options.help);
    EXPECT_EQ(options.command, Command::None);
}

TEST(CLIParserTest, CommandNames) {
    EXPECT_EQ(CLIParser::parseCommand("setup"), Command::Setup);
    EXPECT_EQ(CLIParser::parseCommand("SETUP"), Command::None);
    EXPECT_EQ(CLIParser::commandToString(Command::Import), "import");
    EXPECT_EQ(CLIParser::commandToString(Command::None), "none");
}

TEST(CLIParserTest, UsageListsCommands) {
    std::ostringstream out;
    CLIParser::printUsage("macfence", out);
    std::string usage = out.str();
    EXPECT_NE(usage.find("Usage: macfence"), std::string::npos);
    EXPECT_NE(usage.find("setup"), std::string::npos);
    EXPECT_NE(usage.find("--config"), std::string::npos);
}
