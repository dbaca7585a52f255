#include "config_parser.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <optional>
#include <stdexcept>

using namespace macfence;
using macfence::testutil::TempDir;
using macfence::testutil::writeFile;

namespace {

// Restores $HOME when a test changes it
class HomeGuard {
public:
    explicit HomeGuard(const std::string& home) {
        const char* current = std::getenv("HOME");
        if (current) {
            saved_ = current;
        }
        setenv("HOME", home.c_str(), 1);
    }
    ~HomeGuard() {
        if (saved_) {
            setenv("HOME", saved_->c_str(), 1);
        } else {
            unsetenv("HOME");
        }
    }

private:
    std::optional<std::string> saved_;
};

} // namespace

TEST(ConfigParserTest, EmptyDocumentGivesDefaults) {
    AppConfig config = ConfigParser::loadFromString("");

    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_EQ(config.firewall.host, "192.168.123.1");
    EXPECT_EQ(config.firewall.user, "root");
    EXPECT_EQ(config.firewall.port, 22);
    EXPECT_EQ(config.firewall.timeout_seconds, 30);
    EXPECT_EQ(config.firewall.config_path, "/conf/config.xml");
    EXPECT_EQ(config.firewall.staging_path, "/tmp/new_config.xml");
    EXPECT_EQ(config.firewall.alias_name, "ParentalControlMACs");
    EXPECT_EQ(config.firewall.rule_marker, "ParentalControlBlock");
    EXPECT_TRUE(config.firewall.legacy_substring_match);

    ASSERT_EQ(config.firewall.apply.size(), 4u);
    EXPECT_TRUE(config.firewall.apply[0].best_effort);
    EXPECT_TRUE(config.firewall.apply[1].best_effort);
    EXPECT_EQ(config.firewall.apply[2].command, "/usr/local/etc/rc.configure_firewall");
    EXPECT_FALSE(config.firewall.apply[2].best_effort);
    EXPECT_EQ(config.firewall.apply[3].command, "/usr/local/etc/rc.filter_configure");
}

TEST(ConfigParserTest, OverridesReplaceDefaults) {
    AppConfig config = ConfigParser::loadFromString(R"(
log_level: debug
store:
  path: /var/lib/macfence/devices.txt
firewall:
  host: fw.home.arpa
  port: 2222
  timeout: 10
  alias_name: KidsDevices
  legacy_substring_match: false
  apply:
    - command: /usr/local/etc/rc.filter_configure
)");

    EXPECT_EQ(config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.store.path, "/var/lib/macfence/devices.txt");
    EXPECT_EQ(config.firewall.host, "fw.home.arpa");
    EXPECT_EQ(config.firewall.port, 2222);
    EXPECT_EQ(config.firewall.timeout_seconds, 10);
    EXPECT_EQ(config.firewall.alias_name, "KidsDevices");
    EXPECT_FALSE(config.firewall.legacy_substring_match);
    EXPECT_EQ(config.firewall.user, "root");

    ASSERT_EQ(config.firewall.apply.size(), 1u);
    EXPECT_EQ(config.firewall.apply[0].name, "/usr/local/etc/rc.filter_configure");
    EXPECT_FALSE(config.firewall.apply[0].best_effort);
}

TEST(ConfigParserTest, ApplyChainWithoutHardStepIsRejected) {
    try {
        ConfigParser::loadFromString(R"(
firewall:
  apply:
    - name: reload
      command: configctl filter reload
      best_effort: true
)");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("not best_effort"), std::string::npos);
    }
}

TEST(ConfigParserTest, ApplyStepNeedsCommand) {
    EXPECT_THROW(ConfigParser::loadFromString("firewall:\n  apply:\n    - name: nothing\n"),
                 std::runtime_error);
}

TEST(ConfigParserTest, RejectsInvalidValues) {
    EXPECT_THROW(ConfigParser::loadFromString("log_level: chatty\n"), std::runtime_error);
    EXPECT_THROW(ConfigParser::loadFromString("firewall:\n  port: 70000\n"), std::runtime_error);
    EXPECT_THROW(ConfigParser::loadFromString("firewall:\n  timeout: 0\n"), std::runtime_error);
    EXPECT_THROW(ConfigParser::loadFromString("firewall:\n  staging_path: /conf/config.xml\n"),
                 std::runtime_error);
    EXPECT_THROW(ConfigParser::loadFromString("store:\n  path: \"\"\n"), std::runtime_error);
    EXPECT_THROW(ConfigParser::loadFromString("[not, a, map]"), std::runtime_error);
    EXPECT_THROW(ConfigParser::loadFromString("firewall: {host: [unclosed"), std::runtime_error);
}

TEST(ConfigParserTest, ValidationMessageNamesSection) {
    try {
        ConfigParser::loadFromString("firewall:\n  host: \"\"\n");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Firewall section: Firewall host cannot be empty"),
                  std::string::npos);
    }
}

TEST(ConfigParserTest, ExpandsHomeInPaths) {
    HomeGuard home("/home/parent");

    AppConfig config = ConfigParser::loadFromString(R"(
store:
  path: ~/macfence/devices.txt
firewall:
  identity_file: ~/.ssh/id_opnsense
)");

    EXPECT_EQ(config.store.path, "/home/parent/macfence/devices.txt");
    EXPECT_EQ(config.firewall.identity_file, "/home/parent/.ssh/id_opnsense");
}

TEST(ConfigParserTest, SaveAndLoadFile) {
    TempDir dir;
    AppConfig config = ConfigParser::loadFromString("");
    config.log_level = LogLevel::Warning;
    config.store.path = (dir / "devices.txt").string();
    config.firewall.host = "10.0.0.1";
    config.firewall.rule_marker = "KidsBlock";

    std::string file = (dir / "macfence.yaml").string();
    ConfigParser::saveToFile(config, file);
    AppConfig loaded = ConfigParser::loadFromFile(file);

    EXPECT_EQ(loaded.log_level, LogLevel::Warning);
    EXPECT_EQ(loaded.store.path, config.store.path);
    EXPECT_EQ(loaded.firewall.host, "10.0.0.1");
    EXPECT_EQ(loaded.firewall.rule_marker, "KidsBlock");
    ASSERT_EQ(loaded.firewall.apply.size(), config.firewall.apply.size());
    EXPECT_EQ(loaded.firewall.apply[0].best_effort, config.firewall.apply[0].best_effort);
}

TEST(ConfigParserTest, MissingFileThrows) {
    TempDir dir;
    EXPECT_THROW(ConfigParser::loadFromFile((dir / "absent.yaml").string()), std::runtime_error);
}

TEST(ConfigParserTest, LoadsMinimalFile) {
    TempDir dir;
    writeFile(dir / "example.yaml",
              "log_level: info\n"
              "firewall:\n"
              "  host: 192.168.123.1\n"
              "  apply:\n"
              "    - name: configure-firewall\n"
              "      command: /usr/local/etc/rc.configure_firewall\n");
    AppConfig config = ConfigParser::loadFromFile((dir / "example.yaml").string());
    EXPECT_EQ(config.firewall.apply.size(), 1u);
}
