#pragma once

#include "firewall_transport.hpp"
#include <string>
#include <vector>

namespace macfence {
namespace testutil {

/**
 * In-memory firewall: "cat" returns remote_config, pushFile stages content
 * and "mv" installs it. Any command starting with one of failing_prefixes
 * fails.
 */
class FakeTransport : public FirewallTransport {
public:
    std::string remote_config;
    std::string staged;
    std::vector<std::string> commands;
    std::vector<std::string> failing_prefixes;
    bool fail_push = false;
    int push_count = 0;

    TransportResult run(const std::string& command) override {
        commands.push_back(command);

        for (const auto& prefix : failing_prefixes) {
            if (startsWith(command, prefix)) {
                return {false, "simulated failure: " + command};
            }
        }

        if (startsWith(command, "cat ")) {
            return {true, remote_config};
        }
        if (startsWith(command, "mv ")) {
            remote_config = staged;
            return {true, ""};
        }
        if (startsWith(command, "echo ")) {
            return {true, "Connection test"};
        }
        return {true, ""};
    }

    bool pushFile(const std::string& content, const std::string&) override {
        if (fail_push) {
            return false;
        }
        staged = content;
        ++push_count;
        return true;
    }

    std::string describe() const override { return "root@fake:22"; }

    int countCommands(const std::string& prefix) const {
        int count = 0;
        for (const auto& command : commands) {
            if (startsWith(command, prefix)) {
                ++count;
            }
        }
        return count;
    }

private:
    static bool startsWith(const std::string& value, const std::string& prefix) {
        return value.compare(0, prefix.size(), prefix) == 0;
    }
};

inline const char* baseConfigXml() {
    return "<?xml version=\"1.0\"?>\n"
           "<opnsense>\n"
           "  <system>\n"
           "    <hostname>gateway</hostname>\n"
           "  </system>\n"
           "  <filter>\n"
           "    <rule uuid=\"11111111-2222-3333-4444-555555555555\">\n"
           "      <type>pass</type>\n"
           "      <interface>lan</interface>\n"
           "      <descr>Default allow LAN to any rule</descr>\n"
           "    </rule>\n"
           "  </filter>\n"
           "</opnsense>\n";
}

} // namespace testutil
} // namespace macfence
