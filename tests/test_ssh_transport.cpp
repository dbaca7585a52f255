#include "ssh_transport.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace macfence;

namespace {

SshSettings homeFirewall() {
    SshSettings settings;
    settings.host = "192.168.123.1";
    settings.user = "root";
    settings.port = 2222;
    settings.identity_file = "/home/parent/.ssh/id_ed25519_opnsense";
    settings.timeout_seconds = 30;
    return settings;
}

} // namespace

TEST(SshTransportTest, SshCommandLine) {
    SshTransport transport(homeFirewall());

    std::vector<std::string> expected = {
        "ssh", "-i", "/home/parent/.ssh/id_ed25519_opnsense",
        "-o", "BatchMode=yes", "-o", "ConnectTimeout=15",
        "-p", "2222", "root@192.168.123.1", "cat /conf/config.xml",
    };
    EXPECT_EQ(transport.buildSshCommand("cat /conf/config.xml"), expected);
}

TEST(SshTransportTest, ScpCommandLine) {
    SshTransport transport(homeFirewall());

    std::vector<std::string> expected = {
        "scp", "-q", "-i", "/home/parent/.ssh/id_ed25519_opnsense",
        "-o", "BatchMode=yes", "-o", "ConnectTimeout=15",
        "-P", "2222", "/tmp/macfence_push_abc", "root@192.168.123.1:/tmp/new_config.xml",
    };
    EXPECT_EQ(transport.buildScpCommand("/tmp/macfence_push_abc", "/tmp/new_config.xml"), expected);
}

TEST(SshTransportTest, OmitsIdentityWhenUnset) {
    SshSettings settings = homeFirewall();
    settings.identity_file.clear();
    settings.timeout_seconds = 5;
    SshTransport transport(settings);

    std::vector<std::string> command = transport.buildSshCommand("true");
    EXPECT_EQ(std::find(command.begin(), command.end(), "-i"), command.end());
    EXPECT_NE(std::find(command.begin(), command.end(), "ConnectTimeout=5"), command.end());
}

TEST(SshTransportTest, Describe) {
    SshTransport transport(homeFirewall());
    EXPECT_EQ(transport.describe(), "root@192.168.123.1:2222");
}
