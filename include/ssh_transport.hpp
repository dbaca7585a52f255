/**
 * @file ssh_transport.hpp
 * @brief ssh/scp implementation of FirewallTransport
 * @author macfence Development Team
 * @date 2026
 */

#pragma once

#include "firewall_transport.hpp"
#include <string>
#include <vector>

namespace macfence {

struct SshSettings {
    std::string host = "192.168.123.1";
    std::string user = "root";
    int port = 22;
    std::string identity_file;   ///< Private key; empty uses the ssh default identities
    int timeout_seconds = 30;    ///< Hard limit per remote command or copy
};

/**
 * @class SshTransport
 * @brief Runs firewall commands through the system ssh and scp binaries
 *
 * Key-based, non-interactive (BatchMode) access is assumed. Every call is
 * bounded by the configured timeout; a timeout is reported as
 * "Command timed out".
 */
class SshTransport : public FirewallTransport {
public:
    explicit SshTransport(SshSettings settings);

    TransportResult run(const std::string& command) override;
    bool pushFile(const std::string& content, const std::string& remote_path) override;
    std::string describe() const override;

    /**
     * @brief Build the ssh argument vector for a remote command
     * @param command Remote command line
     * @return Arguments starting with "ssh"
     */
    std::vector<std::string> buildSshCommand(const std::string& command) const;

    /**
     * @brief Build the scp argument vector for a file copy
     * @param local_path Source file
     * @param remote_path Destination path on the firewall
     * @return Arguments starting with "scp"
     */
    std::vector<std::string> buildScpCommand(const std::string& local_path,
                                             const std::string& remote_path) const;

    const SshSettings& settings() const { return settings_; }

private:
    SshSettings settings_;

    std::vector<std::string> commonOptions() const;
};

} // namespace macfence
