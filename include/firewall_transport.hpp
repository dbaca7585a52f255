/**
 * @file firewall_transport.hpp
 * @brief Remote command and file transfer boundary for macfence
 * @author macfence Development Team
 * @date 2026
 *
 * The reconciler never creates processes or sockets itself. Everything it
 * needs from the firewall goes through this interface, which production
 * code implements with ssh/scp (SshTransport) and tests implement with an
 * in-memory fake.
 */

#pragma once

#include <string>

namespace macfence {

/**
 * @struct TransportResult
 * @brief Outcome of one remote command
 */
struct TransportResult {
    bool ok = false;     ///< Remote command exited with status 0 within the time limit
    std::string output;  ///< Remote stdout on success, a description of the failure otherwise
};

/**
 * @class FirewallTransport
 * @brief Abstract channel to the firewall host
 *
 * Implementations must not throw: timeouts, connection problems and remote
 * failures are all reported as `ok == false`.
 */
class FirewallTransport {
public:
    virtual ~FirewallTransport() = default;

    /**
     * @brief Run a shell command on the firewall
     * @param command Command line interpreted by the remote shell
     * @return Result with trimmed stdout, or the failure reason
     */
    virtual TransportResult run(const std::string& command) = 0;

    /**
     * @brief Copy a buffer to a file on the firewall
     * @param content Bytes to write
     * @param remote_path Destination path on the firewall
     * @return true if the file was transferred completely
     */
    virtual bool pushFile(const std::string& content, const std::string& remote_path) = 0;

    /**
     * @brief Human-readable description of the remote endpoint ("root@192.168.1.1:22")
     */
    virtual std::string describe() const = 0;
};

} // namespace macfence
