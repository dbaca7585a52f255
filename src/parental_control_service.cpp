#include "parental_control_service.hpp"
#include "logger.hpp"
#include "ssh_transport.hpp"

namespace macfence {

namespace {

const char* const kComponent = "ParentalControlService";

std::unique_ptr<FirewallTransport> makeTransport(const FirewallSettings& firewall,
                                                 std::unique_ptr<FirewallTransport> transport) {
    if (transport) {
        return transport;
    }
    SshSettings ssh;
    ssh.host = firewall.host;
    ssh.user = firewall.user;
    ssh.port = firewall.port;
    ssh.identity_file = firewall.identity_file;
    ssh.timeout_seconds = firewall.timeout_seconds;
    return std::make_unique<SshTransport>(ssh);
}

} // namespace

ParentalControlService::ParentalControlService(AppConfig config,
                                               std::unique_ptr<FirewallTransport> transport)
    : config_(std::move(config))
    , store_(config_.store.path, config_.store.backup_dir)
    , registry_(store_, config_.firewall.alias_name)
    , transport_(makeTransport(config_.firewall, std::move(transport)))
    , reconciler_(registry_, *transport_, config_.firewall) {
    store_.ensureExists();
    Logger::debug(kComponent, "Using device store " + store_.path().string() + " and firewall " +
                              transport_->describe());
}

std::vector<DeviceRecord> ParentalControlService::listDevices() const {
    return registry_.list();
}

StoreLoadResult ParentalControlService::listDevicesWithWarnings() const {
    return registry_.listWithWarnings();
}

std::optional<DeviceRecord> ParentalControlService::getDevice(int id) const {
    return registry_.get(id);
}

DeviceRecord ParentalControlService::addDevice(const std::string& name, const std::string& mac) {
    return registry_.add(name, mac);
}

DeviceRecord ParentalControlService::updateDevice(int id, const DeviceUpdate& changes) {
    return registry_.update(id, changes);
}

void ParentalControlService::deleteDevice(int id) {
    registry_.remove(id);
}

FirewallExport ParentalControlService::exportForFirewall() const {
    return registry_.exportSnapshot();
}

ImportResult ParentalControlService::importFromText(const std::string& text) {
    return registry_.importText(text);
}

DeviceStats ParentalControlService::getStats() const {
    return registry_.stats();
}

bool ParentalControlService::syncToFirewall() {
    return reconciler_.syncAlias();
}

bool ParentalControlService::setupFirewall() {
    Logger::info(kComponent, "Setting up parental controls on " + transport_->describe());
    if (!reconciler_.syncAlias()) {
        return false;
    }
    return reconciler_.ensureBlockRule(false);
}

bool ParentalControlService::setEnforcement(bool enabled) {
    return reconciler_.setEnforcement(enabled);
}

bool ParentalControlService::toggleControls(bool enabled) {
    if (!reconciler_.syncAlias()) {
        if (enabled || reconciler_.getLastFailure().error != ReconcileError::NoEnabledDevices) {
            return false;
        }
        Logger::warning(kComponent, "No enabled devices; alias left unchanged");
    }
    return reconciler_.setEnforcement(enabled);
}

std::optional<FirewallStatus> ParentalControlService::getStatus() {
    return reconciler_.status();
}

TransportResult ParentalControlService::testConnection() {
    TransportResult result = transport_->run("echo 'Connection test'");
    if (result.ok) {
        Logger::info(kComponent, "Connection to " + transport_->describe() + " OK");
    } else {
        Logger::error(kComponent, "Connection to " + transport_->describe() + " failed: " + result.output);
    }
    return result;
}

} // namespace macfence
