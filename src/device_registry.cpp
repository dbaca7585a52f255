#include "device_registry.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace macfence {

namespace {

const char* const kComponent = "DeviceRegistry";

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n\f\v";
    size_t start = value.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

// The raw MAC is written back verbatim; anything that would break the
// line/tab framing of the store is replaced by the canonical form
std::string storableOriginalMac(const std::string& raw, const std::string& canonical) {
    std::string original = trim(raw);
    if (original.find_first_of("\t\r\n") != std::string::npos) {
        return canonical;
    }
    return original;
}

} // namespace

std::string FirewallExport::content() const {
    std::string joined;
    for (size_t i = 0; i < mac_list.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += mac_list[i];
    }
    return joined;
}

DeviceRegistry::DeviceRegistry(RegistryStore& store, std::string alias_name)
    : store_(store)
    , alias_name_(std::move(alias_name)) {
}

std::vector<DeviceRecord> DeviceRegistry::list() const {
    return store_.load().devices;
}

StoreLoadResult DeviceRegistry::listWithWarnings() const {
    return store_.load();
}

std::vector<DeviceRecord> DeviceRegistry::listEnabled() const {
    std::vector<DeviceRecord> devices = list();
    devices.erase(std::remove_if(devices.begin(), devices.end(),
                                 [](const DeviceRecord& d) { return !d.enabled; }),
                  devices.end());
    return devices;
}

std::optional<DeviceRecord> DeviceRegistry::get(int id) const {
    for (const auto& device : list()) {
        if (device.id == id) {
            return device;
        }
    }
    return std::nullopt;
}

void DeviceRegistry::checkConflicts(const std::vector<DeviceRecord>& devices,
                                    int self_id,
                                    const std::optional<std::string>& name,
                                    const std::optional<std::string>& mac) {
    for (const auto& device : devices) {
        if (device.id == self_id) {
            continue;
        }
        if (mac && device.mac == *mac) {
            throw ConflictError(ErrorCode::DuplicateMac,
                                "MAC address " + *mac + " already exists for device '" +
                                device.name + "'");
        }
        if (name && namesEqual(device.name, *name)) {
            throw ConflictError(ErrorCode::DuplicateName,
                                "Device name '" + *name + "' already exists");
        }
    }
}

DeviceRecord DeviceRegistry::add(const std::string& name, const std::string& mac) {
    // Validate inputs before touching the store
    std::string clean_name = normalizeName(name);
    std::string normalized_mac = normalizeMac(mac);

    std::lock_guard<std::mutex> guard(mutex_);
    RegistryStore::WriteLock file_lock = store_.lock();

    std::vector<DeviceRecord> devices = store_.load().devices;
    checkConflicts(devices, 0, clean_name, normalized_mac);

    int max_id = 0;
    for (const auto& device : devices) {
        max_id = std::max(max_id, device.id);
    }
    if (max_id == std::numeric_limits<int>::max()) {
        throw PersistError("No device id left above " + std::to_string(max_id) +
                           "; renumber the store before adding devices");
    }

    DeviceRecord device;
    device.id = max_id + 1;
    device.name = clean_name;
    device.mac = normalized_mac;
    device.original_mac = storableOriginalMac(mac, normalized_mac);
    device.enabled = true;
    device.added_date = currentIsoTimestamp();

    devices.push_back(device);
    store_.save(devices);

    Logger::info(kComponent, "Added device " + std::to_string(device.id) + " '" + device.name +
                             "' (" + device.mac + ")");
    return device;
}

DeviceRecord DeviceRegistry::update(int id, const DeviceUpdate& changes) {
    std::optional<std::string> clean_name;
    std::optional<std::string> normalized_mac;
    if (changes.name) {
        clean_name = normalizeName(*changes.name);
    }
    if (changes.mac) {
        normalized_mac = normalizeMac(*changes.mac);
    }

    std::lock_guard<std::mutex> guard(mutex_);
    RegistryStore::WriteLock file_lock = store_.lock();

    std::vector<DeviceRecord> devices = store_.load().devices;
    auto it = std::find_if(devices.begin(), devices.end(),
                           [id](const DeviceRecord& d) { return d.id == id; });
    if (it == devices.end()) {
        throw NotFoundError("Device with ID " + std::to_string(id) + " not found");
    }

    checkConflicts(devices, id, clean_name, normalized_mac);

    if (clean_name) {
        it->name = *clean_name;
    }
    if (normalized_mac) {
        it->mac = *normalized_mac;
        it->original_mac = storableOriginalMac(*changes.mac, *normalized_mac);
    }
    if (changes.enabled) {
        it->enabled = *changes.enabled;
    }
    it->updated_date = currentIsoTimestamp();

    DeviceRecord updated = *it;
    store_.save(devices);

    if (!updated.enabled) {
        Logger::warning(kComponent, "Device " + std::to_string(id) + " '" + updated.name +
                                    "' disabled; it is removed from the store and its id released");
    } else {
        Logger::info(kComponent, "Updated device " + std::to_string(id) + " '" + updated.name + "'");
    }
    return updated;
}

void DeviceRegistry::remove(int id) {
    std::lock_guard<std::mutex> guard(mutex_);
    RegistryStore::WriteLock file_lock = store_.lock();

    std::vector<DeviceRecord> devices = store_.load().devices;
    size_t original_count = devices.size();
    devices.erase(std::remove_if(devices.begin(), devices.end(),
                                 [id](const DeviceRecord& d) { return d.id == id; }),
                  devices.end());

    if (devices.size() == original_count) {
        throw NotFoundError("Device with ID " + std::to_string(id) + " not found");
    }

    store_.save(devices);
    Logger::info(kComponent, "Deleted device " + std::to_string(id));
}

FirewallExport DeviceRegistry::exportSnapshot() const {
    FirewallExport snapshot;
    snapshot.alias_name = alias_name_;
    snapshot.devices = listEnabled();
    for (const auto& device : snapshot.devices) {
        snapshot.mac_list.push_back(device.mac);
    }
    snapshot.description = "Parental Controls MAC Addresses (" +
                           std::to_string(snapshot.devices.size()) + " devices)";
    return snapshot;
}

ImportResult DeviceRegistry::importText(const std::string& text) {
    ImportResult result;

    std::istringstream stream(text);
    std::string raw_line;
    int line_num = 0;

    while (std::getline(stream, raw_line)) {
        ++line_num;
        std::string line = trim(raw_line);
        if (line.empty()) {
            continue;
        }

        const std::string prefix = "Line " + std::to_string(line_num) + ": ";
        std::string name;
        std::string mac;

        size_t tab = line.find('\t');
        size_t comma = line.find(',');
        if (tab != std::string::npos) {
            // Store format: [id|]name<TAB>mac[<TAB>]
            std::string name_part = line.substr(0, tab);
            std::string rest = line.substr(tab + 1);
            mac = rest.substr(0, rest.find('\t'));
            size_t bar = name_part.find('|');
            name = bar == std::string::npos ? name_part : name_part.substr(bar + 1);
        } else if (comma != std::string::npos) {
            name = line.substr(0, comma);
            std::string rest = line.substr(comma + 1);
            mac = rest.substr(0, rest.find(','));
        } else {
            result.errors.push_back(prefix + "Unrecognized format");
            continue;
        }

        try {
            add(trim(name), trim(mac));
            ++result.added_count;
        } catch (const std::exception& e) {
            result.errors.push_back(prefix + e.what());
        }
    }

    Logger::info(kComponent, "Imported " + std::to_string(result.added_count) + " device(s), " +
                             std::to_string(result.errors.size()) + " error(s)");
    return result;
}

DeviceStats DeviceRegistry::stats() const {
    std::vector<DeviceRecord> devices = list();

    DeviceStats stats;
    stats.total_devices = devices.size();
    for (const auto& device : devices) {
        if (device.enabled) {
            ++stats.enabled_devices;
        }
        const std::string& changed = device.updated_date.empty() ? device.added_date
                                                                 : device.updated_date;
        stats.last_updated = std::max(stats.last_updated, changed);
    }
    stats.disabled_devices = stats.total_devices - stats.enabled_devices;
    return stats;
}

} // namespace macfence
