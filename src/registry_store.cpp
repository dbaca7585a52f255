#include "registry_store.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <sys/file.h>
#include <unistd.h>

namespace macfence {

namespace {

const char* const kComponent = "RegistryStore";
const char* const kBackupPrefix = "mac_addresses_";

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n\f\v";
    size_t start = value.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& value, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(value);
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    if (!value.empty() && value.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

std::string backupTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);

    std::ostringstream out;
    out << std::put_time(&local_tm, "%Y%m%d_%H%M%S");
    return out.str();
}

std::string lowerCase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

RegistryStore::WriteLock::~WriteLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

RegistryStore::RegistryStore(std::filesystem::path store_path, std::filesystem::path backup_dir)
    : store_path_(std::move(store_path))
    , backup_dir_(std::move(backup_dir)) {
    if (backup_dir_.empty()) {
        backup_dir_ = store_path_.parent_path() / "backups";
    }
}

void RegistryStore::ensureExists() const {
    std::error_code ec;
    if (store_path_.has_parent_path()) {
        std::filesystem::create_directories(store_path_.parent_path(), ec);
        if (ec) {
            throw PersistError("Unable to create store directory " +
                               store_path_.parent_path().string() + ": " + ec.message());
        }
    }

    if (!std::filesystem::exists(store_path_, ec)) {
        std::ofstream file(store_path_);
        if (!file.is_open()) {
            throw PersistError("Unable to create store file: " + store_path_.string());
        }
    }
}

StoreLoadResult RegistryStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(store_path_, ec)) {
        return {};
    }

    std::ifstream file(store_path_, std::ios::binary);
    if (!file.is_open()) {
        throw PersistError("Unable to open store file for reading: " + store_path_.string());
    }

    std::ostringstream content;
    content << file.rdbuf();

    StoreLoadResult result = parse(content.str());
    for (const auto& warning : result.warnings) {
        Logger::warning(kComponent, warning);
    }
    return result;
}

StoreLoadResult RegistryStore::parse(const std::string& content) {
    StoreLoadResult result;
    std::set<int> seen_ids;
    std::set<std::string> seen_macs;
    std::set<std::string> seen_names;

    std::istringstream stream(content);
    std::string raw_line;
    int line_num = 0;

    while (std::getline(stream, raw_line)) {
        ++line_num;
        std::string line = trim(raw_line);
        if (line.empty()) {
            continue;
        }

        const std::string where = "line " + std::to_string(line_num);

        // Format: ID|Name<TAB>MAC<TAB>
        std::vector<std::string> parts = split(line, '\t');
        if (parts.size() < 2) {
            result.warnings.push_back("Skipping malformed " + where + ": " + line);
            continue;
        }

        const std::string& id_name_part = parts[0];
        const std::string mac_part = trim(parts[1]);

        int device_id = line_num;
        std::string name = id_name_part;
        size_t bar = id_name_part.find('|');
        if (bar != std::string::npos) {
            name = id_name_part.substr(bar + 1);
            try {
                size_t consumed = 0;
                int parsed = std::stoi(id_name_part.substr(0, bar), &consumed);
                if (consumed == bar && parsed > 0) {
                    device_id = parsed;
                }
            } catch (const std::exception&) {
                // Not a number, keep the line number as id
            }
        }

        DeviceRecord device;
        try {
            device.mac = normalizeMac(mac_part);
        } catch (const ValidationError& e) {
            result.warnings.push_back("Invalid MAC on " + where + ": " + e.what());
            continue;
        }

        try {
            device.name = normalizeName(name);
        } catch (const ValidationError& e) {
            result.warnings.push_back("Invalid device name on " + where + ": " + e.what());
            continue;
        }

        if (seen_ids.count(device_id) != 0) {
            result.warnings.push_back("Duplicate id " + std::to_string(device_id) + " on " + where +
                                      ", skipping");
            continue;
        }
        if (seen_macs.count(device.mac) != 0) {
            result.warnings.push_back("Duplicate MAC " + device.mac + " on " + where + ", skipping");
            continue;
        }
        if (seen_names.count(lowerCase(device.name)) != 0) {
            result.warnings.push_back("Duplicate device name '" + device.name + "' on " + where +
                                      ", skipping");
            continue;
        }

        seen_ids.insert(device_id);
        seen_macs.insert(device.mac);
        seen_names.insert(lowerCase(device.name));

        device.id = device_id;
        device.original_mac = mac_part;
        device.enabled = true;
        device.added_date = currentIsoTimestamp();
        result.devices.push_back(std::move(device));
    }

    return result;
}

std::string RegistryStore::format(const std::vector<DeviceRecord>& devices) {
    std::vector<const DeviceRecord*> sorted;
    for (const auto& device : devices) {
        if (device.enabled) {
            sorted.push_back(&device);
        }
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const DeviceRecord* a, const DeviceRecord* b) { return a->id < b->id; });

    std::string content;
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0) {
            content += '\n';
        }
        content += std::to_string(sorted[i]->id) + "|" + sorted[i]->name + "\t" +
                   sorted[i]->original_mac + "\t";
    }
    content += '\n';
    return content;
}

std::optional<std::filesystem::path> RegistryStore::backup() const {
    std::error_code ec;
    if (!std::filesystem::exists(store_path_, ec)) {
        return std::nullopt;
    }

    std::filesystem::create_directories(backup_dir_, ec);
    if (ec) {
        Logger::warning(kComponent, "Unable to create backup directory " + backup_dir_.string() +
                                    ": " + ec.message());
        return std::nullopt;
    }

    // Several saves within one second keep separate snapshots: _1, _2, ...
    const std::string stem = kBackupPrefix + backupTimestamp();
    std::filesystem::path target = backup_dir_ / (stem + ".txt");
    for (int suffix = 1; std::filesystem::exists(target, ec); ++suffix) {
        target = backup_dir_ / (stem + "_" + std::to_string(suffix) + ".txt");
    }
    std::filesystem::copy_file(store_path_, target, std::filesystem::copy_options::none, ec);
    if (ec) {
        Logger::warning(kComponent, "Backup of " + store_path_.string() + " failed: " + ec.message());
        return std::nullopt;
    }

    Logger::debug(kComponent, "Store backed up to " + target.string());
    return target;
}

void RegistryStore::save(const std::vector<DeviceRecord>& devices) const {
    std::error_code ec;
    if (store_path_.has_parent_path()) {
        std::filesystem::create_directories(store_path_.parent_path(), ec);
        if (ec) {
            throw PersistError("Unable to create store directory " +
                               store_path_.parent_path().string() + ": " + ec.message());
        }
    }

    // Backups are for forensics, not correctness; a failure only warns
    backup();

    std::filesystem::path temp_path = store_path_;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw PersistError("Unable to open file for writing: " + temp_path.string());
        }
        file << format(devices);
        file.flush();
        if (!file.good()) {
            file.close();
            std::filesystem::remove(temp_path, ec);
            throw PersistError("Failed to write store file: " + temp_path.string());
        }
    }

    std::filesystem::rename(temp_path, store_path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw PersistError("Failed to replace store file " + store_path_.string() + ": " + ec.message());
    }

    Logger::debug(kComponent, "Saved " + std::to_string(devices.size()) + " device(s) to " +
                              store_path_.string());
}

RegistryStore::WriteLock RegistryStore::lock() const {
    std::error_code ec;
    if (store_path_.has_parent_path()) {
        std::filesystem::create_directories(store_path_.parent_path(), ec);
    }

    std::filesystem::path lock_path = store_path_;
    lock_path += ".lock";

    int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw PersistError("Unable to open lock file " + lock_path.string() + ": " +
                           std::strerror(errno));
    }

    if (::flock(fd, LOCK_EX) != 0) {
        int saved_errno = errno;
        ::close(fd);
        throw PersistError("Unable to lock " + lock_path.string() + ": " + std::strerror(saved_errno));
    }

    return WriteLock(fd);
}

} // namespace macfence
