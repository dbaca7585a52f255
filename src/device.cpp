#include "device.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace macfence {

namespace {

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n\f\v";
    size_t start = value.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

} // namespace

std::string normalizeMac(const std::string& raw) {
    // Drop separators and anything else that is not a hex digit, so that
    // AA-BB-..., AA:BB:..., AABB... and already-canonical input all agree
    static const std::regex non_hex("[^0-9A-Fa-f]");
    std::string clean = std::regex_replace(raw, non_hex, "");

    if (clean.length() != 12) {
        throw ValidationError(ErrorCode::InvalidMacFormat,
                              "Invalid MAC address length: " + raw +
                              " (expected 12 hex digits, e.g. AA:BB:CC:DD:EE:FF)");
    }

    std::transform(clean.begin(), clean.end(), clean.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    static const std::regex twelve_hex("^[0-9A-F]{12}$");
    if (!std::regex_match(clean, twelve_hex)) {
        throw ValidationError(ErrorCode::InvalidMacFormat, "Invalid MAC address format: " + raw);
    }

    std::string formatted;
    formatted.reserve(17);
    for (size_t i = 0; i < clean.length(); i += 2) {
        if (i > 0) {
            formatted += ':';
        }
        formatted += clean.substr(i, 2);
    }
    return formatted;
}

bool isValidMac(const std::string& raw) {
    try {
        normalizeMac(raw);
        return true;
    } catch (const ValidationError&) {
        return false;
    }
}

std::string normalizeName(const std::string& raw) {
    std::string name = trim(raw);
    if (name.empty()) {
        throw ValidationError(ErrorCode::InvalidName, "Device name cannot be empty");
    }

    // Keep letters, digits, '_', '-' and spaces; anything else could break
    // the store's tab/pipe framing or the firewall's alias tooling
    static const std::regex disallowed("[^A-Za-z0-9_ \\-]");
    std::string clean = trim(std::regex_replace(name, disallowed, ""));

    if (clean.empty()) {
        throw ValidationError(ErrorCode::InvalidName,
                              "Device name contains no valid characters: " + raw);
    }

    if (clean.length() > kMaxDeviceNameLength) {
        clean = trim(clean.substr(0, kMaxDeviceNameLength));
    }

    return clean;
}

bool namesEqual(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string currentIsoTimestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);

    std::ostringstream out;
    out << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S");
    return out.str();
}

} // namespace macfence
