#pragma once
// =============================================================================
// scrcpy-pilot - Device model
// =============================================================================
// A device as reported by `adb devices -l`. Transport is a closed set, so it
// is a plain tag rather than a class hierarchy.
// =============================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <string>

namespace pilot {

enum class Transport : uint8_t { Usb = 0, Network = 1 };

enum class DeviceState : uint8_t {
    Online = 0,         // adb state "device"
    Offline,            // offline, recovery, bootloader, no permissions, ...
    Unauthorized,       // RSA key not accepted on the device yet
};

struct Device {
    std::string id;                 // adb serial or host:port (unique key)
    Transport transport = Transport::Usb;
    std::string label;              // "Pixel 7" or "Android device 1A2B3C4D"
    DeviceState state = DeviceState::Offline;

    bool isOnline() const { return state == DeviceState::Online; }

    bool operator==(const Device& o) const {
        return id == o.id && transport == o.transport && label == o.label && state == o.state;
    }
    bool operator!=(const Device& o) const { return !(*this == o); }
};

inline const char* transportStr(Transport t) {
    switch (t) {
        case Transport::Usb:     return "usb";
        case Transport::Network: return "tcp";
    }
    return "?";
}

inline const char* deviceStateStr(DeviceState s) {
    switch (s) {
        case DeviceState::Online:       return "online";
        case DeviceState::Offline:      return "offline";
        case DeviceState::Unauthorized: return "unauthorized";
    }
    return "?";
}

// Characters that never appear in a real adb serial or host:port
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r";

/**
 * Validate ADB device ID format.
 * Valid formats:
 *   - Serial number: alphanumeric, may include ':', '.', '-', '_'
 *   - IP:port: xxx.xxx.xxx.xxx:port
 *
 * Device ids end up on scrcpy's command line and in the lockless tables,
 * so anything else is treated as a malformed enumeration line.
 */
inline bool isValidAdbId(const std::string& adb_id) {
    if (adb_id.empty() || adb_id.length() > 64) {
        return false;
    }

    for (char c : adb_id) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) {
            return false;
        }
    }

    for (char c : adb_id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }

    return true;
}

/**
 * Determine transport from an ADB ID.
 * Network format: HOST:PORT (e.g. "192.168.0.5:5555", "phone.lan:5555")
 * USB format: anything else (serial number, "emulator-5554")
 */
inline Transport classifyTransport(const std::string& adb_id) {
    size_t colon_pos = adb_id.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 >= adb_id.size()) {
        return Transport::Usb;
    }
    const std::string port = adb_id.substr(colon_pos + 1);
    bool numeric_port = std::all_of(port.begin(), port.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    return numeric_port ? Transport::Network : Transport::Usb;
}

// Fallback label when adb does not report a model
inline std::string defaultLabel(const std::string& adb_id) {
    return "Android device " + adb_id.substr(0, std::min<size_t>(8, adb_id.size()));
}

} // namespace pilot
