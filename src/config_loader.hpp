#pragma once
// =============================================================================
// scrcpy-pilot Config Loader
// =============================================================================
// Loads settings from scrcpy-pilot.json with nlohmann/json. Every key is
// optional; a missing file or a parse error leaves the defaults in place.
// =============================================================================

#include <cstdlib>
#include <string>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>
#include "pilot_log.hpp"

namespace pilot {
namespace config {

static constexpr const char* APP_NAME    = "scrcpy-pilot";
static constexpr const char* APP_VERSION = "0.3.0";

struct ToolsConfig {
    std::string adb_path;              // empty = resolve (scrcpy_dir, exe dir, PATH)
    std::string scrcpy_path;
    std::string scrcpy_dir = "scrcpy"; // bundled-distribution directory
};

struct ScrcpyConfig {
    std::vector<std::string> extra_args;
    bool window_title = true;          // pass --window-title <label>
};

struct DiscoveryConfig {
    int poll_interval_ms   = 1500;
    int command_timeout_ms = 5000;
    int debounce_ticks     = 2;        // consecutive misses before removal
};

struct SessionConfig {
    int grace_period_ms  = 3000;       // SIGTERM -> SIGKILL escalation
    int spawn_confirm_ms = 300;        // Starting -> Running liveness window
};

struct UiConfig {
    int refresh_ms    = 100;
    int log_tail_size = 100;
};

struct LockConfig {
    std::string lock_path;             // empty = default runtime dir
};

struct LogConfig {
    std::string log_path = "scrcpy-pilot.log";
    std::string level = "info";
};

struct AppConfig {
    ToolsConfig tools;
    ScrcpyConfig scrcpy;
    DiscoveryConfig discovery;
    SessionConfig session;
    UiConfig ui;
    LockConfig lock;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j[section].contains(key)) {
            return j[section][key].get<T>();
        }
    } catch (const nlohmann::json::exception& e) {
        PLOG_WARN("config", "%s.%s: %s (using default)", section.c_str(), key.c_str(), e.what());
    }
    return def;
}

// Clamp timing values that would make the loops spin or never fire
inline int atLeast(int value, int floor_value) {
    return value < floor_value ? floor_value : value;
}

// Default search order when no explicit path is given:
//   ./scrcpy-pilot.json, $XDG_CONFIG_HOME/scrcpy-pilot/config.json,
//   ~/.config/scrcpy-pilot/config.json
inline std::vector<std::string> defaultConfigPaths() {
    std::vector<std::string> paths{"scrcpy-pilot.json"};
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        paths.push_back(std::string(xdg) + "/scrcpy-pilot/config.json");
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        paths.push_back(std::string(home) + "/.config/scrcpy-pilot/config.json");
    }
    return paths;
}

// @param configPath  Path to config file (empty = search default locations)
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file;
    std::string used_path;
    if (!configPath.empty()) {
        file.open(configPath);
        used_path = configPath;
    }
    if (!file.is_open() && !strict) {
        for (const auto& candidate : defaultConfigPaths()) {
            file.clear();
            file.open(candidate);
            if (file.is_open()) {
                used_path = candidate;
                break;
            }
        }
    }
    if (!file.is_open()) {
        PLOG_WARN("config", "config file not found, using defaults");
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);

        config.tools.adb_path    = jsonGet<std::string>(j, "tools", "adb_path", "");
        config.tools.scrcpy_path = jsonGet<std::string>(j, "tools", "scrcpy_path", "");
        config.tools.scrcpy_dir  = jsonGet<std::string>(j, "tools", "scrcpy_dir", "scrcpy");

        config.scrcpy.extra_args   = jsonGet<std::vector<std::string>>(j, "scrcpy", "extra_args", {});
        config.scrcpy.window_title = jsonGet<bool>(j, "scrcpy", "window_title", true);

        config.discovery.poll_interval_ms   = atLeast(jsonGet<int>(j, "discovery", "poll_interval_ms", 1500), 100);
        config.discovery.command_timeout_ms = atLeast(jsonGet<int>(j, "discovery", "command_timeout_ms", 5000), 100);
        config.discovery.debounce_ticks     = atLeast(jsonGet<int>(j, "discovery", "debounce_ticks", 2), 1);

        config.session.grace_period_ms  = atLeast(jsonGet<int>(j, "session", "grace_period_ms", 3000), 0);
        config.session.spawn_confirm_ms = atLeast(jsonGet<int>(j, "session", "spawn_confirm_ms", 300), 0);

        config.ui.refresh_ms    = atLeast(jsonGet<int>(j, "ui", "refresh_ms", 100), 10);
        config.ui.log_tail_size = atLeast(jsonGet<int>(j, "ui", "log_tail_size", 100), 1);

        config.lock.lock_path = jsonGet<std::string>(j, "lock", "lock_path", "");

        config.log.log_path = jsonGet<std::string>(j, "log", "log_path", "scrcpy-pilot.log");
        config.log.level    = jsonGet<std::string>(j, "log", "level", "info");

    } catch (const nlohmann::json::exception& e) {
        PLOG_ERROR("config", "JSON parse error in %s: %s", used_path.c_str(), e.what());
        return AppConfig{};
    }

    PLOG_INFO("config", "Loaded %s: poll=%dms debounce=%d grace=%dms",
              used_path.c_str(),
              config.discovery.poll_interval_ms,
              config.discovery.debounce_ticks,
              config.session.grace_period_ms);

    return config;
}

} // namespace config
} // namespace pilot
