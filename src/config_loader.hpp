#pragma once
// =============================================================================
// SmartScreen Config Loader
// =============================================================================
// Loads smartscreen.json with nlohmann/json. Every section is optional;
// malformed JSON, wrong value types, unknown modes and out-of-range settings
// are reported as ErrorKind::Config.
// =============================================================================

#include <chrono>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "device_session.hpp"
#include "display_mode.hpp"
#include "result.hpp"
#include "screen_log.hpp"

namespace smartscreen {
namespace config {

struct UsbConfig {
    int open_attempts = 5;
    int open_retry_delay_ms = 200;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
};

struct OrchestratorConfig {
    int open_delay_ms = 500;
    int sync_delay_ms = 200;
};

struct LogConfig {
    std::string level = "warn";
    std::string log_path;           // "" = stderr only
};

struct DisplayConfig {
    std::string device;             // selector
    DisplayMode mode = StatsMode{};
    DisplaySettings settings;
    std::string image;              // local asset paths, "" = none
    std::string video;
    std::string destination;        // on-device path, "" = default
};

struct AppConfig {
    UsbConfig usb;
    OrchestratorConfig orchestrator;
    LogConfig log;
    std::vector<DisplayConfig> displays;

    SessionOptions session_options() const {
        SessionOptions opts;
        opts.open_retry.max_attempts = usb.open_attempts;
        opts.open_retry.delay = std::chrono::milliseconds(usb.open_retry_delay_ms);
        opts.read_timeout_ms = static_cast<unsigned>(usb.read_timeout_ms);
        opts.write_timeout_ms = static_cast<unsigned>(usb.write_timeout_ms);
        return opts;
    }
};

// Field of one object: missing key = default, wrong type = Config error
template<typename T>
Result<T> jsonField(const nlohmann::json& obj, const std::string& where,
                    const std::string& key, const T& def) {
    if (!obj.is_object() || !obj.contains(key)) return def;
    try {
        return obj.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorKind::Config, where + "." + key + ": " + e.what());
    }
}

// Section/key accessor over the top-level object
template<typename T>
Result<T> jsonGet(const nlohmann::json& j, const std::string& section,
                  const std::string& key, const T& def) {
    if (!j.contains(section)) return def;
    return jsonField<T>(j.at(section), section, key, def);
}

// Non-negative integer field, rejected when above max
inline Result<int> jsonFieldRanged(const nlohmann::json& obj, const std::string& where,
                                   const std::string& key, int def, int max) {
    auto v = jsonField<int>(obj, where, key, def);
    if (!v) return v;
    if (v.value() < 0 || v.value() > max) {
        return Error(ErrorKind::Config, where + "." + key + " = " + std::to_string(v.value()) +
                     " out of range 0-" + std::to_string(max));
    }
    return v;
}

inline Result<int> jsonGetRanged(const nlohmann::json& j, const std::string& section,
                                 const std::string& key, int def, int max) {
    if (!j.contains(section)) return def;
    return jsonFieldRanged(j.at(section), section, key, def, max);
}

inline Result<DisplayConfig> parseDisplay(const nlohmann::json& entry, size_t index) {
    const std::string where = "displays[" + std::to_string(index) + "]";
    if (!entry.is_object()) return Error(ErrorKind::Config, where + " is not an object");

    DisplayConfig d;

    // "device" accepts an index as a number too
    if (entry.contains("device") && entry.at("device").is_number_integer()) {
        d.device = std::to_string(entry.at("device").get<int>());
    } else {
        d.device = SS_TRY(jsonField<std::string>(entry, where, "device", ""));
    }

    std::string mode = SS_TRY(jsonField<std::string>(entry, where, "mode", "stats"));
    auto parsed = mode_from_name(mode);
    if (!parsed) return Error(ErrorKind::Config, where + ": " + parsed.error().message);
    d.mode = parsed.value();

    d.settings.brightness = static_cast<uint8_t>(SS_TRY(jsonFieldRanged(entry, where, "brightness", 102, 255)));
    d.settings.rotation = static_cast<uint8_t>(SS_TRY(jsonFieldRanged(entry, where, "rotation", 0, 255)));
    d.settings.sleep = static_cast<uint8_t>(SS_TRY(jsonFieldRanged(entry, where, "sleep", 0, 255)));
    d.settings.offline = static_cast<uint8_t>(SS_TRY(jsonFieldRanged(entry, where, "offline", 0, 255)));
    auto valid = validate_settings(d.settings);
    if (!valid) return Error(ErrorKind::Config, where + ": " + valid.error().message);

    d.image = SS_TRY(jsonField<std::string>(entry, where, "image", ""));
    d.video = SS_TRY(jsonField<std::string>(entry, where, "video", ""));
    d.destination = SS_TRY(jsonField<std::string>(entry, where, "destination", ""));

    if (!d.image.empty() && !d.video.empty()) {
        return Error(ErrorKind::Config, where + ": set either image or video, not both");
    }
    if (!d.video.empty() && !std::holds_alternative<VideoMode>(d.mode)) {
        return Error(ErrorKind::Config, where + ": video asset needs mode \"video\"");
    }
    if (!d.image.empty() && std::holds_alternative<VideoMode>(d.mode)) {
        return Error(ErrorKind::Config, where + ": image asset needs mode \"stats\" or \"image\"");
    }
    return d;
}

inline Result<AppConfig> parseConfig(const nlohmann::json& j) {
    if (!j.is_object()) return Error(ErrorKind::Config, "top level is not an object");
    AppConfig config;

    config.usb.open_attempts = SS_TRY(jsonGetRanged(j, "usb", "open_attempts", 5, 100));
    if (config.usb.open_attempts < 1) return Error(ErrorKind::Config, "usb.open_attempts must be at least 1");
    config.usb.open_retry_delay_ms = SS_TRY(jsonGetRanged(j, "usb", "open_retry_delay_ms", 200, 60000));
    config.usb.read_timeout_ms = SS_TRY(jsonGetRanged(j, "usb", "read_timeout_ms", 2000, 60000));
    config.usb.write_timeout_ms = SS_TRY(jsonGetRanged(j, "usb", "write_timeout_ms", 2000, 60000));

    config.orchestrator.open_delay_ms = SS_TRY(jsonGetRanged(j, "orchestrator", "open_delay_ms", 500, 60000));
    config.orchestrator.sync_delay_ms = SS_TRY(jsonGetRanged(j, "orchestrator", "sync_delay_ms", 200, 60000));

    config.log.level = SS_TRY(jsonGet<std::string>(j, "log", "level", "warn"));
    config.log.log_path = SS_TRY(jsonGet<std::string>(j, "log", "log_path", ""));

    if (j.contains("displays")) {
        const auto& displays = j.at("displays");
        if (!displays.is_array()) return Error(ErrorKind::Config, "displays must be an array");
        for (size_t i = 0; i < displays.size(); i++) {
            config.displays.push_back(SS_TRY(parseDisplay(displays.at(i), i)));
        }
    }
    return config;
}

// @param configPath  Path to config file
// @param required    If false, a missing file yields the defaults
inline Result<AppConfig> loadConfig(const std::string& configPath = "smartscreen.json",
                                    bool required = false) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (required) return Error(ErrorKind::Config, "cannot open " + configPath);
        SLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return AppConfig{};
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        SLOG_ERROR("config", "JSON parse error in %s: %s", configPath.c_str(), e.what());
        return Error(ErrorKind::Config, configPath + ": " + e.what());
    }

    auto config = parseConfig(j);
    if (!config) {
        SLOG_ERROR("config", "%s: %s", configPath.c_str(), config.error().message.c_str());
        return config;
    }

    SLOG_INFO("config", "Loaded %s: %zu display(s), open_attempts=%d, open_delay=%dms",
              configPath.c_str(), config.value().displays.size(),
              config.value().usb.open_attempts, config.value().orchestrator.open_delay_ms);
    return config;
}

} // namespace config
} // namespace smartscreen
