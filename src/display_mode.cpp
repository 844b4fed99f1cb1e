#include "display_mode.hpp"
#include "screen_protocol.hpp"

using namespace smartscreen::protocol;

namespace smartscreen {

uint8_t startup_code(const DisplayMode& mode) {
    if (std::holds_alternative<ImageMode>(mode)) return 1;
    if (std::holds_alternative<VideoMode>(mode)) return 2;
    return 0;
}

Result<DisplayMode> mode_from_startup_code(int code) {
    switch (code) {
        case 0: return DisplayMode(StatsMode{});
        case 1: return DisplayMode(ImageMode{});
        case 2: return DisplayMode(VideoMode{});
        default:
            return Error(ErrorKind::InvalidArgument,
                         "startup must be 0, 1 or 2 (got " + std::to_string(code) + ")");
    }
}

const char* mode_name(const DisplayMode& mode) {
    if (std::holds_alternative<ImageMode>(mode)) return "image";
    if (std::holds_alternative<VideoMode>(mode)) return "video";
    return "stats";
}

Result<DisplayMode> mode_from_name(const std::string& name) {
    if (name == "stats") return DisplayMode(StatsMode{});
    if (name == "image") return DisplayMode(ImageMode{});
    if (name == "video") return DisplayMode(VideoMode{});
    return Error(ErrorKind::InvalidArgument, "unknown display mode '" + name + "'");
}

Result<void> validate_settings(const DisplaySettings& settings) {
    if (settings.brightness > MAX_BRIGHTNESS) {
        return Error(ErrorKind::InvalidArgument,
                     "brightness " + std::to_string(settings.brightness) + " out of range 0-102");
    }
    if (settings.rotation != 0 && settings.rotation != 2) {
        return Error(ErrorKind::InvalidArgument,
                     "rotation must be 0 or 2 (got " + std::to_string(settings.rotation) + ")");
    }
    if (settings.offline > 1) {
        return Error(ErrorKind::InvalidArgument,
                     "offline must be 0 or 1 (got " + std::to_string(settings.offline) + ")");
    }
    return Ok();
}

Result<std::vector<uint8_t>> build_settings_payload(const DisplayMode& mode,
                                                    const DisplaySettings& settings) {
    auto valid = validate_settings(settings);
    if (!valid) return valid.error();

    std::vector<uint8_t> payload(SETTINGS_PAYLOAD_SIZE, 0);
    payload[SETTINGS_OFF_BRIGHTNESS] = settings.brightness;
    payload[SETTINGS_OFF_STARTUP] = startup_code(mode);
    payload[SETTINGS_OFF_RESERVED] = 0;
    payload[SETTINGS_OFF_ROTATION] = settings.rotation;
    payload[SETTINGS_OFF_SLEEP] = settings.sleep;
    payload[SETTINGS_OFF_OFFLINE] = settings.offline;
    return payload;
}

bool mode_accepts(const DisplayMode& mode, TransferKind kind) {
    if (kind == TransferKind::Video) return std::holds_alternative<VideoMode>(mode);
    return !std::holds_alternative<VideoMode>(mode);
}

} // namespace smartscreen
