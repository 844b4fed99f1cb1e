// =============================================================================
// SmartScreen - Display Mode
// =============================================================================
// What the panel shows at startup, persisted by SAVE_SETTINGS (125).
// =============================================================================
#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "result.hpp"

namespace smartscreen {

struct StatsMode {};
struct ImageMode {};
struct VideoMode {};

using DisplayMode = std::variant<StatsMode, ImageMode, VideoMode>;

enum class TransferKind : uint8_t { Image, Video };

struct DisplaySettings {
    uint8_t brightness = 102;   // 0..102
    uint8_t rotation = 0;       // 0 = 0 deg, 2 = 180 deg (applied after restart)
    uint8_t sleep = 0;          // sleep timeout
    uint8_t offline = 0;        // 0 = disabled, 1 = enabled
};

// Startup byte sent on the wire: 0 stats, 1 image, 2 video
uint8_t startup_code(const DisplayMode& mode);
Result<DisplayMode> mode_from_startup_code(int code);

const char* mode_name(const DisplayMode& mode);
Result<DisplayMode> mode_from_name(const std::string& name);

// Range checks shared by the CLI and the config loader
Result<void> validate_settings(const DisplaySettings& settings);

// SAVE_SETTINGS payload; fails with InvalidArgument on out-of-range settings
Result<std::vector<uint8_t>> build_settings_payload(const DisplayMode& mode,
                                                    const DisplaySettings& settings);

// Image uploads fit Stats and Image mode, video uploads only Video mode
bool mode_accepts(const DisplayMode& mode, TransferKind kind);

inline const char* transfer_kind_name(TransferKind kind) {
    return kind == TransferKind::Image ? "image" : "video";
}

} // namespace smartscreen
