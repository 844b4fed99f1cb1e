// =============================================================================
// SmartScreen - Device Commands
// =============================================================================
// Single-frame control commands on an open DeviceSession, plus the two
// composite helpers used by the CLI (delayed sync, clear image).
// =============================================================================
#pragma once
#include <chrono>
#include <functional>
#include "device_session.hpp"
#include "display_mode.hpp"
#include "result.hpp"

namespace smartscreen {

class TransferEngine;

// Handshake; the panel answers with one frame
Result<void> sync(DeviceSession& session);

Result<void> restart(DeviceSession& session);

// 0..MAX_BRIGHTNESS, InvalidArgument otherwise
Result<void> set_brightness(DeviceSession& session, int value);

// Persist startup mode and settings; records the mode on the session
Result<void> save_settings(DeviceSession& session, const DisplayMode& mode,
                           const DisplaySettings& settings);

// Sleep, then sync. The panel drops the first command after a fresh open.
Result<void> delay_sync(DeviceSession& session, std::chrono::milliseconds delay,
                        const std::function<void(std::chrono::milliseconds)>& sleep = {});

// Upload a fully transparent native-resolution image
Result<void> clear_image(DeviceSession& session, TransferEngine& engine);

} // namespace smartscreen
