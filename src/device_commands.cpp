#include "device_commands.hpp"
#include <thread>
#include "screen_log.hpp"
#include "screen_protocol.hpp"
#include "transfer_engine.hpp"

using namespace smartscreen::protocol;

namespace smartscreen {

Result<void> sync(DeviceSession& session) {
    auto ack = session.request(CommandId::Sync);
    if (!ack) return ack.error();
    SLOG_INFO("session", "[%s] Synced", session.identity().serial.c_str());
    return Ok();
}

Result<void> restart(DeviceSession& session) {
    auto ack = session.request(CommandId::Restart);
    if (!ack) return ack.error();
    SLOG_INFO("session", "[%s] Restart requested", session.identity().serial.c_str());
    return Ok();
}

Result<void> set_brightness(DeviceSession& session, int value) {
    if (value < 0 || value > MAX_BRIGHTNESS) {
        return Error(ErrorKind::InvalidArgument,
                     "brightness " + std::to_string(value) + " out of range 0.." +
                     std::to_string(MAX_BRIGHTNESS));
    }
    auto ack = session.request(CommandId::SetBrightness, {static_cast<uint8_t>(value)});
    if (!ack) return ack.error();
    SLOG_INFO("session", "[%s] Brightness %d", session.identity().serial.c_str(), value);
    return Ok();
}

Result<void> save_settings(DeviceSession& session, const DisplayMode& mode,
                           const DisplaySettings& settings) {
    auto payload = build_settings_payload(mode, settings);
    if (!payload) return payload.error();

    auto ack = session.request(CommandId::SaveSettings, payload.value());
    if (!ack) return ack.error();

    session.set_last_mode(mode);
    SLOG_INFO("session", "[%s] Saved settings: mode=%s brightness=%u rotation=%u sleep=%u offline=%u",
              session.identity().serial.c_str(), mode_name(mode), settings.brightness,
              settings.rotation, settings.sleep, settings.offline);
    return Ok();
}

Result<void> delay_sync(DeviceSession& session, std::chrono::milliseconds delay,
                        const std::function<void(std::chrono::milliseconds)>& sleep) {
    if (delay.count() > 0) {
        if (sleep) sleep(delay);
        else std::this_thread::sleep_for(delay);
    }
    return sync(session);
}

Result<void> clear_image(DeviceSession& session, TransferEngine& engine) {
    SLOG_INFO("session", "[%s] Clearing image", session.identity().serial.c_str());
    return engine.upload_image(session, blank_image(NATIVE_WIDTH, NATIVE_HEIGHT));
}

} // namespace smartscreen
