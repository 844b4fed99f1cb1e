// =============================================================================
// SmartScreen - Protocol Constants & Utilities
// =============================================================================
// Wire definitions for the 1CBE:0088 panel family.
//
// Frame (512 bytes):
//   [0]        command id
//   [1]        reserved (0)
//   [2..3]     magic 0x1A 0x6D
//   [4..7]     timestamp, LE, ms since local midnight
//   [8..505]   payload (498 bytes, zero padded)
//   [506..509] zero
//   [510..511] trailer 0xA1 0x1A
//
// The panel deciphers bytes [0..503] only. Payload bytes 496 and 497 sit
// past that span and go out in the clear, so multi-frame transfers fill at
// most FRAME_DATA_CAPACITY bytes per frame.
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

namespace smartscreen::protocol {

// USB identity
static constexpr uint16_t PANEL_VID = 0x1CBE;
static constexpr uint16_t PANEL_PID = 0x0088;
static constexpr int      PANEL_INTERFACE = 0;

// Frame geometry
static constexpr size_t FRAME_SIZE       = 512;
static constexpr size_t OFF_COMMAND      = 0;
static constexpr size_t OFF_RESERVED     = 1;
static constexpr size_t OFF_MAGIC        = 2;
static constexpr size_t OFF_TIMESTAMP    = 4;
static constexpr size_t OFF_PAYLOAD      = 8;
static constexpr size_t MAX_PAYLOAD      = 498;
static constexpr size_t OFF_TRAILER      = FRAME_SIZE - 2;
static constexpr size_t CIPHER_SPAN      = 504;  // 63 DES blocks
static constexpr size_t FRAME_DATA_CAPACITY = CIPHER_SPAN - OFF_PAYLOAD;  // 496

static constexpr uint8_t MAGIC_0   = 0x1A;
static constexpr uint8_t MAGIC_1   = 0x6D;
static constexpr uint8_t TRAILER_0 = 0xA1;
static constexpr uint8_t TRAILER_1 = 0x1A;

// DES key, also used as the CBC IV
static constexpr uint8_t CIPHER_KEY[8] = {'s', 'l', 'v', '3', 't', 'u', 'z', 'x'};

// Commands (host -> panel)
enum class CommandId : uint8_t {
    Sync          = 10,
    Restart       = 11,
    SetBrightness = 14,
    SendImage     = 102,
    SendVideo     = 121,
    SaveSettings  = 125,
};

// Transfer limits
static constexpr size_t IMAGE_BAND_LIMIT  = 512 * 1024;
static constexpr size_t VIDEO_CHUNK_SIZE  = 202000;
static constexpr size_t MAX_STORAGE_PATH  = 255;

// Native panel geometry (portrait)
static constexpr int NATIVE_WIDTH  = 480;
static constexpr int NATIVE_HEIGHT = 1920;

// Settings ranges
static constexpr uint8_t MAX_BRIGHTNESS = 102;

// On-device storage
static constexpr const char* STORAGE_ROOT = "/tmp/sdcard/mmcblk0p1/";
static constexpr const char* IMAGE_DIR    = "/tmp/sdcard/mmcblk0p1/img/";
static constexpr const char* VIDEO_DIR    = "/tmp/sdcard/mmcblk0p1/video/";

// Image band header payload
static constexpr size_t BAND_OFF_SIZE     = 0;
static constexpr size_t BAND_OFF_INDEX    = 4;
static constexpr size_t BAND_OFF_COUNT    = 6;
static constexpr size_t BAND_OFF_Y        = 8;
static constexpr size_t BAND_OFF_HEIGHT   = 10;
static constexpr size_t BAND_OFF_PATH_LEN = 12;
static constexpr size_t BAND_OFF_PATH     = 13;

// Video chunk header payload
static constexpr size_t CHUNK_OFF_SIZE     = 0;
static constexpr size_t CHUNK_OFF_INDEX    = 4;
static constexpr size_t CHUNK_OFF_EOS      = 8;
static constexpr size_t CHUNK_OFF_PATH_LEN = 9;
static constexpr size_t CHUNK_OFF_PATH     = 10;

// Save-settings payload
static constexpr size_t SETTINGS_OFF_BRIGHTNESS = 0;
static constexpr size_t SETTINGS_OFF_STARTUP    = 1;
static constexpr size_t SETTINGS_OFF_RESERVED   = 2;
static constexpr size_t SETTINGS_OFF_ROTATION   = 3;
static constexpr size_t SETTINGS_OFF_SLEEP      = 4;
static constexpr size_t SETTINGS_OFF_OFFLINE    = 5;
static constexpr size_t SETTINGS_PAYLOAD_SIZE   = 6;

// =============================================================================
// Big-endian field helpers (payload integers are big-endian)
// =============================================================================
inline void put_be16(uint8_t* p, uint16_t v) {
    p[0] = (v >> 8) & 0xFF;
    p[1] = v & 0xFF;
}

inline void put_be32(uint8_t* p, uint32_t v) {
    p[0] = (v >> 24) & 0xFF;
    p[1] = (v >> 16) & 0xFF;
    p[2] = (v >> 8) & 0xFF;
    p[3] = v & 0xFF;
}

inline uint16_t get_be16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t get_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

// =============================================================================
// Command name for logging
// =============================================================================
inline const char* cmd_name(uint8_t cmd) {
    switch (static_cast<CommandId>(cmd)) {
        case CommandId::Sync:          return "SYNC";
        case CommandId::Restart:       return "RESTART";
        case CommandId::SetBrightness: return "SET_BRIGHTNESS";
        case CommandId::SendImage:     return "SEND_IMAGE";
        case CommandId::SendVideo:     return "SEND_VIDEO";
        case CommandId::SaveSettings:  return "SAVE_SETTINGS";
    }
    return "UNKNOWN";
}

inline const char* cmd_name(CommandId cmd) {
    return cmd_name(static_cast<uint8_t>(cmd));
}

inline bool is_known_command(uint8_t cmd) {
    return std::string(cmd_name(cmd)) != "UNKNOWN";
}

} // namespace smartscreen::protocol
