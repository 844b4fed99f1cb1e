#include "frame_codec.hpp"
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>
#include <openssl/des.h>
#include "screen_log.hpp"

using namespace smartscreen::protocol;

namespace smartscreen::codec {

namespace {

// DES-CBC over the cipher span, key doubles as IV, restarted per frame
void des_cbc(const uint8_t* in, uint8_t* out, size_t len, int direction) {
    DES_cblock key;
    memcpy(key, CIPHER_KEY, sizeof(key));
    DES_key_schedule schedule;
    DES_set_key_unchecked(&key, &schedule);

    DES_cblock iv;
    memcpy(iv, CIPHER_KEY, sizeof(iv));
    DES_ncbc_encrypt(in, out, static_cast<long>(len), &schedule, &iv, direction);
}

} // anonymous namespace

uint32_t timestamp_now() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    struct tm local;
    localtime_r(&t, &local);
    local.tm_hour = 0;
    local.tm_min = 0;
    local.tm_sec = 0;
    std::time_t midnight = mktime(&local);
    auto since = now - std::chrono::system_clock::from_time_t(midnight);
    return static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(since).count());
}

Result<Frame> encode_frame(CommandId cmd, const uint8_t* payload, size_t len,
                           uint32_t timestamp) {
    if (len > MAX_PAYLOAD) {
        return Error(ErrorKind::InvalidArgument,
                     "payload of " + std::to_string(len) + " bytes exceeds " +
                     std::to_string(MAX_PAYLOAD) + " for " + cmd_name(cmd));
    }

    if (len > FRAME_DATA_CAPACITY) {
        SLOG_WARN("codec", "%s payload of %zu bytes: bytes past %zu are not enciphered",
                  cmd_name(cmd), len, FRAME_DATA_CAPACITY);
    }

    Frame plain{};
    plain[OFF_COMMAND] = static_cast<uint8_t>(cmd);
    plain[OFF_RESERVED] = 0;
    plain[OFF_MAGIC] = MAGIC_0;
    plain[OFF_MAGIC + 1] = MAGIC_1;
    plain[OFF_TIMESTAMP + 0] = timestamp & 0xFF;
    plain[OFF_TIMESTAMP + 1] = (timestamp >> 8) & 0xFF;
    plain[OFF_TIMESTAMP + 2] = (timestamp >> 16) & 0xFF;
    plain[OFF_TIMESTAMP + 3] = (timestamp >> 24) & 0xFF;
    if (payload && len > 0) {
        memcpy(plain.data() + OFF_PAYLOAD, payload, len);
    }

    Frame wire = plain;
    des_cbc(plain.data(), wire.data(), CIPHER_SPAN, DES_ENCRYPT);
    wire[OFF_TRAILER] = TRAILER_0;
    wire[OFF_TRAILER + 1] = TRAILER_1;
    return wire;
}

Result<DecodedFrame> decode_frame(const Frame& frame) {
    if (frame[OFF_TRAILER] != TRAILER_0 || frame[OFF_TRAILER + 1] != TRAILER_1) {
        char msg[64];
        snprintf(msg, sizeof(msg), "bad trailer %02x %02x",
                 frame[OFF_TRAILER], frame[OFF_TRAILER + 1]);
        return Error(ErrorKind::ProtocolFraming, msg);
    }

    Frame plain = frame;
    des_cbc(frame.data(), plain.data(), CIPHER_SPAN, DES_DECRYPT);

    if (plain[OFF_MAGIC] != MAGIC_0 || plain[OFF_MAGIC + 1] != MAGIC_1) {
        char msg[64];
        snprintf(msg, sizeof(msg), "bad magic %02x %02x (cipher key mismatch?)",
                 plain[OFF_MAGIC], plain[OFF_MAGIC + 1]);
        return Error(ErrorKind::ProtocolFraming, msg);
    }

    DecodedFrame out;
    out.command_id = plain[OFF_COMMAND];
    out.timestamp = static_cast<uint32_t>(plain[OFF_TIMESTAMP]) |
                    (static_cast<uint32_t>(plain[OFF_TIMESTAMP + 1]) << 8) |
                    (static_cast<uint32_t>(plain[OFF_TIMESTAMP + 2]) << 16) |
                    (static_cast<uint32_t>(plain[OFF_TIMESTAMP + 3]) << 24);
    memcpy(out.payload.data(), plain.data() + OFF_PAYLOAD, MAX_PAYLOAD);
    return out;
}

Result<DecodedFrame> decode_frame(const uint8_t* data, size_t len) {
    if (len != FRAME_SIZE) {
        return Error(ErrorKind::ProtocolFraming,
                     "frame of " + std::to_string(len) + " bytes, expected " +
                     std::to_string(FRAME_SIZE));
    }
    Frame frame;
    memcpy(frame.data(), data, FRAME_SIZE);
    return decode_frame(frame);
}

} // namespace smartscreen::codec
