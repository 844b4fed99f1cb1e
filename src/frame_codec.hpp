// =============================================================================
// SmartScreen - Frame Codec
// =============================================================================
// Lays out and ciphers the fixed 512-byte command frame. Pure transform: no
// USB access, no shared state.
// =============================================================================
#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include "result.hpp"
#include "screen_protocol.hpp"

namespace smartscreen::codec {

using Frame = std::array<uint8_t, protocol::FRAME_SIZE>;
using Payload = std::array<uint8_t, protocol::MAX_PAYLOAD>;

struct DecodedFrame {
    uint8_t command_id = 0;
    uint32_t timestamp = 0;
    Payload payload{};  // full payload region, zero padded
};

// Milliseconds since local midnight, the device's clock reference
uint32_t timestamp_now();

// Fails with InvalidArgument when len > MAX_PAYLOAD
Result<Frame> encode_frame(protocol::CommandId cmd, const uint8_t* payload, size_t len,
                           uint32_t timestamp);

inline Result<Frame> encode_frame(protocol::CommandId cmd, const std::vector<uint8_t>& payload,
                                  uint32_t timestamp) {
    return encode_frame(cmd, payload.data(), payload.size(), timestamp);
}

// Fails with ProtocolFraming when the trailer or magic bytes are wrong
Result<DecodedFrame> decode_frame(const Frame& frame);

// Same as above for a raw buffer; anything but FRAME_SIZE bytes is framing error
Result<DecodedFrame> decode_frame(const uint8_t* data, size_t len);

} // namespace smartscreen::codec
