// =============================================================================
// SmartScreen - Image Banding
// =============================================================================
// Cuts an RGBA image into horizontal bands whose encoded size fits the
// panel's per-band ceiling. Bands are numbered top to bottom; the transfer
// engine sends them in reverse.
// =============================================================================
#pragma once
#include <cstdint>
#include <vector>
#include "result.hpp"

namespace smartscreen {

// 8-bit RGBA, rows top to bottom, tightly packed
struct ImageBuffer {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgba;

    size_t stride() const { return static_cast<size_t>(width) * 4; }
    const uint8_t* row(int y) const { return rgba.data() + stride() * static_cast<size_t>(y); }
    bool valid() const {
        return width > 0 && height > 0 && rgba.size() == stride() * static_cast<size_t>(height);
    }
};

// Fully transparent image (used to clear the panel)
ImageBuffer blank_image(int width, int height);

class BandEncoder {
public:
    virtual ~BandEncoder() = default;
    // Encode rows [y, y + rows) as one self-contained image
    virtual Result<std::vector<uint8_t>> encode(const ImageBuffer& image, int y, int rows) = 0;
};

struct EncodedBand {
    uint16_t index = 0;     // 0 = top band
    uint16_t count = 0;
    uint16_t y = 0;
    uint16_t height = 0;
    std::vector<uint8_t> data;
};

// Fewest equal-height bands such that every band encodes within limit bytes.
// InvalidArgument if the image is malformed or even one row is too large.
Result<std::vector<EncodedBand>> split_into_bands(const ImageBuffer& image, BandEncoder& encoder,
                                                  size_t limit);

} // namespace smartscreen
