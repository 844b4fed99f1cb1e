#pragma once
// =============================================================================
// PNG band encoder (stb_image_write)
// =============================================================================
#include "image_bands.hpp"
#include "result.hpp"

namespace smartscreen {

// zlib level used by stb_image_write (0-9). The setting is process-wide:
// call it once at startup, before encoders run on other threads.
Result<void> set_png_compression_level(int level);

class PngBandEncoder : public BandEncoder {
public:
    Result<std::vector<uint8_t>> encode(const ImageBuffer& image, int y, int rows) override;
};

} // namespace smartscreen
