// PNG encoding of image bands via stb_image_write
// STB_IMAGE_WRITE_IMPLEMENTATION is defined in stb_impl.cpp
#include "png_band_encoder.hpp"
#include <string>
#include "screen_log.hpp"
#include "stb_image_write.h"

namespace smartscreen {

namespace {

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    const auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // anonymous namespace

Result<void> set_png_compression_level(int level) {
    if (level < 0 || level > 9) {
        return Error(ErrorKind::InvalidArgument,
                     "PNG compression level " + std::to_string(level) + " outside 0..9");
    }
    stbi_write_png_compression_level = level;
    SLOG_DEBUG("png", "Compression level %d", level);
    return Ok();
}

Result<std::vector<uint8_t>> PngBandEncoder::encode(const ImageBuffer& image, int y, int rows) {
    if (!image.valid() || y < 0 || rows <= 0 || y + rows > image.height) {
        return Error(ErrorKind::InvalidArgument,
                     "band rows " + std::to_string(y) + "+" + std::to_string(rows) +
                     " outside " + std::to_string(image.width) + "x" + std::to_string(image.height));
    }

    std::vector<uint8_t> png;
    int ret = stbi_write_png_to_func(append_to_vector, &png, image.width, rows, 4,
                                     image.row(y), static_cast<int>(image.stride()));
    if (ret == 0) {
        SLOG_ERROR("png", "stbi_write_png failed for band y=%d rows=%d", y, rows);
        return Error(ErrorKind::InvalidArgument, "PNG encoding failed");
    }
    return png;
}

} // namespace smartscreen
