#include "image_bands.hpp"
#include <algorithm>
#include <string>
#include "screen_log.hpp"

namespace smartscreen {

ImageBuffer blank_image(int width, int height) {
    ImageBuffer img;
    img.width = width;
    img.height = height;
    img.rgba.assign(static_cast<size_t>(width) * static_cast<size_t>(height) * 4, 0);
    return img;
}

namespace {

// Encode with bands of `rows` rows; false in `fits` if any band exceeds limit
Result<std::vector<EncodedBand>> encode_with_rows(const ImageBuffer& image, BandEncoder& encoder,
                                                  int rows, size_t limit, bool& fits) {
    std::vector<EncodedBand> bands;
    int count = (image.height + rows - 1) / rows;
    fits = true;
    for (int i = 0; i < count; i++) {
        int y = i * rows;
        int h = std::min(rows, image.height - y);
        auto data = encoder.encode(image, y, h);
        if (!data) return data.error();
        if (data.value().size() > limit) {
            SLOG_DEBUG("bands", "Band %d/%d (%d rows) encodes to %zu bytes > %zu",
                       i + 1, count, h, data.value().size(), limit);
            fits = false;
            return bands;
        }
        EncodedBand band;
        band.index = static_cast<uint16_t>(i);
        band.count = static_cast<uint16_t>(count);
        band.y = static_cast<uint16_t>(y);
        band.height = static_cast<uint16_t>(h);
        band.data = std::move(data).value();
        bands.push_back(std::move(band));
    }
    return bands;
}

} // anonymous namespace

Result<std::vector<EncodedBand>> split_into_bands(const ImageBuffer& image, BandEncoder& encoder,
                                                  size_t limit) {
    if (!image.valid()) {
        return Error(ErrorKind::InvalidArgument,
                     "malformed image buffer " + std::to_string(image.width) + "x" +
                     std::to_string(image.height) + " with " + std::to_string(image.rgba.size()) +
                     " bytes");
    }
    if (image.height > 0xFFFF || limit == 0) {
        return Error(ErrorKind::InvalidArgument, "image height or band limit out of range");
    }

    auto whole = encoder.encode(image, 0, image.height);
    if (!whole) return whole.error();
    if (whole.value().size() <= limit) {
        EncodedBand band;
        band.index = 0;
        band.count = 1;
        band.y = 0;
        band.height = static_cast<uint16_t>(image.height);
        band.data = std::move(whole).value();
        std::vector<EncodedBand> single;
        single.push_back(std::move(band));
        return single;
    }

    // Start from the size-proportional estimate and grow until every band fits
    size_t n = (whole.value().size() + limit - 1) / limit;
    if (n < 2) n = 2;

    bool fits = false;
    int last_rows = image.height;
    while (n <= static_cast<size_t>(image.height)) {
        int rows = static_cast<int>((static_cast<size_t>(image.height) + n - 1) / n);
        if (rows == last_rows) {
            n++;
            continue;
        }
        last_rows = rows;

        auto bands = encode_with_rows(image, encoder, rows, limit, fits);
        if (!bands) return bands.error();
        if (fits) {
            SLOG_INFO("bands", "Split %dx%d image into %zu band(s) of %d rows",
                      image.width, image.height, bands.value().size(), rows);
            return bands;
        }
        n++;
    }

    return Error(ErrorKind::InvalidArgument,
                 "a single image row encodes above the " + std::to_string(limit) + " byte band limit");
}

} // namespace smartscreen
