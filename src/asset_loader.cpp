#include "asset_loader.hpp"
#include <cstring>
#include <fstream>
#include <iterator>
#include "screen_log.hpp"
#include "screen_protocol.hpp"
#include "stb_image.h"

using namespace smartscreen::protocol;

namespace smartscreen {

Result<ImageBuffer> load_image_file(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    unsigned char* pixels = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        SLOG_ERROR("asset", "Cannot load image %s: %s", path.c_str(), reason ? reason : "unknown");
        return Error(ErrorKind::NotFound,
                     "cannot load image '" + path + "': " + (reason ? reason : "unknown"));
    }

    ImageBuffer img;
    img.width = w;
    img.height = h;
    img.rgba.assign(pixels, pixels + static_cast<size_t>(w) * static_cast<size_t>(h) * 4);
    stbi_image_free(pixels);

    if (w != NATIVE_WIDTH || h != NATIVE_HEIGHT) {
        SLOG_WARN("asset", "%s is %dx%d, panel native resolution is %dx%d",
                  path.c_str(), w, h, NATIVE_WIDTH, NATIVE_HEIGHT);
    }
    SLOG_DEBUG("asset", "Loaded %s (%dx%d, %d source channels)", path.c_str(), w, h, channels);
    return img;
}

Result<std::vector<uint8_t>> read_file_bytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        SLOG_ERROR("asset", "Cannot open %s", path.c_str());
        return Error(ErrorKind::NotFound, "cannot open '" + path + "'");
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Error(ErrorKind::Io, "read error on '" + path + "'");
    }
    SLOG_DEBUG("asset", "Read %zu bytes from %s", bytes.size(), path.c_str());
    return bytes;
}

std::string file_basename(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace smartscreen
