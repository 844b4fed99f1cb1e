#pragma once
// =============================================================================
// Asset loading - image files (stb_image) and raw Annex-B streams
// =============================================================================
#include <cstdint>
#include <string>
#include <vector>
#include "image_bands.hpp"
#include "result.hpp"

namespace smartscreen {

// PNG/JPEG/BMP -> RGBA. Warns when the size differs from the native panel.
Result<ImageBuffer> load_image_file(const std::string& path);

// Whole file as bytes (video streams)
Result<std::vector<uint8_t>> read_file_bytes(const std::string& path);

// Last path component ("clip.h264" for "/a/b/clip.h264")
std::string file_basename(const std::string& path);

} // namespace smartscreen
