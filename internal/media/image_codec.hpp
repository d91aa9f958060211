#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gigbook::media {

// 8-bit interleaved RGB, rows top to bottom.
struct RasterImage {
  uint32_t             width  = 0;
  uint32_t             height = 0;
  std::vector<uint8_t> rgb;
};

enum class ImageFormat { kUnknown, kJpeg, kPng };

// Sniffs magic bytes.
ImageFormat DetectImageFormat(std::string_view bytes);

/*
  JPEG via libjpeg, PNG via libpng's simplified API. Alpha is composited
  onto white. std::nullopt for anything else, for corrupt input and for
  images whose header declares more than `max_pixels` (0 = no limit);
  the header is checked before any pixel buffer is allocated. `error`
  receives the reason.
*/
std::optional<RasterImage> DecodeImage(std::string_view bytes, uint64_t max_pixels, std::string* error = nullptr);

/*
  Box-filter downscale so that width <= max_width, keeping aspect ratio.
  Images already narrow enough are returned unchanged.
*/
RasterImage Downscale(const RasterImage& image, uint32_t max_width);

// quality in 0..1, mapped onto libjpeg's 1..100. Throws std::runtime_error on encoder failure.
std::string EncodeJpeg(const RasterImage& image, double quality);

} // namespace gigbook::media
