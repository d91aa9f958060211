#include "image_codec.hpp"

// clang-format off
#include <cstdio>
#include <csetjmp>
#include <jpeglib.h>
#include <png.h>
// clang-format on

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>

namespace gigbook::media {

namespace {

/*
  libjpeg reports fatal errors through error_exit, which must not
  return. We longjmp back to the caller's setjmp point instead of
  letting the library call exit().
*/
struct JpegErrorManager {
  jpeg_error_mgr pub;
  jmp_buf        jump;
  char           message[JMSG_LENGTH_MAX];
};

void OnJpegError(j_common_ptr cinfo) {
  auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, err->message);
  longjmp(err->jump, 1);
}

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

std::string TooLarge(uint64_t width, uint64_t height, uint64_t max_pixels) {
  return "image too large: " + std::to_string(width) + "x" + std::to_string(height) + " pixels (max " + std::to_string(max_pixels) + ")";
}

bool ExceedsPixels(uint64_t width, uint64_t height, uint64_t max_pixels) {
  return max_pixels != 0 && width * height > max_pixels;
}

/*
  State for one libjpeg run. It lives in the caller's frame so the
  function holding setjmp owns no locals that change before a longjmp.
*/
struct JpegDecodeJob {
  jpeg_decompress_struct cinfo;
  JpegErrorManager       jerr;
  std::string_view       bytes;
  uint64_t               max_pixels = 0;
  RasterImage            image;
  bool                   too_large = false;
};

bool RunJpegDecode(JpegDecodeJob* job) {
  if (setjmp(job->jerr.jump)) {
    return false;
  }

  jpeg_create_decompress(&job->cinfo);
  jpeg_mem_src(&job->cinfo, reinterpret_cast<const unsigned char*>(job->bytes.data()), static_cast<unsigned long>(job->bytes.size()));
  jpeg_read_header(&job->cinfo, TRUE);
  if (ExceedsPixels(job->cinfo.image_width, job->cinfo.image_height, job->max_pixels)) {
    job->too_large = true;
    return false;
  }

  job->cinfo.out_color_space = JCS_RGB;
  jpeg_start_decompress(&job->cinfo);

  job->image.width  = job->cinfo.output_width;
  job->image.height = job->cinfo.output_height;
  job->image.rgb.resize(static_cast<size_t>(job->image.width) * job->image.height * 3);

  const size_t stride = static_cast<size_t>(job->image.width) * 3;
  while (job->cinfo.output_scanline < job->cinfo.output_height) {
    JSAMPROW row = job->image.rgb.data() + static_cast<size_t>(job->cinfo.output_scanline) * stride;
    jpeg_read_scanlines(&job->cinfo, &row, 1);
  }

  jpeg_finish_decompress(&job->cinfo);
  return true;
}

std::optional<RasterImage> DecodeJpeg(std::string_view bytes, uint64_t max_pixels, std::string* error) {
  JpegDecodeJob job;
  std::memset(&job.cinfo, 0, sizeof(job.cinfo));
  std::memset(job.jerr.message, 0, sizeof(job.jerr.message));
  job.cinfo.err           = jpeg_std_error(&job.jerr.pub);
  job.jerr.pub.error_exit = OnJpegError;
  job.bytes               = bytes;
  job.max_pixels          = max_pixels;

  bool ok = false;
  try {
    ok = RunJpegDecode(&job);
  } catch (const std::bad_alloc&) {
    jpeg_destroy_decompress(&job.cinfo);
    SetError(error, "jpeg: out of memory");
    return std::nullopt;
  }
  const uint64_t width  = job.cinfo.image_width;
  const uint64_t height = job.cinfo.image_height;
  jpeg_destroy_decompress(&job.cinfo);

  if (job.too_large) {
    SetError(error, TooLarge(width, height, max_pixels));
    return std::nullopt;
  }
  if (!ok) {
    SetError(error, std::string("jpeg: ") + job.jerr.message);
    return std::nullopt;
  }
  return std::move(job.image);
}

std::optional<RasterImage> DecodePng(std::string_view bytes, uint64_t max_pixels, std::string* error) {
  png_image png;
  std::memset(&png, 0, sizeof(png));
  png.version = PNG_IMAGE_VERSION;

  if (!png_image_begin_read_from_memory(&png, bytes.data(), bytes.size())) {
    SetError(error, std::string("png: ") + png.message);
    return std::nullopt;
  }
  if (ExceedsPixels(png.width, png.height, max_pixels)) {
    SetError(error, TooLarge(png.width, png.height, max_pixels));
    png_image_free(&png);
    return std::nullopt;
  }

  png.format = PNG_FORMAT_RGB;

  RasterImage image;
  image.width  = png.width;
  image.height = png.height;
  try {
    image.rgb.resize(PNG_IMAGE_SIZE(png));
  } catch (const std::bad_alloc&) {
    png_image_free(&png);
    SetError(error, "png: out of memory");
    return std::nullopt;
  }

  png_color white{255, 255, 255};
  if (!png_image_finish_read(&png, &white, image.rgb.data(), 0, nullptr)) {
    SetError(error, std::string("png: ") + png.message);
    png_image_free(&png);
    return std::nullopt;
  }
  return image;
}

struct JpegEncodeJob {
  jpeg_compress_struct cinfo;
  JpegErrorManager     jerr;
  const RasterImage*   image   = nullptr;
  int                  quality = 0;
  unsigned char*       buffer  = nullptr;
  unsigned long        size    = 0;
};

bool RunJpegEncode(JpegEncodeJob* job) {
  if (setjmp(job->jerr.jump)) {
    return false;
  }

  jpeg_create_compress(&job->cinfo);
  jpeg_mem_dest(&job->cinfo, &job->buffer, &job->size);

  job->cinfo.image_width      = job->image->width;
  job->cinfo.image_height     = job->image->height;
  job->cinfo.input_components = 3;
  job->cinfo.in_color_space   = JCS_RGB;
  jpeg_set_defaults(&job->cinfo);
  jpeg_set_quality(&job->cinfo, job->quality, TRUE);

  jpeg_start_compress(&job->cinfo, TRUE);
  const size_t stride = static_cast<size_t>(job->image->width) * 3;
  while (job->cinfo.next_scanline < job->cinfo.image_height) {
    auto* row = const_cast<JSAMPLE*>(job->image->rgb.data() + static_cast<size_t>(job->cinfo.next_scanline) * stride);
    jpeg_write_scanlines(&job->cinfo, &row, 1);
  }
  jpeg_finish_compress(&job->cinfo);
  return true;
}

} // namespace

ImageFormat DetectImageFormat(std::string_view bytes) {
  if (bytes.size() >= 3 && static_cast<unsigned char>(bytes[0]) == 0xFF && static_cast<unsigned char>(bytes[1]) == 0xD8 &&
      static_cast<unsigned char>(bytes[2]) == 0xFF) {
    return ImageFormat::kJpeg;
  }
  static constexpr unsigned char kPngMagic[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  if (bytes.size() >= sizeof(kPngMagic) && std::memcmp(bytes.data(), kPngMagic, sizeof(kPngMagic)) == 0) {
    return ImageFormat::kPng;
  }
  return ImageFormat::kUnknown;
}

std::optional<RasterImage> DecodeImage(std::string_view bytes, uint64_t max_pixels, std::string* error) {
  switch (DetectImageFormat(bytes)) {
    case ImageFormat::kJpeg:
      return DecodeJpeg(bytes, max_pixels, error);
    case ImageFormat::kPng:
      return DecodePng(bytes, max_pixels, error);
    case ImageFormat::kUnknown:
      break;
  }
  SetError(error, "unrecognized image format");
  return std::nullopt;
}

RasterImage Downscale(const RasterImage& image, uint32_t max_width) {
  if (max_width == 0 || image.width <= max_width) return image;

  RasterImage out;
  out.width  = max_width;
  out.height = std::max<uint32_t>(1, static_cast<uint32_t>(std::llround(static_cast<double>(image.height) * max_width / image.width)));
  out.rgb.resize(static_cast<size_t>(out.width) * out.height * 3);

  const double x_ratio = static_cast<double>(image.width) / out.width;
  const double y_ratio = static_cast<double>(image.height) / out.height;

  // Each output pixel averages the source pixels its footprint covers.
  for (uint32_t oy = 0; oy < out.height; ++oy) {
    const auto y0 = static_cast<uint32_t>(oy * y_ratio);
    const auto y1 = std::min<uint32_t>(image.height, std::max<uint32_t>(y0 + 1, static_cast<uint32_t>((oy + 1) * y_ratio)));

    for (uint32_t ox = 0; ox < out.width; ++ox) {
      const auto x0 = static_cast<uint32_t>(ox * x_ratio);
      const auto x1 = std::min<uint32_t>(image.width, std::max<uint32_t>(x0 + 1, static_cast<uint32_t>((ox + 1) * x_ratio)));

      uint64_t sum[3] = {0, 0, 0};
      for (uint32_t y = y0; y < y1; ++y) {
        const uint8_t* src = image.rgb.data() + (static_cast<size_t>(y) * image.width + x0) * 3;
        for (uint32_t x = x0; x < x1; ++x, src += 3) {
          sum[0] += src[0];
          sum[1] += src[1];
          sum[2] += src[2];
        }
      }

      const uint64_t count = static_cast<uint64_t>(y1 - y0) * (x1 - x0);
      uint8_t*       dst   = out.rgb.data() + (static_cast<size_t>(oy) * out.width + ox) * 3;
      for (int c = 0; c < 3; ++c) {
        dst[c] = static_cast<uint8_t>((sum[c] + count / 2) / count);
      }
    }
  }
  return out;
}

std::string EncodeJpeg(const RasterImage& image, double quality) {
  if (image.width == 0 || image.height == 0 || image.rgb.size() < static_cast<size_t>(image.width) * image.height * 3) {
    throw std::invalid_argument("cannot encode an empty or truncated raster");
  }

  JpegEncodeJob job;
  std::memset(&job.cinfo, 0, sizeof(job.cinfo));
  std::memset(job.jerr.message, 0, sizeof(job.jerr.message));
  job.cinfo.err           = jpeg_std_error(&job.jerr.pub);
  job.jerr.pub.error_exit = OnJpegError;
  job.image               = &image;
  job.quality             = std::clamp(static_cast<int>(std::lround(quality * 100.0)), 1, 100);

  const bool ok = RunJpegEncode(&job);
  jpeg_destroy_compress(&job.cinfo);
  if (!ok) {
    std::free(job.buffer);
    throw std::runtime_error(std::string("jpeg encode: ") + job.jerr.message);
  }

  std::string out(reinterpret_cast<const char*>(job.buffer), job.size);
  std::free(job.buffer);
  return out;
}

} // namespace gigbook::media
