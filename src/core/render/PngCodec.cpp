#include "PngCodec.hpp"

#include <png.h>
#include <csetjmp>
#include <cstring>
#include <string>

#include "core/errors/Errors.hpp"

namespace rpub {

namespace {

struct ErrorSink {
  char message[256] = {0};
};

void onError(png_structp png, png_const_charp msg) {
  auto* sink = static_cast<ErrorSink*>(png_get_error_ptr(png));
  if (sink) std::strncpy(sink->message, msg, sizeof(sink->message) - 1);
  png_longjmp(png, 1);
}

void onWarning(png_structp, png_const_charp) {}

void onWrite(png_structp png, png_bytep data, png_size_t length) {
  auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
  out->insert(out->end(), data, data + length);
}

void onFlush(png_structp) {}

// Only trivially destructible locals live here because of setjmp.
bool writePng(const RgbaRaster& raster, int level, png_bytep* rows,
              std::vector<uint8_t>* out, ErrorSink* sink) {
  png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, sink, onError, onWarning);
  if (!png) {
    std::strncpy(sink->message, "png_create_write_struct failed", sizeof(sink->message) - 1);
    return false;
  }
  png_infop info = png_create_info_struct(png);
  if (!info) {
    png_destroy_write_struct(&png, nullptr);
    std::strncpy(sink->message, "png_create_info_struct failed", sizeof(sink->message) - 1);
    return false;
  }
  if (setjmp(png_jmpbuf(png))) {
    png_destroy_write_struct(&png, &info);
    return false;
  }

  png_set_write_fn(png, out, onWrite, onFlush);
  png_set_IHDR(png, info, static_cast<png_uint_32>(raster.width), static_cast<png_uint_32>(raster.height),
               8, PNG_COLOR_TYPE_RGBA, PNG_INTERLACE_NONE,
               PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
  png_set_compression_level(png, level);
  png_write_info(png, info);
  png_write_image(png, rows);
  png_write_end(png, nullptr);
  png_destroy_write_struct(&png, &info);
  return true;
}

} // namespace

std::vector<uint8_t> PngCodec::encode(const RgbaRaster& raster) const {
  if (raster.width <= 0 || raster.height <= 0 ||
      raster.pixels.size() != static_cast<size_t>(raster.width) * raster.height * 4) {
    throw RenderError("raster buffer does not match its dimensions");
  }

  std::vector<png_bytep> rows(raster.height);
  const size_t stride = static_cast<size_t>(raster.width) * 4;
  for (int y = 0; y < raster.height; ++y) {
    rows[y] = const_cast<png_bytep>(raster.pixels.data() + y * stride);
  }

  std::vector<uint8_t> out;
  out.reserve(stride * raster.height / 8);
  ErrorSink sink;
  if (!writePng(raster, level_, rows.data(), &out, &sink)) {
    throw RenderError(std::string("PNG encoding failed: ") + sink.message);
  }
  return out;
}

RgbaRaster PngCodec::decode(const std::vector<uint8_t>& bytes) {
  png_image image;
  std::memset(&image, 0, sizeof(image));
  image.version = PNG_IMAGE_VERSION;
  if (!png_image_begin_read_from_memory(&image, bytes.data(), bytes.size())) {
    throw RenderError(std::string("PNG decoding failed: ") + image.message);
  }
  image.format = PNG_FORMAT_RGBA;

  RgbaRaster out;
  out.width = static_cast<int>(image.width);
  out.height = static_cast<int>(image.height);
  out.pixels.resize(PNG_IMAGE_SIZE(image));
  if (!png_image_finish_read(&image, nullptr, out.pixels.data(), 0, nullptr)) {
    std::string msg = image.message;
    png_image_free(&image);
    throw RenderError("PNG decoding failed: " + msg);
  }
  return out;
}

} // namespace rpub
