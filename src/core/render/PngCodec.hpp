#pragma once
#include <cstdint>
#include <vector>

#include "RadarRenderer.hpp"

namespace rpub {

// libpng encode/decode of RGBA rasters. Encoding writes no time or text
// chunks, so equal rasters always produce equal bytes.
class PngCodec {
public:
  explicit PngCodec(int compression_level = 9) : level_(compression_level) {}

  std::vector<uint8_t> encode(const RgbaRaster& raster) const;   // throws RenderError
  static RgbaRaster decode(const std::vector<uint8_t>& bytes);   // throws RenderError

private:
  int level_;
};

} // namespace rpub
