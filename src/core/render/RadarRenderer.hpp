#pragma once
#include <cstdint>
#include <vector>

#include "core/decode/ReflectivityGrid.hpp"
#include "ColorTable.hpp"

namespace rpub {

// RGBA8, row-major, top row first.
struct RgbaRaster {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> pixels;

  Rgba at(int x, int y) const {
    const size_t i = (static_cast<size_t>(y) * width + x) * 4;
    return Rgba{pixels[i], pixels[i + 1], pixels[i + 2], pixels[i + 3]};
  }
};

// Maps a decoded grid onto a colour table. A scale of N replicates every
// cell into an N x N block, so the doubled variant keeps hard band edges and
// is identical to rendering natively at that density.
class RadarRenderer {
public:
  RgbaRaster render(const ReflectivityGrid& grid, const ColorTable& table, int scale) const;
};

} // namespace rpub
