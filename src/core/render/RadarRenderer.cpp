#include "RadarRenderer.hpp"

#include <algorithm>
#include <string>

#include "core/errors/Errors.hpp"

namespace rpub {

RgbaRaster RadarRenderer::render(const ReflectivityGrid& grid, const ColorTable& table, int scale) const {
  if (scale < 1) throw RenderError("scale must be >= 1, got " + std::to_string(scale));
  if (grid.width <= 0 || grid.height <= 0) throw RenderError("empty grid");
  const size_t cells = static_cast<size_t>(grid.width) * grid.height;
  if (grid.dbz.size() != cells || grid.missing.size() != cells) {
    throw RenderError("grid buffers do not match " + std::to_string(grid.width) + "x" +
                      std::to_string(grid.height));
  }
  if (!grid.bounds.isWebMercatorCompatible()) {
    throw RenderError("grid bounds are not Web Mercator compatible");
  }

  RgbaRaster out;
  out.width = grid.width * scale;
  out.height = grid.height * scale;
  out.pixels.assign(static_cast<size_t>(out.width) * out.height * 4, 0);

  const size_t stride = static_cast<size_t>(out.width) * 4;
  for (int row = 0; row < grid.height; ++row) {
    uint8_t* first_line = out.pixels.data() + static_cast<size_t>(row) * scale * stride;
    for (int col = 0; col < grid.width; ++col) {
      const Rgba c = table.colorFor(grid.value(col, row), grid.isMissing(col, row));
      uint8_t* px = first_line + static_cast<size_t>(col) * scale * 4;
      for (int k = 0; k < scale; ++k) {
        px[k * 4 + 0] = c.r;
        px[k * 4 + 1] = c.g;
        px[k * 4 + 2] = c.b;
        px[k * 4 + 3] = c.a;
      }
    }
    // remaining lines of the block are copies of the first
    for (int k = 1; k < scale; ++k) {
      std::copy(first_line, first_line + stride, first_line + k * stride);
    }
  }
  return out;
}

} // namespace rpub
