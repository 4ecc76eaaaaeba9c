#include "ColorTable.hpp"

#include <cmath>
#include <cstdio>

namespace rpub {

ColorTable::ColorTable(std::string name, const std::array<uint32_t, kBandCount>& rgb)
  : name_(std::move(name)) {
  for (int i = 0; i < kBandCount; ++i) {
    colors_[i] = Rgba{static_cast<uint8_t>((rgb[i] >> 16) & 0xFF),
                      static_cast<uint8_t>((rgb[i] >> 8) & 0xFF),
                      static_cast<uint8_t>(rgb[i] & 0xFF),
                      255};
  }
}

const ColorTable& ColorTable::standard() {
  static const ColorTable table("standard", {
    0x390071, // 4-8 dBZ
    0x3001A9, // 8-12
    0x0200FB, // 12-16
    0x076CBC, // 16-20
    0x00A400, // 20-24
    0x00BB03, // 24-28
    0x36D700, // 28-32
    0x9CDD07, // 32-36
    0xE0DC01, // 36-40
    0xFBB200, // 40-44
    0xF78600, // 44-48
    0xFF5400, // 48-52
    0xFE0100, // 52-56
    0xA40003, // 56-60
    0xFCFCFC, // 60+
  });
  return table;
}

const ColorTable& ColorTable::contrast() {
  static const ColorTable table("contrast", {
    0x9BE8FF, 0x4FC3F7, 0x1E88E5, 0x0D47A1,
    0x00E676, 0x00C853, 0x1B5E20,
    0xFFFF00, 0xFFD600, 0xFF9100, 0xFF3D00,
    0xD50000, 0xFF00FF, 0xAA00FF, 0xFFFFFF,
  });
  return table;
}

std::vector<const ColorTable*> ColorTable::all() {
  return {&standard(), &contrast()};
}

int ColorTable::bandIndex(float dbz) const {
  if (std::isnan(dbz) || dbz < kThresholdDbz) return -1;
  const int band = static_cast<int>(std::floor((dbz - kThresholdDbz) / kBandWidthDbz));
  return band >= kBandCount ? kBandCount - 1 : band;
}

Rgba ColorTable::colorFor(float dbz, bool missing) const {
  if (missing) return kTransparent;
  const int band = bandIndex(dbz);
  return band < 0 ? kTransparent : colors_[band];
}

std::string toHex(const Rgba& c) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", c.r, c.g, c.b);
  return buf;
}

} // namespace rpub
