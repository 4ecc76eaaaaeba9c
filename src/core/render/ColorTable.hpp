#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace rpub {

struct Rgba {
  uint8_t r = 0, g = 0, b = 0, a = 0;
  bool operator==(const Rgba& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
  bool operator!=(const Rgba& o) const { return !(*this == o); }
};

constexpr Rgba kTransparent{0, 0, 0, 0};

// Sorted-threshold colour table: band i covers the half-open interval
// [threshold + i*width, threshold + (i+1)*width). The last band is open-ended.
class ColorTable {
public:
  static constexpr float kThresholdDbz = 4.0f;
  static constexpr float kBandWidthDbz = 4.0f;
  static constexpr int   kBandCount = 15;

  ColorTable(std::string name, const std::array<uint32_t, kBandCount>& rgb);

  // Source institute palette, 4..64 dBZ.
  static const ColorTable& standard();
  // Same boundaries, colours chosen for legibility on light and dark base maps.
  static const ColorTable& contrast();
  static std::vector<const ColorTable*> all();

  // -1 for missing/NaN or below threshold, otherwise the band index.
  int bandIndex(float dbz) const;
  Rgba colorFor(float dbz, bool missing) const;
  Rgba bandColor(int band) const { return colors_[band]; }
  float lowerBound(int band) const { return kThresholdDbz + band * kBandWidthDbz; }

  const std::string& name() const { return name_; }

private:
  std::string name_;
  std::array<Rgba, kBandCount> colors_;
};

// "#RRGGBB" of an opaque colour
std::string toHex(const Rgba& c);

} // namespace rpub
