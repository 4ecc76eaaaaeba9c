#pragma once
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace rpub {

// Lowest and highest physical values the MAX_Z product can carry.
constexpr float kMinDbz = -32.0f;
constexpr float kMaxDbz = 61.5f;

// Web Mercator is undefined beyond this latitude.
constexpr double kMercatorMaxLat = 85.05112878;

struct GeoBounds {
  double lon_min = 0.0;
  double lon_max = 0.0;
  double lat_min = 0.0;
  double lat_max = 0.0;

  bool isWebMercatorCompatible() const {
    return lon_min >= -180.0 && lon_max <= 180.0 && lon_min < lon_max &&
           lat_min >= -kMercatorMaxLat && lat_max <= kMercatorMaxLat && lat_min < lat_max;
  }

  // Linear index -> lon/lat of the cell centre. Row 0 is the northern edge.
  void cellCenter(int col, int row, int width, int height, double& lon, double& lat) const {
    lon = lon_min + (col + 0.5) * (lon_max - lon_min) / width;
    lat = lat_max - (row + 0.5) * (lat_max - lat_min) / height;
  }
};

// One decoded composite. Created and discarded inside a single render job.
struct ReflectivityGrid {
  int width = 0;
  int height = 0;
  GeoBounds bounds;
  std::string projection;      // ODIM where/projdef, may be empty
  std::time_t timestamp = 0;   // nominal UTC time of the product
  int lead_minutes = 0;        // 0 for the current stream
  double gain = 1.0;
  double offset = 0.0;
  std::vector<float> dbz;      // row-major, width*height
  std::vector<uint8_t> missing;
  size_t clamped_cells = 0;

  size_t index(int col, int row) const { return static_cast<size_t>(row) * width + col; }
  bool isMissing(int col, int row) const { return missing[index(col, row)] != 0; }
  float value(int col, int row) const { return dbz[index(col, row)]; }
};

} // namespace rpub
