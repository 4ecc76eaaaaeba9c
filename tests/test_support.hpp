#pragma once
// Fixture helpers shared by the regression executables: scratch
// directories, ODIM_H5 composites written with the HDF5 C API, ustar bundles.

#include <hdf5.h>
#include <sqlite3.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/config/Config.hpp"
#include "core/decode/ReflectivityGrid.hpp"
#include "core/manifest/InitDb.hpp"

#ifndef RPUB_SCHEMA_FILE
#define RPUB_SCHEMA_FILE "src/core/manifest/schema.sql"
#endif

namespace rpub_test {

namespace fs = std::filesystem;

class TempDir {
public:
  explicit TempDir(const std::string& tag) {
    static std::atomic<int> counter{0};
    path_ = fs::temp_directory_path() /
            ("rpub-" + tag + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& path() const { return path_; }
  std::string str(const std::string& child = "") const {
    return child.empty() ? path_.string() : (path_ / child).string();
  }

private:
  fs::path path_;
};

// Config rooted in a scratch directory, fast retries, no real network.
inline rpub::Config makeTestConfig(const TempDir& dir) {
  rpub::Config cfg = rpub::defaultConfig();
  cfg.workers.pool_size = 2;
  cfg.retry.attempts = 3;
  cfg.retry.backoff_base_ms = 1;
  cfg.retry.backoff_max_ms = 4;
  cfg.retry.timeout_seconds = 5;
  cfg.retry.cooldown_seconds = 900;
  cfg.storage.data_root = dir.str("data");
  cfg.storage.output_root = dir.str("output");
  cfg.storage.db_path = dir.str("manifest.db");
  cfg.storage.schema_path = RPUB_SCHEMA_FILE;
  cfg.streams.current.base_url = "http://127.0.0.1:9/current/";
  cfg.streams.forecast.base_url = "http://127.0.0.1:9/forecast/";
  return cfg;
}

inline void initTestDatabase(const rpub::Config& cfg) {
  rpub::initDatabase(cfg.storage.db_path, RPUB_SCHEMA_FILE);
}

// Row count of the manifest table for one source name.
inline int manifestRows(const rpub::Config& cfg, const char* table, const std::string& name) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(cfg.storage.db_path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
    sqlite3_close(db);
    throw std::runtime_error("cannot open " + cfg.storage.db_path);
  }
  const std::string sql = std::string("SELECT COUNT(*) FROM ") + table + " WHERE name = ?";
  sqlite3_stmt* st = nullptr;
  int count = -1;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) == SQLITE_OK) {
    sqlite3_bind_text(st, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(st) == SQLITE_ROW) count = sqlite3_column_int(st, 0);
  }
  sqlite3_finalize(st);
  sqlite3_close(db);
  return count;
}

inline std::vector<uint8_t> readBytes(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void writeBytes(const std::string& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

// Layout of a synthetic MAX_Z composite. Defaults match the product contract.
struct OdimFixture {
  int xsize = 598;
  int ysize = 378;
  rpub::GeoBounds bounds{11.267, 19.624, 48.047, 51.458};
  std::string date = "20250913";
  std::string time = "162500";
  double gain = 0.5;
  double offset = -32.0;
  double nodata = 255.0;
  double undetect = 0.0;
  bool calibration_on_dataset = false;   // gain/offset under /dataset1/what only
  bool omit_where = false;
  bool one_dimensional = false;
  std::optional<double> xsize_attr;      // written as a double instead of xsize
  std::vector<uint8_t> raw;              // ysize*xsize, empty = all undetect

  uint8_t& at(int col, int row) {
    if (raw.empty()) raw.assign(static_cast<size_t>(xsize) * ysize, static_cast<uint8_t>(undetect));
    return raw[static_cast<size_t>(row) * xsize + col];
  }
  static uint8_t rawFor(double dbz, double gain = 0.5, double offset = -32.0) {
    return static_cast<uint8_t>((dbz - offset) / gain + 0.5);
  }
};

namespace detail {

inline void check(herr_t rc, const char* what) {
  if (rc < 0) throw std::runtime_error(std::string("HDF5 fixture: ") + what);
}

inline void stringAttr(hid_t loc, const char* name, const std::string& value) {
  hid_t type = H5Tcopy(H5T_C_S1);
  H5Tset_size(type, value.size() + 1);
  H5Tset_strpad(type, H5T_STR_NULLTERM);
  hid_t space = H5Screate(H5S_SCALAR);
  hid_t attr = H5Acreate2(loc, name, type, space, H5P_DEFAULT, H5P_DEFAULT);
  check(H5Awrite(attr, type, value.c_str()), name);
  H5Aclose(attr);
  H5Sclose(space);
  H5Tclose(type);
}

inline void doubleAttr(hid_t loc, const char* name, double value) {
  hid_t space = H5Screate(H5S_SCALAR);
  hid_t attr = H5Acreate2(loc, name, H5T_IEEE_F64LE, space, H5P_DEFAULT, H5P_DEFAULT);
  check(H5Awrite(attr, H5T_NATIVE_DOUBLE, &value), name);
  H5Aclose(attr);
  H5Sclose(space);
}

inline void longAttr(hid_t loc, const char* name, long value) {
  hid_t space = H5Screate(H5S_SCALAR);
  hid_t attr = H5Acreate2(loc, name, H5T_STD_I64LE, space, H5P_DEFAULT, H5P_DEFAULT);
  check(H5Awrite(attr, H5T_NATIVE_LONG, &value), name);
  H5Aclose(attr);
  H5Sclose(space);
}

inline hid_t group(hid_t file, const char* path) {
  hid_t g = H5Gcreate2(file, path, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (g < 0) throw std::runtime_error(std::string("HDF5 fixture: group ") + path);
  return g;
}

} // namespace detail

inline void writeOdim(const std::string& path, OdimFixture fx) {
  if (fx.raw.empty()) fx.raw.assign(static_cast<size_t>(fx.xsize) * fx.ysize, static_cast<uint8_t>(fx.undetect));

  hid_t file = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
  if (file < 0) throw std::runtime_error("HDF5 fixture: cannot create " + path);

  hid_t what = detail::group(file, "/what");
  detail::stringAttr(what, "object", "COMP");
  detail::stringAttr(what, "date", fx.date);
  detail::stringAttr(what, "time", fx.time);
  H5Gclose(what);

  if (!fx.omit_where) {
    hid_t where = detail::group(file, "/where");
    detail::doubleAttr(where, "LL_lon", fx.bounds.lon_min);
    detail::doubleAttr(where, "UR_lon", fx.bounds.lon_max);
    detail::doubleAttr(where, "LL_lat", fx.bounds.lat_min);
    detail::doubleAttr(where, "UR_lat", fx.bounds.lat_max);
    if (fx.xsize_attr) {
      detail::doubleAttr(where, "xsize", *fx.xsize_attr);
    } else {
      detail::longAttr(where, "xsize", fx.xsize);
    }
    detail::longAttr(where, "ysize", fx.ysize);
    detail::stringAttr(where, "projdef", "+proj=merc +lon_0=0 +k=1 +x_0=0 +y_0=0 +ellps=WGS84");
    H5Gclose(where);
  }

  H5Gclose(detail::group(file, "/dataset1"));
  hid_t ds_what = detail::group(file, "/dataset1/what");
  detail::stringAttr(ds_what, "product", "MAX");
  if (fx.calibration_on_dataset) {
    detail::doubleAttr(ds_what, "gain", fx.gain);
    detail::doubleAttr(ds_what, "offset", fx.offset);
  }
  H5Gclose(ds_what);

  H5Gclose(detail::group(file, "/dataset1/data1"));
  hid_t data_what = detail::group(file, "/dataset1/data1/what");
  detail::stringAttr(data_what, "quantity", "DBZH");
  if (!fx.calibration_on_dataset) {
    detail::doubleAttr(data_what, "gain", fx.gain);
    detail::doubleAttr(data_what, "offset", fx.offset);
  }
  detail::doubleAttr(data_what, "nodata", fx.nodata);
  detail::doubleAttr(data_what, "undetect", fx.undetect);
  H5Gclose(data_what);

  hsize_t dims[2] = {static_cast<hsize_t>(fx.ysize), static_cast<hsize_t>(fx.xsize)};
  if (fx.one_dimensional) dims[0] = static_cast<hsize_t>(fx.ysize) * fx.xsize;
  hid_t space = H5Screate_simple(fx.one_dimensional ? 1 : 2, dims, nullptr);
  hid_t dset = H5Dcreate2(file, "/dataset1/data1/data", H5T_STD_U8LE, space,
                          H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  detail::check(H5Dwrite(dset, H5T_NATIVE_UCHAR, H5S_ALL, H5S_ALL, H5P_DEFAULT, fx.raw.data()), "data");
  H5Dclose(dset);
  H5Sclose(space);
  H5Fclose(file);
}

// Plain ustar archive of regular files.
inline void writeTar(const std::string& path, const std::vector<std::pair<std::string, std::string>>& members) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("cannot create " + path);
  for (const auto& m : members) {
    char h[512];
    std::memset(h, 0, sizeof(h));
    std::snprintf(h, 100, "%s", m.first.c_str());
    std::snprintf(h + 100, 8, "%07o", 0644);
    std::snprintf(h + 108, 8, "%07o", 0);
    std::snprintf(h + 116, 8, "%07o", 0);
    std::snprintf(h + 124, 12, "%011llo", static_cast<unsigned long long>(m.second.size()));
    std::snprintf(h + 136, 12, "%011o", 0);
    h[156] = '0';
    std::memcpy(h + 257, "ustar", 6);
    std::memcpy(h + 263, "00", 2);
    std::memset(h + 148, ' ', 8);
    unsigned sum = 0;
    for (unsigned char c : h) sum += c;
    std::snprintf(h + 148, 8, "%06o", sum);
    h[155] = ' ';
    out.write(h, sizeof(h));
    out.write(m.second.data(), static_cast<std::streamsize>(m.second.size()));
    const size_t pad = (512 - m.second.size() % 512) % 512;
    out.write(std::string(pad, '\0').data(), static_cast<std::streamsize>(pad));
  }
  const std::string end(1024, '\0');
  out.write(end.data(), static_cast<std::streamsize>(end.size()));
}

inline std::string slurp(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace rpub_test
