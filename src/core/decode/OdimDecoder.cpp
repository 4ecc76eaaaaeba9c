#include "OdimDecoder.hpp"

#include <hdf5.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>

#include "core/errors/Errors.hpp"
#include "core/naming/Naming.hpp"

namespace rpub {

namespace {

// The distro HDF5 build is not thread-safe; all library calls are serialized.
std::mutex& hdf5Mutex() {
  static std::mutex mu;
  return mu;
}

const unsigned char kHdf5Signature[8] = {0x89, 'H', 'D', 'F', '\r', '\n', 0x1a, '\n'};

class H5Handle {
public:
  using Closer = herr_t (*)(hid_t);
  H5Handle(hid_t id, Closer close) : id_(id), close_(close) {}
  ~H5Handle() { if (id_ >= 0) close_(id_); }
  H5Handle(H5Handle&& o) noexcept : id_(o.id_), close_(o.close_) { o.id_ = -1; }
  H5Handle(const H5Handle&) = delete;
  H5Handle& operator=(const H5Handle&) = delete;
  hid_t get() const { return id_; }
  bool valid() const { return id_ >= 0; }
private:
  hid_t id_;
  Closer close_;
};

bool linkExists(hid_t file, const char* path) {
  return H5Lexists(file, path, H5P_DEFAULT) > 0;
}

H5Handle openGroup(hid_t file, const char* path) {
  if (!linkExists(file, path)) throw FormatError(std::string("missing group ") + path);
  H5Handle g(H5Gopen2(file, path, H5P_DEFAULT), H5Gclose);
  if (!g.valid()) throw CorruptDataError(std::string("cannot open group ") + path);
  return g;
}

bool hasAttr(hid_t loc, const char* name) {
  return H5Aexists(loc, name) > 0;
}

std::string readStringAttr(hid_t loc, const char* group, const char* name) {
  if (!hasAttr(loc, name)) throw FormatError(std::string("missing attribute ") + group + "@" + name);
  H5Handle attr(H5Aopen(loc, name, H5P_DEFAULT), H5Aclose);
  if (!attr.valid()) throw CorruptDataError(std::string("cannot open attribute ") + name);
  H5Handle type(H5Aget_type(attr.get()), H5Tclose);
  if (H5Tget_class(type.get()) != H5T_STRING)
    throw FormatError(std::string(group) + "@" + name + " is not a string");

  std::string out;
  if (H5Tis_variable_str(type.get()) > 0) {
    H5Handle mem(H5Tcopy(H5T_C_S1), H5Tclose);
    H5Tset_size(mem.get(), H5T_VARIABLE);
    char* value = nullptr;
    if (H5Aread(attr.get(), mem.get(), &value) < 0)
      throw CorruptDataError(std::string("cannot read attribute ") + name);
    if (value) {
      out = value;
      H5free_memory(value);
    }
  } else {
    const size_t size = H5Tget_size(type.get());
    H5Handle mem(H5Tcopy(H5T_C_S1), H5Tclose);
    H5Tset_size(mem.get(), size);
    std::vector<char> buf(size + 1, '\0');
    if (H5Aread(attr.get(), mem.get(), buf.data()) < 0)
      throw CorruptDataError(std::string("cannot read attribute ") + name);
    out.assign(buf.data(), std::strlen(buf.data()));
  }
  while (!out.empty() && (out.back() == ' ' || out.back() == '\0')) out.pop_back();
  return out;
}

std::optional<double> readNumberAttr(hid_t loc, const char* group, const char* name) {
  if (!hasAttr(loc, name)) return std::nullopt;
  H5Handle attr(H5Aopen(loc, name, H5P_DEFAULT), H5Aclose);
  if (!attr.valid()) throw CorruptDataError(std::string("cannot open attribute ") + name);
  H5Handle type(H5Aget_type(attr.get()), H5Tclose);
  H5Handle space(H5Aget_space(attr.get()), H5Sclose);
  if (H5Sget_simple_extent_npoints(space.get()) != 1)
    throw FormatError(std::string(group) + "@" + name + " is not a scalar");

  const H5T_class_t cls = H5Tget_class(type.get());
  if (cls == H5T_STRING) {
    // some producers write numbers as strings
    const std::string s = readStringAttr(loc, group, name);
    try {
      return std::stod(s);
    } catch (const std::exception&) {
      throw FormatError(std::string(group) + "@" + name + " is not numeric: " + s);
    }
  }
  if (cls != H5T_INTEGER && cls != H5T_FLOAT)
    throw FormatError(std::string(group) + "@" + name + " is not numeric");

  double v = 0.0;
  if (H5Aread(attr.get(), H5T_NATIVE_DOUBLE, &v) < 0)
    throw CorruptDataError(std::string("cannot read attribute ") + name);
  return v;
}

double requireNumberAttr(hid_t loc, const char* group, const char* name) {
  auto v = readNumberAttr(loc, group, name);
  if (!v) throw FormatError(std::string("missing attribute ") + group + "@" + name);
  return *v;
}

// data1/what first, then the dataset-level what (ODIM attribute inheritance).
double inheritedNumber(hid_t data_what, hid_t dataset_what, const char* name) {
  if (auto v = readNumberAttr(data_what, "/dataset1/data1/what", name)) return *v;
  if (dataset_what >= 0) {
    if (auto v = readNumberAttr(dataset_what, "/dataset1/what", name)) return *v;
  }
  throw FormatError(std::string("missing attribute /dataset1/data1/what@") + name);
}

std::time_t parseNominalTime(const std::string& date, const std::string& time) {
  if (date.size() != 8 || time.size() < 4)
    throw FormatError("bad /what date/time: " + date + " " + time);
  auto ts = extractTimestamp(date + (time.size() == 4 ? time + "00" : time.substr(0, 6)));
  if (!ts) throw FormatError("bad /what date/time: " + date + " " + time);
  return *ts;
}

// /where@xsize and ysize arrive as doubles; anything that is not a small
// positive integer is rejected before it is narrowed.
int gridDimension(hid_t where, const char* name) {
  const double v = requireNumberAttr(where, "/where", name);
  if (!std::isfinite(v) || v < 1.0 || v > 65535.0 || v != std::floor(v)) {
    throw FormatError(std::string("/where@") + name + " is not a valid grid dimension");
  }
  return static_cast<int>(v);
}

bool near(double a, double b, double tol) {
  return std::fabs(a - b) <= tol;
}

} // namespace

ReflectivityGrid OdimDecoder::decodeFile(const std::string& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw FilesystemError("cannot open source file " + path);
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) throw FilesystemError("read failed for " + path);
  return decode(bytes);
}

ReflectivityGrid OdimDecoder::decode(const std::vector<uint8_t>& bytes) const {
  if (bytes.size() < sizeof(kHdf5Signature) ||
      std::memcmp(bytes.data(), kHdf5Signature, sizeof(kHdf5Signature)) != 0) {
    throw CorruptDataError("not an HDF5 container");
  }

  ReflectivityGrid grid;
  int xsize = 0, ysize = 0;
  double nodata = 0.0, undetect = 0.0;
  std::vector<double> raw;

  // Library calls only; handles close before the lock is released.
  {
    std::lock_guard<std::mutex> lock(hdf5Mutex());
    H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);

    H5Handle fapl(H5Pcreate(H5P_FILE_ACCESS), H5Pclose);
    if (!fapl.valid() || H5Pset_fapl_core(fapl.get(), 1 << 16, 0) < 0 ||
        H5Pset_file_image(fapl.get(), const_cast<uint8_t*>(bytes.data()), bytes.size()) < 0) {
      throw CorruptDataError("cannot prepare HDF5 file image");
    }
    H5Handle file(H5Fopen("odim-image.h5", H5F_ACC_RDONLY, fapl.get()), H5Fclose);
    if (!file.valid()) throw CorruptDataError("HDF5 container cannot be opened");

    // /what
    {
      H5Handle what = openGroup(file.get(), "/what");
      const std::string date = readStringAttr(what.get(), "/what", "date");
      const std::string time = readStringAttr(what.get(), "/what", "time");
      grid.timestamp = parseNominalTime(date, time);
    }

    // /where
    {
      H5Handle where = openGroup(file.get(), "/where");
      grid.bounds.lon_min = requireNumberAttr(where.get(), "/where", "LL_lon");
      grid.bounds.lon_max = requireNumberAttr(where.get(), "/where", "UR_lon");
      grid.bounds.lat_min = requireNumberAttr(where.get(), "/where", "LL_lat");
      grid.bounds.lat_max = requireNumberAttr(where.get(), "/where", "UR_lat");
      xsize = gridDimension(where.get(), "xsize");
      ysize = gridDimension(where.get(), "ysize");
      if (hasAttr(where.get(), "projdef")) grid.projection = readStringAttr(where.get(), "/where", "projdef");
    }

    if (xsize != contract_.xsize || ysize != contract_.ysize) {
      throw FormatError("grid " + std::to_string(xsize) + "x" + std::to_string(ysize) +
                        " does not match product " + contract_.code + " (" +
                        std::to_string(contract_.xsize) + "x" + std::to_string(contract_.ysize) + ")");
    }
    const double tol = contract_.bounds_tolerance;
    if (!near(grid.bounds.lon_min, contract_.bounds.lon_min, tol) ||
        !near(grid.bounds.lon_max, contract_.bounds.lon_max, tol) ||
        !near(grid.bounds.lat_min, contract_.bounds.lat_min, tol) ||
        !near(grid.bounds.lat_max, contract_.bounds.lat_max, tol)) {
      throw FormatError("bounding box does not match product " + contract_.code);
    }
    if (!grid.bounds.isWebMercatorCompatible()) {
      throw FormatError("bounding box is not Web Mercator compatible");
    }

    // /dataset1/data1
    openGroup(file.get(), "/dataset1");
    openGroup(file.get(), "/dataset1/data1");
    H5Handle data_what = openGroup(file.get(), "/dataset1/data1/what");
    std::optional<H5Handle> dataset_what;
    if (linkExists(file.get(), "/dataset1/what")) dataset_what.emplace(openGroup(file.get(), "/dataset1/what"));
    const hid_t ds_what_id = dataset_what ? dataset_what->get() : -1;

    grid.gain   = inheritedNumber(data_what.get(), ds_what_id, "gain");
    grid.offset = inheritedNumber(data_what.get(), ds_what_id, "offset");
    nodata   = inheritedNumber(data_what.get(), ds_what_id, "nodata");
    undetect = inheritedNumber(data_what.get(), ds_what_id, "undetect");
    if (!std::isfinite(grid.gain) || grid.gain == 0.0 || !std::isfinite(grid.offset)) {
      throw FormatError("invalid calibration gain/offset");
    }

    if (!linkExists(file.get(), "/dataset1/data1/data")) throw FormatError("missing dataset /dataset1/data1/data");
    H5Handle dset(H5Dopen2(file.get(), "/dataset1/data1/data", H5P_DEFAULT), H5Dclose);
    if (!dset.valid()) throw CorruptDataError("cannot open /dataset1/data1/data");
    H5Handle space(H5Dget_space(dset.get()), H5Sclose);
    if (H5Sget_simple_extent_ndims(space.get()) != 2) throw FormatError("data is not two-dimensional");
    hsize_t dims[2] = {0, 0};
    H5Sget_simple_extent_dims(space.get(), dims, nullptr);
    if (dims[0] != static_cast<hsize_t>(ysize) || dims[1] != static_cast<hsize_t>(xsize)) {
      throw FormatError("data shape " + std::to_string(dims[1]) + "x" + std::to_string(dims[0]) +
                        " disagrees with /where xsize/ysize");
    }
    {
      H5Handle dtype(H5Dget_type(dset.get()), H5Tclose);
      const H5T_class_t cls = H5Tget_class(dtype.get());
      if (cls != H5T_INTEGER && cls != H5T_FLOAT) throw FormatError("data is not numeric");
    }

    raw.resize(static_cast<size_t>(xsize) * static_cast<size_t>(ysize));
    if (H5Dread(dset.get(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, raw.data()) < 0) {
      throw CorruptDataError("cannot read /dataset1/data1/data");
    }
  }

  const size_t n = raw.size();

  grid.width = xsize;
  grid.height = ysize;
  grid.dbz.assign(n, 0.0f);
  grid.missing.assign(n, 0);
  for (size_t i = 0; i < n; ++i) {
    const double r = raw[i];
    if (r == nodata || r == undetect || !std::isfinite(r)) {
      grid.missing[i] = 1;
      continue;
    }
    double v = r * grid.gain + grid.offset;
    if (v < kMinDbz || v > kMaxDbz) {
      v = v < kMinDbz ? kMinDbz : kMaxDbz;
      ++grid.clamped_cells;
    }
    grid.dbz[i] = static_cast<float>(v);
  }

  if (grid.clamped_cells > 0) {
    spdlog::debug("decode {}: clamped {} cells into [{}, {}] dBZ",
                  formatUtc(grid.timestamp), grid.clamped_cells, kMinDbz, kMaxDbz);
  }
  return grid;
}

} // namespace rpub
