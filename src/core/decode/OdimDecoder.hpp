#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "core/config/Config.hpp"
#include "ReflectivityGrid.hpp"

namespace rpub {

// Decodes an ODIM_H5 MAX_Z composite into physical reflectivity.
//
// Reads /what (date, time), /where (corners, xsize, ysize, projdef) and
// /dataset1/data1 (data plus gain, offset, nodata, undetect; calibration
// falls back to /dataset1/what). Raw values equal to nodata or undetect
// become missing cells. Throws FormatError when the layout or the product
// contract does not match and CorruptDataError when HDF5 cannot read the
// container.
class OdimDecoder {
public:
  explicit OdimDecoder(ProductContract contract) : contract_(std::move(contract)) {}

  ReflectivityGrid decode(const std::vector<uint8_t>& bytes) const;
  ReflectivityGrid decodeFile(const std::string& path) const;

private:
  ProductContract contract_;
};

} // namespace rpub
