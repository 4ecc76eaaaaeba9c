#include "core/decode/OdimDecoder.hpp"
#include "core/errors/Errors.hpp"
#include "core/naming/Naming.hpp"
#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace
{
using namespace rpub;
using rpub_test::OdimFixture;
using rpub_test::TempDir;

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[decode-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

bool nearly_equal(double a, double b, double tol = 1.0e-4)
{
    return std::abs(a - b) <= tol;
}

template <typename E>
bool decode_throws(const OdimDecoder& decoder, const std::string& path)
{
    try
    {
        decoder.decodeFile(path);
    }
    catch (const E&)
    {
        return true;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[decode-regression] unexpected exception: " << e.what() << std::endl;
        return false;
    }
    return false;
}

int test_calibration_and_missing_cells()
{
    int failures = 0;
    TempDir dir("decode");
    OdimFixture fx;
    fx.at(0, 0) = OdimFixture::rawFor(42.0);
    fx.at(1, 0) = OdimFixture::rawFor(4.0);
    fx.at(2, 0) = static_cast<uint8_t>(fx.nodata);
    fx.at(597, 377) = OdimFixture::rawFor(-31.5);
    const std::string path = dir.str("composite.hdf");
    rpub_test::writeOdim(path, fx);

    OdimDecoder decoder{ProductContract{}};
    const ReflectivityGrid grid = decoder.decodeFile(path);

    failures += expect_true(grid.width == 598 && grid.height == 378, "grid dimensions must be 598x378");
    failures += expect_true(grid.timestamp == makeUtc(2025, 9, 13, 16, 25, 0), "nominal time from /what");
    failures += expect_true(nearly_equal(grid.gain, 0.5) && nearly_equal(grid.offset, -32.0),
                            "gain/offset from data1/what");
    failures += expect_true(nearly_equal(grid.value(0, 0), 42.0), "raw 148 must calibrate to 42 dBZ");
    failures += expect_true(nearly_equal(grid.value(1, 0), 4.0), "raw 72 must calibrate to 4 dBZ");
    failures += expect_true(grid.isMissing(2, 0), "nodata cell must be missing");
    failures += expect_true(grid.isMissing(3, 0), "undetect cell must be missing");
    failures += expect_true(!grid.isMissing(597, 377), "last cell is valid");
    failures += expect_true(nearly_equal(grid.value(597, 377), -31.5), "last cell value");
    failures += expect_true(!grid.projection.empty(), "projdef is carried through");
    failures += expect_true(grid.clamped_cells == 0, "no clamping for in-range data");

    bool in_range = true;
    for (int row = 0; row < grid.height; ++row)
    {
        for (int col = 0; col < grid.width; ++col)
        {
            if (grid.isMissing(col, row))
            {
                continue;
            }
            const float v = grid.value(col, row);
            in_range = in_range && v >= kMinDbz && v <= kMaxDbz;
        }
    }
    failures += expect_true(in_range, "every non-missing value must lie in [-32, 61.5]");
    return failures;
}

int test_inherited_calibration_and_clamping()
{
    int failures = 0;
    TempDir dir("decode-inherit");
    OdimFixture fx;
    fx.calibration_on_dataset = true;
    fx.at(10, 10) = 254;  // 254 * 0.5 - 32 = 95 dBZ
    const std::string path = dir.str("composite.hdf");
    rpub_test::writeOdim(path, fx);

    OdimDecoder decoder{ProductContract{}};
    const ReflectivityGrid grid = decoder.decodeFile(path);
    failures += expect_true(nearly_equal(grid.gain, 0.5), "gain inherited from /dataset1/what");
    failures += expect_true(nearly_equal(grid.value(10, 10), kMaxDbz), "out-of-range value is clamped");
    failures += expect_true(grid.clamped_cells == 1, "clamped cells are counted");
    return failures;
}

int test_decode_from_memory_matches_file()
{
    int failures = 0;
    TempDir dir("decode-mem");
    OdimFixture fx;
    fx.at(5, 6) = OdimFixture::rawFor(30.0);
    const std::string path = dir.str("composite.hdf");
    rpub_test::writeOdim(path, fx);

    OdimDecoder decoder{ProductContract{}};
    const ReflectivityGrid a = decoder.decode(rpub_test::readBytes(path));
    const ReflectivityGrid b = decoder.decodeFile(path);
    failures += expect_true(a.dbz == b.dbz && a.missing == b.missing, "buffer and file decode agree");
    return failures;
}

int test_format_errors()
{
    int failures = 0;
    TempDir dir("decode-format");
    OdimDecoder decoder{ProductContract{}};

    OdimFixture wrong_size;
    wrong_size.xsize = 100;
    wrong_size.ysize = 50;
    rpub_test::writeOdim(dir.str("size.hdf"), wrong_size);
    failures += expect_true(decode_throws<FormatError>(decoder, dir.str("size.hdf")),
                            "dimensions off-contract must raise FormatError");

    OdimFixture shifted;
    shifted.bounds.lon_min += 0.5;
    rpub_test::writeOdim(dir.str("bbox.hdf"), shifted);
    failures += expect_true(decode_throws<FormatError>(decoder, dir.str("bbox.hdf")),
                            "bounding box off-contract must raise FormatError");

    OdimFixture nowhere;
    nowhere.omit_where = true;
    rpub_test::writeOdim(dir.str("nowhere.hdf"), nowhere);
    failures += expect_true(decode_throws<FormatError>(decoder, dir.str("nowhere.hdf")),
                            "missing /where must raise FormatError");

    OdimFixture flat;
    flat.one_dimensional = true;
    rpub_test::writeOdim(dir.str("flat.hdf"), flat);
    failures += expect_true(decode_throws<FormatError>(decoder, dir.str("flat.hdf")),
                            "one-dimensional data must raise FormatError");

    ProductContract polar;
    polar.bounds = GeoBounds{11.267, 19.624, 48.047, 88.0};
    OdimFixture arctic;
    arctic.bounds = polar.bounds;
    rpub_test::writeOdim(dir.str("arctic.hdf"), arctic);
    failures += expect_true(decode_throws<FormatError>(OdimDecoder{polar}, dir.str("arctic.hdf")),
                            "bounds beyond Web Mercator must raise FormatError");

    const std::vector<std::pair<std::string, double>> bad_sizes{
        {"nan", std::nan("")}, {"huge", 1e300}, {"fraction", 598.5}, {"negative", -598.0}};
    for (const auto& bad : bad_sizes)
    {
        OdimFixture odd;
        odd.xsize_attr = bad.second;
        const std::string path = dir.str("xsize-" + bad.first + ".hdf");
        rpub_test::writeOdim(path, odd);
        failures += expect_true(decode_throws<FormatError>(decoder, path),
                                "xsize " + bad.first + " must raise FormatError");
    }

    OdimFixture exact;
    exact.xsize_attr = 598.0;
    rpub_test::writeOdim(dir.str("xsize-double.hdf"), exact);
    failures += expect_true(decoder.decodeFile(dir.str("xsize-double.hdf")).width == 598,
                            "integral double xsize is accepted");

    const FormatError err("x");
    failures += expect_true(err.permanent() && err.stage() == Stage::Decode, "FormatError is a permanent decode error");
    return failures;
}

int test_corrupt_containers()
{
    int failures = 0;
    TempDir dir("decode-corrupt");
    OdimDecoder decoder{ProductContract{}};

    rpub_test::writeBytes(dir.str("text.hdf"), "<html>not found</html>");
    failures += expect_true(decode_throws<CorruptDataError>(decoder, dir.str("text.hdf")),
                            "non-HDF5 bytes must raise CorruptDataError");

    OdimFixture fx;
    rpub_test::writeOdim(dir.str("good.hdf"), fx);
    std::string bytes = rpub_test::slurp(dir.str("good.hdf"));
    bytes.resize(600);
    rpub_test::writeBytes(dir.str("truncated.hdf"), bytes);
    failures += expect_true(decode_throws<CorruptDataError>(decoder, dir.str("truncated.hdf")),
                            "truncated container must raise CorruptDataError");

    failures += expect_true(decode_throws<FilesystemError>(decoder, dir.str("absent.hdf")),
                            "missing input file must raise FilesystemError");
    return failures;
}

int test_cell_geometry()
{
    int failures = 0;
    const GeoBounds b = ProductContract{}.bounds;
    double lon = 0.0;
    double lat = 0.0;
    b.cellCenter(0, 0, 598, 378, lon, lat);
    failures += expect_true(lon > b.lon_min && lon < b.lon_min + 0.02, "first column centre lies east of LL_lon");
    failures += expect_true(lat < b.lat_max && lat > b.lat_max - 0.02, "row 0 is the northern edge");
    b.cellCenter(597, 377, 598, 378, lon, lat);
    failures += expect_true(lon < b.lon_max && lat > b.lat_min, "last cell centre lies inside the box");
    failures += expect_true(b.isWebMercatorCompatible(), "product bounds are Web Mercator compatible");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_calibration_and_missing_cells();
    failures += test_inherited_calibration_and_clamping();
    failures += test_decode_from_memory_matches_file();
    failures += test_format_errors();
    failures += test_corrupt_containers();
    failures += test_cell_geometry();

    if (failures != 0)
    {
        std::cerr << "[decode-regression] " << failures << " failure(s)" << std::endl;
        return 1;
    }
    std::cout << "[decode-regression] PASS" << std::endl;
    return 0;
}
