// Copyright (c) 2018-2025 TU Delft 3D geoinformation group, Ravi Peters (3DGI),
// and Balazs Dukai (3DGI)

// This file is part of cogsink

// cogsink is free software: you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. cogsink is distributed in the hope that it will be
// useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
// Public License for more details. You should have received a copy of the GNU
// General Public License along with cogsink. If not, see
// <https://www.gnu.org/licenses/>.

#include <cpl_vsi.h>
#include <gdal_priv.h>

#include <cogsink/io/PyramidSink.hpp>
#include <cogsink/io/TileSink.hpp>
#include <cogsink/misc/Downsampler.hpp>

#include <catch2/catch_test_macros.hpp>

#include "FakeRasterBackend.hpp"

using namespace cogsink;
using namespace cogsink::io;
using cogsink::testing::crop;
using cogsink::testing::gradient;
using cogsink::testing::make_info;

namespace {
  GDALDatasetUniquePtr open_raster(const std::string& name) {
    return GDALDatasetUniquePtr(
        GDALDataset::Open(name.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
  }

  std::vector<std::uint16_t> read_band(GDALRasterBand* band) {
    const int w = band->GetXSize();
    const int h = band->GetYSize();
    std::vector<std::uint16_t> values(static_cast<size_t>(w) * h);
    REQUIRE(band->RasterIO(GF_Read, 0, 0, w, h, values.data(), w, h,
                           GDT_UInt16, 0, 0, nullptr) == CE_None);
    return values;
  }
}  // namespace

TEST_CASE("gdal tile sink to memory") {
  auto backend = createRasterBackendGDAL();
  auto info = make_info(64, 32, DataType::uint16);
  auto full = gradient<std::uint16_t>(32, 64);

  MemoryFile mem(*backend, "cogsink-test", "tile.tif");
  CHECK(mem.name() == "/vsimem/cogsink-test/tile.tif");
  {
    TileSink sink(*backend, info, dst::ExistingHandle{&mem});
    sink.write({Slice{0, 16, std::nullopt}, Slice{}}, crop(full, 0, 0, 16, 64));
    sink.write({Slice{16, 32, std::nullopt}, Slice{}},
               crop(full, 16, 0, 16, 64));
  }

  auto ds = open_raster(mem.name());
  REQUIRE(ds);
  CHECK(ds->GetRasterXSize() == 64);
  CHECK(ds->GetRasterYSize() == 32);
  double gt[6];
  REQUIRE(ds->GetGeoTransform(gt) == CE_None);
  CHECK(gt[0] == 100000.);
  CHECK(gt[1] == 0.5);
  CHECK(gt[5] == -0.5);
  REQUIRE(ds->GetSpatialRef() != nullptr);
  CHECK(std::string(ds->GetSpatialRef()->GetAuthorityCode(nullptr)) ==
        "28992");

  auto values = read_band(ds->GetRasterBand(1));
  CHECK(std::memcmp(values.data(), full.raw(), full.byte_size()) == 0);
  ds.reset();

  mem.close();
  VSIStatBufL stat;
  CHECK(VSIStatL("/vsimem/cogsink-test/tile.tif", &stat) != 0);
}

TEST_CASE("gdal pyramid with embedded overviews") {
  auto backend = createRasterBackendGDAL();
  auto info = make_info(256, 256, DataType::uint16);
  auto full = gradient<std::uint16_t>(256, 256);
  const std::string out = "/vsimem/cogsink-test/pyramid.tif";

  PyramidConfig cfg;
  cfg.block_size = 64;
  std::vector<std::string> temps;
  {
    PyramidSink sink(*backend, info, out, cfg);
    REQUIRE(sink.num_levels() == 4);
    for (size_t i = 0; i < sink.num_levels(); ++i) {
      temps.push_back(sink.level_name(i));
    }
    for (std::int64_t r = 0; r < 256; r += 64) {
      for (std::int64_t c = 0; c < 256; c += 64) {
        sink.write({Slice{r, r + 64, std::nullopt}, Slice{c, c + 64, std::nullopt}},
                   crop(full, r, c, 64, 64));
      }
    }
    sink.finalize();
  }

  for (const auto& name : temps) {
    VSIStatBufL stat;
    CHECK(VSIStatL(name.c_str(), &stat) != 0);
  }

  auto ds = open_raster(out);
  REQUIRE(ds);
  CHECK(ds->GetRasterXSize() == 256);
  const char* compression =
      ds->GetMetadataItem("COMPRESSION", "IMAGE_STRUCTURE");
  REQUIRE(compression != nullptr);
  CHECK(std::string(compression) == "DEFLATE");

  GDALRasterBand* band = ds->GetRasterBand(1);
  int bx = 0, by = 0;
  band->GetBlockSize(&bx, &by);
  CHECK(bx == 64);
  CHECK(by == 64);
  REQUIRE(band->GetOverviewCount() == 3);
  CHECK(band->GetOverview(0)->GetXSize() == 128);
  CHECK(band->GetOverview(1)->GetXSize() == 64);
  CHECK(band->GetOverview(2)->GetXSize() == 32);

  auto values = read_band(band);
  CHECK(std::memcmp(values.data(), full.raw(), full.byte_size()) == 0);

  auto expected = misc::shrink2(full);
  auto ovr = read_band(band->GetOverview(0));
  CHECK(std::memcmp(ovr.data(), expected.raw(), expected.byte_size()) == 0);

  ds.reset();
  VSIUnlink(out.c_str());
}

TEST_CASE("gdal backend reports errors") {
  auto backend = createRasterBackendGDAL();
  CHECK_THROWS_AS(backend->copy_with_overviews({"/vsimem/does/not/exist.tif"},
                                               "/vsimem/cogsink-test/x.tif",
                                               CopyOptions()),
                  BackendIOError);
  CHECK_THROWS_AS(backend->copy_with_overviews({}, "/vsimem/cogsink-test/x.tif",
                                               CopyOptions()),
                  BackendIOError);
  // removing something that was never written is fine
  CHECK_NOTHROW(backend->remove("/vsimem/cogsink-test/never.tif"));

  GeoTransform gt;
  RasterDescriptor bad_crs(16, 16, 1, DataType::uint8, "not a crs", gt);
  CHECK_THROWS_AS(
      backend->open_for_write("/vsimem/cogsink-test/crs.tif", bad_crs,
                              WriteOptions()),
      BackendIOError);
  backend->remove("/vsimem/cogsink-test/crs.tif");
}
