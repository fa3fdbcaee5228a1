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

#include <cogsink/common/datastructures.hpp>
#include <cogsink/io/PyramidSink.hpp>
#include <cogsink/misc/Downsampler.hpp>
#include <thread>

#include <catch2/catch_test_macros.hpp>

#include "FakeRasterBackend.hpp"

using namespace cogsink;
using namespace cogsink::io;
using cogsink::testing::crop;
using cogsink::testing::FakeRasterBackend;
using cogsink::testing::gradient;
using cogsink::testing::make_info;

namespace {
  Roi window(std::int64_t r0, std::int64_t r1, std::int64_t c0,
             std::int64_t c1) {
    return {Slice{r0, r1, std::nullopt}, Slice{c0, c1, std::nullopt}};
  }

  bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
  }
}  // namespace

TEST_CASE("pyramid of a 1024x1024 raster") {
  FakeRasterBackend backend;
  PyramidSink sink(backend, make_info(1024, 1024), "/out/a.tif");

  REQUIRE(sink.num_levels() == 3);
  CHECK(sink.level_info(0).width() == 1024);
  CHECK(sink.level_info(1).width() == 512);
  CHECK(sink.level_info(2).width() == 256);
  CHECK(sink.level_info(2).height() == 256);
  CHECK(sink.level_info(1).transform().coef[1] == 1.);
  CHECK(sink.level_info(2).crs() == "EPSG:28992");

  CHECK_FALSE(sink.overview_of(0).has_value());
  CHECK(sink.overview_of(1) == 0u);
  CHECK(sink.overview_of(2) == 1u);

  auto chain = sink.overview_chain();
  REQUIRE(chain.size() == 3);
  for (size_t i = 0; i < 3; ++i) CHECK(chain[i] == sink.level_name(i));

  sink.finalize();
}

TEST_CASE("odd sized raster has no overviews") {
  FakeRasterBackend backend;
  PyramidSink sink(backend, make_info(101, 101), "/out/b.tif");
  CHECK(sink.num_levels() == 1);
  sink.write({Slice{}, Slice{}}, gradient<std::uint8_t>(101, 101));
  sink.finalize();

  REQUIRE(backend.copies.size() == 1);
  CHECK(backend.copies[0].chain.size() == 1);
  CHECK(backend.copies[0].levels[0] == gradient<std::uint8_t>(101, 101));
}

TEST_CASE("pyramid planning stops") {
  SECTION("after an odd sized level") {
    auto plan = plan_pyramid(make_info(1000, 600), 64);
    REQUIRE(plan.size() == 4);
    CHECK(plan.back().width() == 125);
    CHECK(plan.back().height() == 75);
  }
  SECTION("after a level below the overview block size") {
    auto plan = plan_pyramid(make_info(2048, 4096), 512);
    REQUIRE(plan.size() == 4);
    CHECK(plan.back().width() == 256);
  }
  SECTION("at the level limit") {
    auto plan = plan_pyramid(make_info(65536, 65536), 16);
    REQUIRE(plan.size() == kMaxPyramidLevels);
    CHECK(plan.back().width() == 512);
  }
  SECTION("every level halves the previous one") {
    auto plan = plan_pyramid(make_info(6000, 4000), 100);
    for (size_t i = 1; i < plan.size(); ++i) {
      CHECK(plan[i].width() == plan[i - 1].width() / 2);
      CHECK(plan[i].height() == plan[i - 1].height() / 2);
      CHECK(plan[i - 1].width() % 2 == 0);
      CHECK(plan[i - 1].height() % 2 == 0);
      CHECK(std::min(plan[i - 1].width(), plan[i - 1].height()) >= 100u);
    }
  }
}

TEST_CASE("finalize without writes") {
  FakeRasterBackend backend;
  {
    PyramidSink sink(backend, make_info(1024, 1024), "/out/empty.tif");
    sink.finalize();
  }
  REQUIRE(backend.copies.size() == 1);
  const auto& copy = backend.copies[0];
  CHECK(copy.destination == "/out/empty.tif");
  REQUIRE(copy.levels.size() == 3);
  for (const auto& level : copy.levels) CHECK(level.empty());
  CHECK(backend.stores.empty());
}

TEST_CASE("writes are propagated to every level") {
  FakeRasterBackend backend;
  PyramidConfig cfg;
  cfg.block_size = 2;
  PyramidSink sink(backend, make_info(8, 8), "/out/p.tif", cfg);
  REQUIRE(sink.num_levels() == 4);

  auto full = gradient<std::uint8_t>(8, 8);
  sink.write({Slice{}, Slice{}}, full);
  sink.finalize();

  REQUIRE(backend.copies.size() == 1);
  const auto& levels = backend.copies[0].levels;
  REQUIRE(levels.size() == 4);
  CHECK(levels[0] == full);
  auto expected = misc::shrink2(full);
  CHECK(levels[1] == expected);
  expected = misc::shrink2(expected);
  CHECK(levels[2] == expected);
  expected = misc::shrink2(expected);
  CHECK(levels[3] == expected);
  CHECK(levels[3].shape() == std::vector<size_t>{1, 1});
}

TEST_CASE("windows must be aligned on every level") {
  FakeRasterBackend backend;
  PyramidConfig cfg;
  cfg.block_size = 8;
  PyramidSink sink(backend, make_info(64, 64), "/out/a.tif", cfg);
  REQUIRE(sink.num_levels() == 5);
  CHECK(sink.alignment() == 16);

  auto writes = [&](size_t i) {
    auto store = backend.store(sink.level_name(i));
    REQUIRE(store);
    return store->writes;
  };

  SECTION("misaligned window is rejected before anything is written") {
    // rows 12..24 halve to 6..12, 3..6 and then 1..3 for a single row block
    CHECK_THROWS_AS(
        sink.write(window(12, 24, 0, 64), gradient<std::uint8_t>(12, 64)),
        InvalidArgument);
    for (size_t i = 0; i < sink.num_levels(); ++i) {
      CHECK(writes(i) == 0);
    }
  }

  SECTION("aligned window reaches every level") {
    sink.write(window(16, 32, 0, 64), gradient<std::uint8_t>(16, 64));
    for (size_t i = 0; i < sink.num_levels(); ++i) {
      CHECK(writes(i) == 1);
    }
  }

  SECTION("multi-band windows are unsupported") {
    Roi roi{Slice{}, Slice{}, Slice{}};
    CHECK_THROWS_AS(sink.write(roi, gradient<std::uint8_t>(64, 64)),
                    UnsupportedOperation);
    CHECK(writes(0) == 0);
  }
}

TEST_CASE("tiled pyramid writes equal one full write") {
  auto info = make_info(512, 512, DataType::uint16);
  auto full = gradient<std::uint16_t>(512, 512);
  PyramidConfig cfg;
  cfg.block_size = 64;

  FakeRasterBackend whole_backend;
  PyramidSink whole(whole_backend, info, "/out/whole.tif", cfg);
  whole.write({Slice{}, Slice{}}, full);
  whole.close();

  FakeRasterBackend tiled_backend;
  PyramidSink tiled(tiled_backend, info, "/out/tiled.tif", cfg);
  REQUIRE(tiled.num_levels() == 5);
  std::vector<std::thread> workers;
  for (std::int64_t t = 0; t < 4; ++t) {
    workers.emplace_back([&, t]() {
      for (std::int64_t i = t; i < 16; i += 4) {
        std::int64_t r = (i / 4) * 128;
        std::int64_t c = (i % 4) * 128;
        tiled.write(window(r, r + 128, c, c + 128),
                    crop(full, r, c, 128, 128));
      }
    });
  }
  for (auto& w : workers) w.join();
  tiled.close();

  for (size_t i = 0; i < tiled.num_levels(); ++i) {
    auto a = whole_backend.store(whole.level_name(i));
    auto b = tiled_backend.store(tiled.level_name(i));
    REQUIRE(a);
    REQUIRE(b);
    CHECK(b->writes == 16);
    CHECK(a->band1() == b->band1());
  }

  whole.finalize();
  tiled.finalize();
}

TEST_CASE("temporary levels") {
  FakeRasterBackend backend;

  SECTION("in memory") {
    PyramidSink sink(backend, make_info(8192, 8192), "/out/t.tif");
    REQUIRE(sink.num_levels() == 6);

    const std::string base = sink.level_name(0);
    CHECK(base.rfind("/fake/", 0) == 0);
    CHECK(ends_with(base, ".tif"));
    CHECK(sink.level_name(1) == base + ".ovr");
    CHECK(sink.level_name(2) == base + ".ovr.ovr");

    int block = 2048;
    for (size_t i = 0; i < sink.num_levels(); ++i) {
      auto store = backend.store(sink.level_name(i));
      REQUIRE(store);
      CHECK(store->options.block_xsize == block);
      CHECK(store->options.block_ysize == block);
      CHECK(store->options.codec.at("COMPRESS") == "ZSTD");
      CHECK(store->options.codec.at("ZSTD_LEVEL") == "1");
      CHECK(store->options.codec.at("PREDICTOR") == "1");
      CHECK(store->options.codec.at("SPARSE_OK") == "TRUE");
      block /= 2;
    }
    sink.finalize();
    CHECK(backend.stores.empty());
    CHECK(backend.removed.size() == 6);
  }

  SECTION("tile size does not go below 64") {
    PyramidConfig cfg;
    cfg.block_size = 16;
    PyramidSink sink(backend, make_info(65536, 65536), "/out/t.tif", cfg);
    REQUIRE(sink.num_levels() == 8);
    CHECK(backend.store(sink.level_name(5))->options.block_xsize == 64);
    CHECK(backend.store(sink.level_name(6))->options.block_xsize == 64);
    CHECK(backend.store(sink.level_name(7))->options.block_xsize == 64);
  }

  SECTION("in a folder") {
    PyramidConfig cfg;
    cfg.temp_folder = "/scratch";
    PyramidSink sink(backend, make_info(1024, 1024), "/out/t.tif", cfg);
    const std::string base = sink.level_name(0);
    CHECK(base.rfind("/scratch/", 0) == 0);
    CHECK(sink.level_name(2) == base + ".ovr.ovr");
    sink.finalize();

    CHECK(backend.stores.empty());
    REQUIRE(backend.removed.size() == 3);
    CHECK(backend.removed[0] == base);
  }

  SECTION("two sinks do not share temporaries") {
    PyramidSink a(backend, make_info(64, 64), "/out/a.tif");
    PyramidSink b(backend, make_info(64, 64), "/out/b.tif");
    CHECK(a.level_name(0) != b.level_name(0));
    a.finalize();
    b.finalize();
  }
}

TEST_CASE("final output options") {
  FakeRasterBackend backend;
  PyramidConfig cfg;
  cfg.block_size = 256;
  cfg.overview_block_size = 512;
  cfg.codec.compress = "LZW";
  cfg.bigtiff = BigTiff::Yes;
  PyramidSink sink(backend, make_info(1024, 1024), "/out/o.tif", cfg);
  REQUIRE(sink.num_levels() == 3);
  sink.finalize();

  REQUIRE(backend.copies.size() == 1);
  const auto& opts = backend.copies[0].options;
  CHECK(opts.block_xsize == 256);
  CHECK(opts.block_ysize == 256);
  CHECK(opts.overview_block_size == 512);
  CHECK(opts.bigtiff);
  CHECK(opts.codec.at("COMPRESS") == "LZW");
  CHECK(opts.codec.at("ZLEVEL") == "6");
  CHECK(opts.codec.at("PREDICTOR") == "2");
}

TEST_CASE("finalize happens once") {
  FakeRasterBackend backend;
  PyramidSink sink(backend, make_info(64, 64), "/out/f.tif");
  sink.finalize();
  CHECK_THROWS_AS(sink.finalize(), cogsinkException);
  CHECK(backend.copies.size() == 1);
}

TEST_CASE("failed finalize keeps temporary levels") {
  FakeRasterBackend backend;
  backend.fail_copy = true;
  PyramidConfig cfg;
  cfg.temp_folder = "/scratch";
  std::vector<std::string> names;
  {
    PyramidSink sink(backend, make_info(1024, 1024), "/out/x.tif", cfg);
    for (size_t i = 0; i < sink.num_levels(); ++i) {
      names.push_back(sink.level_name(i));
    }
    CHECK_THROWS_AS(sink.finalize(), BackendIOError);
  }
  CHECK(backend.removed.empty());
  for (const auto& name : names) {
    auto store = backend.store(name);
    REQUIRE(store);
    CHECK(store->closed);
  }
}

TEST_CASE("invalid pyramid configuration") {
  FakeRasterBackend backend;
  PyramidConfig cfg;
  cfg.block_size = 0;
  CHECK_THROWS_AS(PyramidSink(backend, make_info(64, 64), "/out/i.tif", cfg),
                  ConfigurationError);
  cfg.block_size = 512;
  cfg.overview_block_size = -1;
  CHECK_THROWS_AS(PyramidSink(backend, make_info(64, 64), "/out/i.tif", cfg),
                  ConfigurationError);
  CHECK(backend.stores.empty());
}
