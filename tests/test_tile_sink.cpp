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

#include <cogsink/io/TileSink.hpp>
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
}  // namespace

TEST_CASE("tiled writes equal one full write") {
  FakeRasterBackend backend;
  auto info = make_info(64, 48, DataType::uint16);
  auto full = gradient<std::uint16_t>(48, 64);

  {
    TileSink whole(backend, info, dst::Path{"/out/whole.tif"});
    whole.write({Slice{}, Slice{}}, full);

    TileSink tiled(backend, info, dst::Path{"/out/tiled.tif"});
    for (std::int64_t r = 0; r < 48; r += 16) {
      for (std::int64_t c = 0; c < 64; c += 32) {
        tiled.write(window(r, r + 16, c, c + 32), crop(full, r, c, 16, 32));
      }
    }
  }

  auto a = backend.store("/out/whole.tif");
  auto b = backend.store("/out/tiled.tif");
  REQUIRE(a);
  REQUIRE(b);
  CHECK(a->closed);
  CHECK(b->closed);
  CHECK(b->writes == 6);
  CHECK(a->pixels == full);
  CHECK(b->pixels == full);
}

TEST_CASE("tile sink creation options") {
  FakeRasterBackend backend;
  TileSinkOptions opts;
  opts.block_size = 500;
  opts.codec.compress = "LZW";

  TileSink sink(backend, make_info(1000, 100), dst::Path{"/a.tif"}, opts);
  auto store = backend.store("/a.tif");
  REQUIRE(store);
  // rounded up to a multiple of 16 and capped to the raster size
  CHECK(store->options.block_xsize == 512);
  CHECK(store->options.block_ysize == 112);
  CHECK_FALSE(store->options.bigtiff);
  CHECK(store->options.codec.at("COMPRESS") == "LZW");
  CHECK(store->options.codec.at("ZLEVEL") == "6");
  CHECK(sink.name() == "/a.tif");
}

TEST_CASE("bigtiff selection") {
  auto small = make_info(100, 100);
  CHECK_FALSE(resolve_bigtiff(BigTiff::Auto, small));
  CHECK(resolve_bigtiff(BigTiff::Yes, small));

  // 65536 x 65536 float32 is 16GB
  auto large = make_info(65536, 65536, DataType::float32);
  CHECK(resolve_bigtiff(BigTiff::Auto, large));
  CHECK_FALSE(resolve_bigtiff(BigTiff::No, large));

  CHECK(adjust_blocksize(256, 1000) == 256);
  CHECK(adjust_blocksize(100, 1000) == 112);
  CHECK(adjust_blocksize(512, 101) == 112);
}

TEST_CASE("transient sink releases its memory on close") {
  FakeRasterBackend backend;
  TileSink sink(backend, make_info(8, 8), dst::Transient{});
  const std::string name = sink.name();
  CHECK(name.rfind("/fake/", 0) == 0);
  REQUIRE(backend.store(name));

  sink.write({Slice{}, Slice{}}, gradient<std::uint8_t>(8, 8));
  sink.close();
  CHECK(sink.is_closed());
  CHECK_FALSE(backend.store(name));
  REQUIRE(backend.removed.size() == 1);
  CHECK(backend.removed.front() == name);

  // closing again does nothing
  sink.close();
  CHECK(backend.removed.size() == 1);
}

TEST_CASE("transient sinks do not share a resource") {
  FakeRasterBackend backend;
  TileSink a(backend, make_info(8, 8), dst::Transient{});
  TileSink b(backend, make_info(8, 8), dst::Transient{});
  CHECK(a.name() != b.name());
}

TEST_CASE("sink writing into a caller owned memory file") {
  FakeRasterBackend backend;
  MemoryFile mem(backend, "shared", "level.tif");
  CHECK(mem.name() == "/fake/shared/level.tif");
  {
    TileSink sink(backend, make_info(8, 8), dst::ExistingHandle{&mem});
    CHECK(sink.name() == mem.name());
    sink.write(window(0, 4, 0, 8), gradient<std::uint8_t>(4, 8));
  }
  // the sink is gone but the memory file is still there
  auto store = backend.store(mem.name());
  REQUIRE(store);
  CHECK(store->closed);
  CHECK(store->writes == 1);

  mem.close();
  CHECK(mem.is_closed());
  CHECK_FALSE(backend.store("/fake/shared/level.tif"));

  CHECK_THROWS_AS(
      TileSink(backend, make_info(8, 8), dst::ExistingHandle{&mem}),
      InvalidArgument);
  CHECK_THROWS_AS(
      TileSink(backend, make_info(8, 8), dst::ExistingHandle{nullptr}),
      InvalidArgument);
}

TEST_CASE("tile sink rejects malformed writes") {
  FakeRasterBackend backend;
  TileSink sink(backend, make_info(16, 16), dst::Path{"/r.tif"});
  auto block = gradient<std::uint8_t>(4, 4);

  CHECK_THROWS_AS(
      sink.write({Slice{}, Slice{0, 4, std::nullopt}, Slice{0, 4, std::nullopt}},
                 block),
      UnsupportedOperation);
  CHECK_THROWS_AS(sink.write({Slice{0, 4, std::nullopt}}, block),
                  InvalidArgument);
  CHECK_THROWS_AS(sink.write(Roi{}, block), InvalidArgument);
  // shape does not match the window
  CHECK_THROWS_AS(sink.write(window(0, 4, 0, 8), block), InvalidArgument);
  // element type does not match the raster
  CHECK_THROWS_AS(sink.write(window(0, 4, 0, 4), gradient<std::int16_t>(4, 4)),
                  InvalidArgument);
  CHECK_THROWS_AS(
      sink.write(window(0, 4, 0, 4), RasterBlock(DataType::uint8, {4, 4, 1})),
      InvalidArgument);
  CHECK(backend.store("/r.tif")->writes == 0);
}

TEST_CASE("checking a write does not write") {
  FakeRasterBackend backend;
  TileSink sink(backend, make_info(16, 16), dst::Path{"/c.tif"});

  auto win = sink.check_write(window(4, 8, -8, 16),
                              gradient<std::uint8_t>(4, 8));
  CHECK(win == PixelWindow{8, 4, 8, 4});
  CHECK_THROWS_AS(sink.check_write(window(4, 8, 0, 8),
                                   gradient<std::uint8_t>(4, 4)),
                  InvalidArgument);
  CHECK(backend.store("/c.tif")->writes == 0);
}

TEST_CASE("tile sink write edge cases") {
  FakeRasterBackend backend;
  TileSink sink(backend, make_info(10, 10), dst::Path{"/e.tif"});
  auto store = backend.store("/e.tif");

  SECTION("an empty window is a no-op") {
    sink.write({Slice{5, 5, std::nullopt}, Slice{}},
               RasterBlock(DataType::uint8, {0, 10}));
    CHECK(store->writes == 0);
  }
  SECTION("negative bounds address the end of the raster") {
    sink.write({Slice{-2, std::nullopt, std::nullopt}, Slice{}},
               RasterBlock(std::vector<std::uint8_t>(20, 9), {2, 10}));
    CHECK(store->pixels.at<std::uint8_t>(8, 0) == 9);
    CHECK(store->pixels.at<std::uint8_t>(9, 9) == 9);
    CHECK(store->pixels.at<std::uint8_t>(7, 9) == 0);
  }
  SECTION("writing after close fails") {
    sink.close();
    CHECK_THROWS_AS(sink.write(window(0, 1, 0, 1),
                               RasterBlock(DataType::uint8, {1, 1})),
                    cogsinkException);
  }
}

TEST_CASE("concurrent writes to a locked tile sink") {
  FakeRasterBackend backend;
  auto info = make_info(32, 64, DataType::float32);
  auto full = gradient<float>(64, 32);
  {
    TileSink sink(backend, info, dst::Path{"/c.tif"});
    std::vector<std::thread> workers;
    for (std::int64_t t = 0; t < 4; ++t) {
      workers.emplace_back([&, t]() {
        for (std::int64_t r = t * 16; r < (t + 1) * 16; r += 4) {
          sink.write(window(r, r + 4, 0, 32), crop(full, r, 0, 4, 32));
        }
      });
    }
    for (auto& w : workers) w.join();
  }
  auto store = backend.store("/c.tif");
  CHECK(store->writes == 16);
  CHECK(store->pixels == full);
}
