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

#pragma once

#include <cogsink/common/RasterBlock.hpp>
#include <cogsink/common/RasterDescriptor.hpp>
#include <cogsink/common/Window.hpp>
#include <cogsink/io/CodecOptions.hpp>
#include <cogsink/io/RasterBackend.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace cogsink::io {

  namespace dst {
    // Persist to the filesystem.
    struct Path {
      std::string path;
    };
    // In-memory resource created and released by the sink itself.
    struct Transient {};
    // Caller owned in-memory resource; the sink writes into it but never
    // releases it.
    struct ExistingHandle {
      MemoryFile* file;
    };
  }  // namespace dst

  typedef std::variant<dst::Path, dst::Transient, dst::ExistingHandle>
      Destination;

  enum class BigTiff { Auto, Yes, No };

  // Rasters above this many bytes are written as BigTIFF in Auto mode.
  constexpr std::uint64_t kBigTiffThreshold = std::uint64_t{1} << 32;

  bool resolve_bigtiff(BigTiff mode, const RasterDescriptor& info);

  constexpr int roundup16(int x) { return (x + 15) & ~0xF; }

  /**
   * @brief Tile size along an axis of `dim` pixels for a requested `block`
   * size, always a multiple of 16.
   */
  constexpr int adjust_blocksize(int block, int dim) {
    if (block > dim) return roundup16(dim);
    return roundup16(block);
  }

  struct TileSinkOptions {
    int block_size = 512;
    BigTiff bigtiff = BigTiff::Auto;
    // Merged over default_codec_options().
    CodecOptions codec;
    // Serialise writes with an internal mutex.
    bool lock = true;
  };

  /**
   * @brief Single resolution tiled raster that accepts windowed writes.
   *
   * Writes from multiple threads are safe as long as the lock is enabled;
   * windows are expected not to overlap. The sink owns its destination
   * dataset until close().
   */
  class TileSink {
    RasterBackendInterface& backend_;
    RasterDescriptor info_;
    std::unique_ptr<MemoryFile> mem_mine_;
    std::unique_ptr<RasterDatasetInterface> out_;
    std::string name_;
    std::unique_ptr<std::mutex> lock_;
    bool closed_ = false;

   public:
    TileSink(RasterBackendInterface& backend, RasterDescriptor info,
             Destination destination, TileSinkOptions options = {});
    ~TileSink();

    TileSink(const TileSink&) = delete;
    TileSink& operator=(const TileSink&) = delete;

    /**
     * @brief Write `block` to the window addressed by `roi`.
     *
     * A (rows, cols) roi writes a 2D block into band 1.
     *
     * @throws UnsupportedOperation for a 3 axis (multi-band) roi.
     * @throws InvalidArgument for any other axis count, or when the block
     * does not match the window or the element type.
     * @throws BackendIOError
     */
    void write(const Roi& roi, const RasterBlock& block);

    /**
     * @brief Resolve the window a write of `block` at `roi` would cover,
     * without writing.
     *
     * Throws the same errors as write() for malformed writes.
     */
    PixelWindow check_write(const Roi& roi, const RasterBlock& block) const;

    // Flush and release the destination. Idempotent.
    void close();

    const std::string& name() const { return name_; }
    const RasterDescriptor& info() const { return info_; }
    bool is_closed() const { return closed_; }
  };

}  // namespace cogsink::io
