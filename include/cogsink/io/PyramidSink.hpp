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

#include <cogsink/PyramidConfig.hpp>
#include <cogsink/common/RasterBlock.hpp>
#include <cogsink/common/RasterDescriptor.hpp>
#include <cogsink/common/Window.hpp>
#include <cogsink/io/RasterBackend.hpp>
#include <cogsink/io/TileSink.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cogsink::io {

  // Upper bound on the number of levels, full resolution included.
  constexpr size_t kMaxPyramidLevels = 8;
  // Tile size of the temporary full resolution level, halved per level.
  constexpr int kTempBlockSize = 2048;
  constexpr int kMinTempBlockSize = 64;

  /**
   * @brief Descriptors of every level of the pyramid, index 0 is full
   * resolution and every next level is shrink2() of the one before.
   *
   * No level is derived from a level that has an odd width or height, or
   * whose smaller side is below `overview_block_size`.
   */
  std::vector<RasterDescriptor> plan_pyramid(const RasterDescriptor& info,
                                             int overview_block_size);

  /**
   * @brief Writes a raster with embedded overviews from windowed writes.
   *
   * Every level of the pyramid is kept in its own temporary tiled dataset,
   * and each write is propagated to all levels with a 2x2 box filter. The
   * levels are merged into the compressed output by finalize().
   */
  class PyramidSink {
    struct Level {
      RasterDescriptor info;
      std::string name;
      // The level this level is the overview of.
      std::optional<size_t> overview_of;
      std::unique_ptr<MemoryFile> mem;
      std::unique_ptr<TileSink> sink;
    };

    RasterBackendInterface& backend_;
    std::vector<Level> levels_;
    std::string destination_;
    PyramidConfig cfg_;
    bool finalized_ = false;

   public:
    /**
     * @throws ConfigurationError if `cfg` is not valid.
     * @throws BackendIOError
     */
    PyramidSink(RasterBackendInterface& backend, const RasterDescriptor& info,
                std::string destination, PyramidConfig cfg = PyramidConfig());
    ~PyramidSink();

    PyramidSink(const PyramidSink&) = delete;
    PyramidSink& operator=(const PyramidSink&) = delete;

    /**
     * @brief Write a block at full resolution and update every overview.
     *
     * Windows of concurrent writes must not overlap. Window offsets and
     * sizes must be multiples of alignment() or extend to the raster edge.
     * All levels are checked before any of them is written.
     *
     * @throws InvalidArgument when the block does not match the window, or
     * when a halved window stops matching its halved block. Nothing is
     * written in that case.
     * @throws UnsupportedOperation for a 3 axis (multi-band) roi.
     * @throws BackendIOError
     */
    void write(const Roi& roi, const RasterBlock& block);

    // Close all levels, flushing buffered data.
    void close();

    /**
     * @brief Produce the output file. Must be called exactly once.
     *
     * On success the temporary levels are removed, on failure they are left
     * in place and the error is rethrown.
     */
    void finalize();

    size_t num_levels() const { return levels_.size(); }
    // Pixel multiple that window offsets and sizes must respect.
    std::int64_t alignment() const {
      return std::int64_t{1} << (levels_.size() - 1);
    }
    const RasterDescriptor& level_info(size_t i) const {
      return levels_.at(i).info;
    }
    const std::string& level_name(size_t i) const { return levels_.at(i).name; }
    std::optional<size_t> overview_of(size_t i) const {
      return levels_.at(i).overview_of;
    }
    const std::string& destination() const { return destination_; }

    /**
     * @brief Level names ordered from full resolution down, following the
     * overview_of relation.
     */
    std::vector<std::string> overview_chain() const;

   private:
    void remove_temporaries();
  };

}  // namespace cogsink::io
