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

#include <cogsink/io/CodecOptions.hpp>
#include <cogsink/io/TileSink.hpp>
#include <optional>
#include <string>

namespace cogsink {
  /**
   * @brief Configuration parameters for writing a raster with embedded
   * overviews.
   */
  struct PyramidConfig {
    /**
     * @brief Internal tile size of the full resolution image in the output.
     * Rounded up to a multiple of 16, and capped to the raster size.
     */
    int block_size = 512;
    /**
     * @brief Internal tile size of the overview images in the output. Also
     * the size below which no further overview is generated. Defaults to
     * `block_size`.
     */
    std::optional<int> overview_block_size;
    /**
     * @brief Write a BigTIFF. `Auto` selects BigTIFF for rasters larger than
     * 4GB.
     */
    io::BigTiff bigtiff = io::BigTiff::Auto;
    /**
     * @brief Serialise writes to each level with a mutex. Disable only when
     * the caller guarantees a single writer.
     */
    bool lock = true;
    /**
     * @brief Folder for the temporary per-level files. When not set the
     * temporary levels are kept in memory.
     */
    std::optional<std::string> temp_folder;
    /**
     * @brief Compression of the final output, merged over DEFLATE level 6
     * with horizontal differencing.
     */
    io::CodecOptions codec;

    int effective_overview_block_size() const {
      return overview_block_size.value_or(block_size);
    }

    bool is_valid() const {
      return block_size > 0 && effective_overview_block_size() > 0;
    }
  };
}  // namespace cogsink
