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

#include <cogsink/common/common.hpp>
#include <optional>
#include <string>

namespace cogsink::io {

  /**
   * @brief Compression related creation options of a tiled raster.
   *
   * Every option the library knows about has its own member, anything else
   * can be passed verbatim through `extra`. Unset members do not override.
   */
  struct CodecOptions {
    /**
     * @brief Compression method, eg. "DEFLATE", "ZSTD", "LZW" or "NONE".
     */
    std::optional<std::string> compress;
    /**
     * @brief Deflate compression level, 1-9.
     */
    std::optional<int> zlevel;
    /**
     * @brief ZSTD compression level, 1-22.
     */
    std::optional<int> zstd_level;
    /**
     * @brief 1: no predictor, 2: horizontal differencing, 3: floating point.
     */
    std::optional<int> predictor;
    /**
     * @brief Number of compression threads, or "ALL_CPUS".
     */
    std::optional<std::string> num_threads;
    /**
     * @brief Allow blocks that were never written to be omitted from the file.
     */
    std::optional<bool> sparse_ok;
    /**
     * @brief Raw creation options, applied last.
     */
    StrMap extra;

    /**
     * @brief Returns `defaults` with every option that is set in `*this`
     * overriding it. `extra` maps are merged key by key, ours winning.
     */
    CodecOptions merged_over(const CodecOptions& defaults) const;

    /**
     * @brief Flatten into upper-case creation option key/values. Entries of
     * `extra` override named options with the same (case-insensitive) key.
     */
    StrMap to_map() const;
  };

  // DEFLATE, zlevel 6, horizontal differencing predictor, all cpus.
  CodecOptions default_codec_options();

  // Fast low-effort profile for the temporary pyramid levels: ZSTD level 1, no
  // predictor, all cpus, sparse writes allowed.
  CodecOptions temp_codec_options();

}  // namespace cogsink::io
