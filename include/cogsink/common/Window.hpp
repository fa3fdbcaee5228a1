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

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace cogsink {

  /**
   * @brief A half-open range along one axis, any of the three members may be
   * left unspecified. Negative start/stop count from the end of the axis.
   */
  struct Slice {
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> stop;
    std::optional<std::int64_t> step;

    bool operator==(const Slice& other) const = default;
  };

  // Index along one axis: a single position or a Slice.
  typedef std::variant<std::int64_t, Slice> Index;

  // Region of interest, one Index per axis, row axis first.
  typedef std::vector<Index> Roi;

  /**
   * @brief Absolute pixel rectangle inside a raster.
   */
  struct PixelWindow {
    std::int64_t col_off = 0;
    std::int64_t row_off = 0;
    std::int64_t width = 0;
    std::int64_t height = 0;

    bool empty() const { return width <= 0 || height <= 0; }
    bool operator==(const PixelWindow& other) const = default;
  };

  /**
   * @brief Resolve one Index against an axis of the given extent into a
   * [begin, end) range clamped to [0, extent]. The step is ignored.
   */
  std::pair<std::int64_t, std::int64_t> resolve_index(const Index& idx,
                                                      std::int64_t extent);

  /**
   * @brief Resolve a (rows, cols) Roi against a raster of `height` x
   * `width` pixels.
   *
   * @throws InvalidArgument when the Roi does not have exactly two axes.
   */
  PixelWindow window_from_roi(const Roi& roi, std::int64_t height,
                              std::int64_t width);

  // Floor division by two, leaving unspecified values unspecified.
  Index shrink2(const Index& idx);
  Roi shrink2(const Roi& roi);

}  // namespace cogsink
