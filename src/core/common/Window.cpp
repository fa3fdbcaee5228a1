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

#include <algorithm>
#include <cogsink/common/Window.hpp>
#include <cogsink/common/datastructures.hpp>
#include <string>

namespace cogsink {

  namespace {
    std::int64_t floor_div2(std::int64_t x) {
      // C++ integer division truncates towards zero, we need floor.
      return (x >= 0) ? x / 2 : -((-x + 1) / 2);
    }

    std::int64_t wrap_and_clamp(std::int64_t x, std::int64_t extent) {
      if (x < 0) x += extent;
      return std::clamp<std::int64_t>(x, 0, extent);
    }
  }  // namespace

  std::pair<std::int64_t, std::int64_t> resolve_index(const Index& idx,
                                                      std::int64_t extent) {
    if (const auto* pos = std::get_if<std::int64_t>(&idx)) {
      auto begin = wrap_and_clamp(*pos, extent);
      return {begin, std::min(begin + 1, extent)};
    }
    const auto& slice = std::get<Slice>(idx);
    std::int64_t begin = slice.start ? wrap_and_clamp(*slice.start, extent) : 0;
    std::int64_t end =
        slice.stop ? wrap_and_clamp(*slice.stop, extent) : extent;
    if (end < begin) end = begin;
    return {begin, end};
  }

  PixelWindow window_from_roi(const Roi& roi, std::int64_t height,
                              std::int64_t width) {
    if (roi.size() != 2) {
      throw InvalidArgument("Expected a window with 2 axes, got " +
                            std::to_string(roi.size()) + ".");
    }
    auto [row_begin, row_end] = resolve_index(roi[0], height);
    auto [col_begin, col_end] = resolve_index(roi[1], width);
    return PixelWindow{col_begin, row_begin, col_end - col_begin,
                       row_end - row_begin};
  }

  Index shrink2(const Index& idx) {
    if (const auto* pos = std::get_if<std::int64_t>(&idx)) {
      return floor_div2(*pos);
    }
    const auto& slice = std::get<Slice>(idx);
    auto maybe_div2 = [](const std::optional<std::int64_t>& x)
        -> std::optional<std::int64_t> {
      if (!x) return std::nullopt;
      return floor_div2(*x);
    };
    return Slice{maybe_div2(slice.start), maybe_div2(slice.stop),
                 maybe_div2(slice.step)};
  }

  Roi shrink2(const Roi& roi) {
    Roi out;
    out.reserve(roi.size());
    for (const auto& idx : roi) {
      out.push_back(shrink2(idx));
    }
    return out;
  }

}  // namespace cogsink
