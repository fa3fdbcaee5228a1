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
#include <cogsink/misc/Downsampler.hpp>
#include <string>

namespace cogsink::misc {

  RasterBlock shrink2(const RasterBlock& block) {
    if (block.ndim() != 2) {
      throw InvalidArgument("Can only downsample 2 dimensional blocks, got " +
                            std::to_string(block.ndim()) + " dimensions.");
    }
    const size_t rows = block.shape()[0];
    const size_t cols = block.shape()[1];
    RasterBlock out(block.dtype(), {rows / 2, cols / 2});
    if (out.empty()) return out;

    visit_data_type(block.dtype(), [&](auto v) {
      using T = decltype(v);
      box_filter2<T>(block.data<T>(), rows, cols, out.data<T>());
    });
    return out;
  }

  std::pair<Roi, RasterBlock> downsample(const Roi& roi,
                                         const RasterBlock& block) {
    return {cogsink::shrink2(roi), shrink2(block)};
  }

}  // namespace cogsink::misc
