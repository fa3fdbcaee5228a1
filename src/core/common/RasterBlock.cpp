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

#include <cogsink/common/RasterBlock.hpp>
#include <functional>
#include <numeric>

namespace cogsink {

  RasterBlock::RasterBlock(DataType dtype, std::vector<size_t> shape)
      : dtype_(dtype), shape_(std::move(shape)) {
    bytes_.resize(size() * element_byte_size(dtype_));
  }

  size_t RasterBlock::size() const {
    if (shape_.empty()) return 0;
    return std::accumulate(shape_.begin(), shape_.end(), size_t{1},
                           std::multiplies<size_t>());
  }

}  // namespace cogsink
