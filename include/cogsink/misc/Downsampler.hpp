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
#include <cogsink/common/Window.hpp>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace cogsink::misc {

  /**
   * @brief Type used to sum four neighbouring values without overflow.
   * Integers of up to 16 bits are promoted to int32, anything else is summed
   * in its own type.
   */
  template <typename T>
  struct BoxAccumulator {
    using type = std::conditional_t<std::is_integral_v<T> && sizeof(T) <= 2,
                                    std::int32_t, T>;
  };

  template <typename T>
  T box_mean4(typename BoxAccumulator<T>::type sum) {
    using A = typename BoxAccumulator<T>::type;
    if constexpr (std::is_floating_point_v<A>) {
      return static_cast<T>(sum / A(4));
    } else if constexpr (std::is_signed_v<A>) {
      A q = sum / 4;
      if (sum % 4 != 0 && sum < 0) --q;
      return static_cast<T>(q);
    } else {
      return static_cast<T>(sum / 4);
    }
  }

  /**
   * @brief 2x2 box filter over a row-major `rows` x `cols` array. `dst` must
   * hold (rows / 2) * (cols / 2) values; a trailing odd row or column of
   * `src` is ignored.
   */
  template <typename T>
  void box_filter2(const T* src, size_t rows, size_t cols, T* dst) {
    using A = typename BoxAccumulator<T>::type;
    const size_t out_rows = rows / 2;
    const size_t out_cols = cols / 2;
    for (size_t r = 0; r < out_rows; ++r) {
      const T* top = src + (2 * r) * cols;
      const T* bottom = top + cols;
      T* out = dst + r * out_cols;
      for (size_t c = 0; c < out_cols; ++c) {
        A sum = A(top[2 * c]) + A(top[2 * c + 1]) + A(bottom[2 * c]) +
                A(bottom[2 * c + 1]);
        out[c] = box_mean4<T>(sum);
      }
    }
  }

  /**
   * @brief Halve the resolution of a 2D block with a 2x2 box filter.
   *
   * @throws InvalidArgument if the block is not 2 dimensional.
   */
  RasterBlock shrink2(const RasterBlock& block);

  /**
   * @brief Given a window and the block that was written to it, compute the
   * window and block of the level with half the resolution.
   */
  std::pair<Roi, RasterBlock> downsample(const Roi& roi,
                                         const RasterBlock& block);

}  // namespace cogsink::misc
