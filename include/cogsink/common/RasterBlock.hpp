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
#include <cogsink/common/datastructures.hpp>
#include <cstddef>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace cogsink {

  /**
   * @brief Dense, row-major n-dimensional array of a single element type.
   *
   * The element type is only known at runtime, typed access goes through
   * data<T>() which checks that T matches.
   */
  class RasterBlock {
    DataType dtype_ = DataType::uint8;
    std::vector<size_t> shape_;
    std::vector<std::byte> bytes_;

   public:
    RasterBlock() = default;

    // Zero filled block.
    RasterBlock(DataType dtype, std::vector<size_t> shape);

    template <typename T>
    RasterBlock(const std::vector<T>& values, std::vector<size_t> shape)
        : RasterBlock(DataTypeOf<T>::value, std::move(shape)) {
      if (values.size() != size()) {
        throw InvalidArgument("Value count " + std::to_string(values.size()) +
                              " does not match block shape.");
      }
      if (!values.empty()) {
        std::memcpy(bytes_.data(), values.data(), bytes_.size());
      }
    }

    DataType dtype() const { return dtype_; }
    const std::vector<size_t>& shape() const { return shape_; }
    size_t ndim() const { return shape_.size(); }
    size_t size() const;
    size_t byte_size() const { return bytes_.size(); }
    bool empty() const { return size() == 0; }

    const void* raw() const { return bytes_.data(); }
    void* raw() { return bytes_.data(); }

    template <typename T>
    const T* data() const {
      check_type<T>();
      return reinterpret_cast<const T*>(bytes_.data());
    }
    template <typename T>
    T* data() {
      check_type<T>();
      return reinterpret_cast<T*>(bytes_.data());
    }

    // Element at (row, col) of a 2D block.
    template <typename T>
    T at(size_t row, size_t col) const {
      return data<T>()[row * shape_.at(1) + col];
    }

    bool operator==(const RasterBlock& other) const = default;

   private:
    template <typename T>
    void check_type() const {
      if (DataTypeOf<T>::value != dtype_) {
        throw InvalidArgument("Block holds " + data_type_name(dtype_) +
                              " values, requested " +
                              data_type_name(DataTypeOf<T>::value) + ".");
      }
    }
  };

  /**
   * @brief Shape and georeferencing of the grid an array is defined on.
   */
  struct GeoBox {
    size_t height = 0;
    size_t width = 0;
    GeoTransform transform;
    std::string crs;
  };

  /**
   * @brief An array together with the labels needed to place it on the earth.
   * Arrays without a geobox are legal values but can not be described as a
   * raster.
   */
  struct LabeledArray {
    RasterBlock data;
    std::optional<GeoBox> geobox;
    std::optional<double> nodata;
  };

}  // namespace cogsink
