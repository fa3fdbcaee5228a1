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

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace cogsink {

  typedef std::unordered_map<std::string, std::string> StrMap;

  /**
   * @brief Fixed width numeric element types that a raster can hold.
   */
  enum class DataType : std::uint8_t {
    uint8,
    int8,
    uint16,
    int16,
    uint32,
    int32,
    uint64,
    int64,
    float32,
    float64,
  };

  size_t element_byte_size(DataType dtype);
  std::string data_type_name(DataType dtype);

  /**
   * @brief Parse a lower case element type name such as "uint16".
   *
   * @throws ConfigurationError when the name does not denote a supported
   * element type.
   */
  DataType data_type_from_name(const std::string& name);

  template <typename T>
  struct DataTypeOf;
  template <>
  struct DataTypeOf<std::uint8_t> {
    static constexpr DataType value = DataType::uint8;
  };
  template <>
  struct DataTypeOf<std::int8_t> {
    static constexpr DataType value = DataType::int8;
  };
  template <>
  struct DataTypeOf<std::uint16_t> {
    static constexpr DataType value = DataType::uint16;
  };
  template <>
  struct DataTypeOf<std::int16_t> {
    static constexpr DataType value = DataType::int16;
  };
  template <>
  struct DataTypeOf<std::uint32_t> {
    static constexpr DataType value = DataType::uint32;
  };
  template <>
  struct DataTypeOf<std::int32_t> {
    static constexpr DataType value = DataType::int32;
  };
  template <>
  struct DataTypeOf<std::uint64_t> {
    static constexpr DataType value = DataType::uint64;
  };
  template <>
  struct DataTypeOf<std::int64_t> {
    static constexpr DataType value = DataType::int64;
  };
  template <>
  struct DataTypeOf<float> {
    static constexpr DataType value = DataType::float32;
  };
  template <>
  struct DataTypeOf<double> {
    static constexpr DataType value = DataType::float64;
  };

  /**
   * @brief Call `f` with a value-initialised instance of the C++ type that
   * corresponds to `dtype`, eg. `visit_data_type(dt, [](auto v) { using T =
   * decltype(v); ... })`.
   */
  template <typename F>
  decltype(auto) visit_data_type(DataType dtype, F&& f) {
    switch (dtype) {
      case DataType::uint8:
        return f(std::uint8_t{});
      case DataType::int8:
        return f(std::int8_t{});
      case DataType::uint16:
        return f(std::uint16_t{});
      case DataType::int16:
        return f(std::int16_t{});
      case DataType::uint32:
        return f(std::uint32_t{});
      case DataType::int32:
        return f(std::int32_t{});
      case DataType::uint64:
        return f(std::uint64_t{});
      case DataType::int64:
        return f(std::int64_t{});
      case DataType::float32:
        return f(float{});
      case DataType::float64:
        return f(double{});
    }
    return f(std::uint8_t{});
  }

  // Random uuid in its canonical 8-4-4-4-12 text form, for naming temporary
  // resources.
  std::string make_uuid4();

  /**
   * @brief Affine pixel to world transform, coefficients in GDAL order:
   * (x0, a, b, y0, d, e) so that
   *   x = x0 + a * col + b * row
   *   y = y0 + d * col + e * row
   */
  struct GeoTransform {
    std::array<double, 6> coef = {0., 1., 0., 0., 0., 1.};

    /**
     * @brief Returns `this ∘ scale(sx, sy)`, ie. the transform of a grid whose
     * pixels are `sx` by `sy` times larger but that shares the same origin.
     */
    GeoTransform scaled(double sx, double sy) const;

    bool operator==(const GeoTransform& other) const = default;
  };

}  // namespace cogsink
