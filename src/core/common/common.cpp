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

#include <cogsink/common/common.hpp>
#include <cogsink/common/datastructures.hpp>
#include <random>

#include "fmt/format.h"

namespace cogsink {

  size_t element_byte_size(DataType dtype) {
    return visit_data_type(dtype, [](auto v) { return sizeof(v); });
  }

  std::string data_type_name(DataType dtype) {
    switch (dtype) {
      case DataType::uint8:
        return "uint8";
      case DataType::int8:
        return "int8";
      case DataType::uint16:
        return "uint16";
      case DataType::int16:
        return "int16";
      case DataType::uint32:
        return "uint32";
      case DataType::int32:
        return "int32";
      case DataType::uint64:
        return "uint64";
      case DataType::int64:
        return "int64";
      case DataType::float32:
        return "float32";
      case DataType::float64:
        return "float64";
    }
    return "unknown";
  }

  DataType data_type_from_name(const std::string& name) {
    static const std::unordered_map<std::string, DataType> names = {
        {"uint8", DataType::uint8},     {"int8", DataType::int8},
        {"uint16", DataType::uint16},   {"int16", DataType::int16},
        {"uint32", DataType::uint32},   {"int32", DataType::int32},
        {"uint64", DataType::uint64},   {"int64", DataType::int64},
        {"float32", DataType::float32}, {"float64", DataType::float64},
    };
    auto it = names.find(name);
    if (it == names.end()) {
      throw ConfigurationError("Invalid element type: " + name + ".");
    }
    return it->second;
  }

  std::string make_uuid4() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(rng);
    std::uint64_t lo = dist(rng);
    // version 4, variant 1
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32,
                       (hi >> 16) & 0xFFFF, hi & 0xFFFF, lo >> 48,
                       lo & 0xFFFFFFFFFFFFULL);
  }

  GeoTransform GeoTransform::scaled(double sx, double sy) const {
    GeoTransform out = *this;
    out.coef[1] *= sx;
    out.coef[2] *= sy;
    out.coef[4] *= sx;
    out.coef[5] *= sy;
    return out;
  }

}  // namespace cogsink
