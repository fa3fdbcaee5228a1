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
#include <algorithm>
#include <concepts>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "fmt/format.h"
#include "fmt/ranges.h"

template <typename T>
using Validator = std::function<std::optional<std::string>(const T&)>;

namespace cogsink::validators {
  // Concept to ensure types are comparable
  template <typename T>
  concept Comparable = requires(T a, T b) {
    { a < b } -> std::convertible_to<bool>;
    { a > b } -> std::convertible_to<bool>;
  };

  template <typename T>
    requires Comparable<T>
  auto InRange(T min, T max) {
    return [min, max](const T& val) -> std::optional<std::string> {
      if (val < min || val > max) {
        return fmt::format("Value {} is out of range <{}, {}>.", val, min, max);
      }
      return std::nullopt;
    };
  };

  template <typename T>
    requires Comparable<T>
  auto HigherThan(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (val <= min) {
        return fmt::format("Value must be higher than {}.", min);
      }
      return std::nullopt;
    };
  };

  template <typename T>
    requires Comparable<T>
  auto HigherOrEqualTo(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (val < min) {
        return fmt::format(
            "Value must be higher than or equal to {}. But is {}.", min, val);
      }
      return std::nullopt;
    };
  };

  // Value must be a multiple of `factor`
  template <typename T>
  auto MultipleOf(T factor) {
    return [factor](const T& val) -> std::optional<std::string> {
      if (val % factor != 0) {
        return fmt::format("Value {} is not a multiple of {}.", val, factor);
      }
      return std::nullopt;
    };
  };

  template <typename T>
  auto OneOf(std::vector<T> values) {
    return [values](const T& val) -> std::optional<std::string> {
      if (std::find(values.begin(), values.end(), val) == values.end()) {
        return fmt::format("Value {} is not one of {}.", val, values);
      }
      return std::nullopt;
    };
  };

  inline std::optional<std::string> PathExists(const std::string& path) {
    if (!std::filesystem::exists(path)) {
      return fmt::format("Path {} does not exist.", path);
    }
    return std::nullopt;
  }

  // Checks that files can be created in `path` or in the first of its parents
  // that exists. An empty path passes.
  inline std::optional<std::string> DirIsWritable(const std::string& path) {
    if (path.empty()) return std::nullopt;
    std::error_code ec;
    auto parent = std::filesystem::absolute(path, ec);
    if (ec) return fmt::format("Invalid path {}. {}", path, ec.message());

    // find the first parent folders that already exists
    while (!std::filesystem::exists(parent) && parent != parent.root_path()) {
      parent = parent.parent_path();
    }
    if (!std::filesystem::is_directory(parent)) {
      return fmt::format("Path {} is not a directory.", parent.string());
    }

    // Try to create a temporary file in parent
    auto test_path = parent / "cogsink_write_test_tmp";
    std::ofstream test_file(test_path);
    if (!test_file) {
      return fmt::format("Could not write to directory {}.", parent.string());
    }
    test_file.close();
    std::filesystem::remove(test_path, ec);
    return std::nullopt;
  }
}  // namespace cogsink::validators
