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

#include <cogsink/common/RasterDescriptor.hpp>
#include <cogsink/common/Window.hpp>
#include <cogsink/common/common.hpp>

#include "fmt/format.h"

// Formatter for cogsink::DataType
template <>
struct fmt::formatter<cogsink::DataType> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

  template <typename Context>
  auto format(const cogsink::DataType& dtype, Context& ctx) const {
    return fmt::format_to(ctx.out(), "{}", cogsink::data_type_name(dtype));
  }
};

// Formatter for cogsink::PixelWindow
template <>
struct fmt::formatter<cogsink::PixelWindow> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

  template <typename Context>
  auto format(const cogsink::PixelWindow& win, Context& ctx) const {
    return fmt::format_to(ctx.out(), "Window(col_off={}, row_off={}, {}x{})",
                          win.col_off, win.row_off, win.width, win.height);
  }
};

// Formatter for cogsink::RasterDescriptor, mirrors "WxH..count..dtype"
template <>
struct fmt::formatter<cogsink::RasterDescriptor> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

  template <typename Context>
  auto format(const cogsink::RasterDescriptor& info, Context& ctx) const {
    return fmt::format_to(ctx.out(), "{}x{}..{}..{}", info.width(),
                          info.height(), info.band_count(), info.dtype());
  }
};
