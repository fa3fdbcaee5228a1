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
#include <cogsink/common/common.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace cogsink {

  /**
   * @brief Shape and georeferencing of one resolution level of a raster.
   *
   * Immutable once constructed. A level of half the resolution is derived with
   * shrink2().
   */
  class RasterDescriptor {
    size_t width_;
    size_t height_;
    size_t band_count_;
    DataType dtype_;
    std::string crs_;
    GeoTransform transform_;
    std::optional<double> nodata_;

   public:
    /**
     * @throws ConfigurationError if width or height is 0 or band_count < 1.
     */
    RasterDescriptor(size_t width, size_t height, size_t band_count,
                     DataType dtype, std::string crs, GeoTransform transform,
                     std::optional<double> nodata = std::nullopt);

    /**
     * @brief Describe the grid a labeled array is defined on.
     *
     * The band count is taken from whichever end of a 3D shape does not match
     * the (height, width) of the geobox.
     *
     * @throws ConfigurationError when the array has no geobox or its shape
     * does not fit the geobox.
     */
    static RasterDescriptor from_array(const LabeledArray& source);

    size_t width() const { return width_; }
    size_t height() const { return height_; }
    size_t band_count() const { return band_count_; }
    DataType dtype() const { return dtype_; }
    const std::string& crs() const { return crs_; }
    const GeoTransform& transform() const { return transform_; }
    const std::optional<double>& nodata() const { return nodata_; }

    // Raster size in bytes.
    std::uint64_t raster_size() const;

    RasterDescriptor shrink2() const;

    bool operator==(const RasterDescriptor& other) const = default;
  };

}  // namespace cogsink
