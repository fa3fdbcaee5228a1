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

#include <cogsink/common/RasterDescriptor.hpp>
#include <cogsink/common/datastructures.hpp>
#include <utility>

namespace cogsink {

  RasterDescriptor::RasterDescriptor(size_t width, size_t height,
                                     size_t band_count, DataType dtype,
                                     std::string crs, GeoTransform transform,
                                     std::optional<double> nodata)
      : width_(width),
        height_(height),
        band_count_(band_count),
        dtype_(dtype),
        crs_(std::move(crs)),
        transform_(transform),
        nodata_(nodata) {
    if (width_ == 0 || height_ == 0) {
      throw ConfigurationError("Raster dimensions must be positive, got " +
                               std::to_string(width_) + "x" +
                               std::to_string(height_) + ".");
    }
    if (band_count_ < 1) {
      throw ConfigurationError("Raster must have at least one band.");
    }
  }

  RasterDescriptor RasterDescriptor::from_array(const LabeledArray& source) {
    if (!source.geobox.has_value()) {
      throw ConfigurationError("Missing georeferencing on input array.");
    }
    const auto& geobox = *source.geobox;
    const auto& shape = source.data.shape();

    size_t count = 0;
    if (shape.size() == 2) {
      if (shape[0] != geobox.height || shape[1] != geobox.width) {
        throw ConfigurationError("Geobox shape does not match array size.");
      }
      count = 1;
    } else if (shape.size() == 3) {
      if (shape[0] == geobox.height && shape[1] == geobox.width) {
        count = shape[2];
      } else if (shape[1] == geobox.height && shape[2] == geobox.width) {
        count = shape[0];
      } else {
        throw ConfigurationError("Geobox shape does not match array size.");
      }
    } else {
      throw ConfigurationError("Only 2 and 3 dimensional arrays are supported.");
    }

    return RasterDescriptor(geobox.width, geobox.height, count,
                            source.data.dtype(), geobox.crs, geobox.transform,
                            source.nodata);
  }

  std::uint64_t RasterDescriptor::raster_size() const {
    return static_cast<std::uint64_t>(element_byte_size(dtype_)) * width_ *
           height_ * band_count_;
  }

  RasterDescriptor RasterDescriptor::shrink2() const {
    return RasterDescriptor(width_ / 2, height_ / 2, band_count_, dtype_, crs_,
                            transform_.scaled(2, 2), nodata_);
  }

}  // namespace cogsink
