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

#include <cpl_conv.h>
#include <cpl_string.h>
#include <cpl_vsi.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include <cogsink/common/datastructures.hpp>
#include <cogsink/io/RasterBackend.hpp>
#include <cogsink/logger/logger.h>
#include <filesystem>

#include "fmt/format.h"

namespace cogsink::io {

  namespace fs = std::filesystem;

  namespace {
    GDALDataType to_gdal(DataType dtype) {
      switch (dtype) {
        case DataType::uint8:
          return GDT_Byte;
        case DataType::int8:
          return GDT_Int8;
        case DataType::uint16:
          return GDT_UInt16;
        case DataType::int16:
          return GDT_Int16;
        case DataType::uint32:
          return GDT_UInt32;
        case DataType::int32:
          return GDT_Int32;
        case DataType::uint64:
          return GDT_UInt64;
        case DataType::int64:
          return GDT_Int64;
        case DataType::float32:
          return GDT_Float32;
        case DataType::float64:
          return GDT_Float64;
      }
      return GDT_Unknown;
    }

    std::string error_message(const std::string& what) {
      std::string msg = what;
      const char* gdal_msg = CPLGetLastErrorMsg();
      if (gdal_msg != nullptr && *gdal_msg != '\0') {
        msg += " ";
        msg += gdal_msg;
      }
      return msg;
    }

    std::string xml_escape(const std::string& s) {
      char* escaped = CPLEscapeString(s.c_str(), -1, CPLES_XML);
      std::string out = escaped;
      CPLFree(escaped);
      return out;
    }

    bool is_virtual_path(const std::string& name) {
      return name.rfind("/vsi", 0) == 0;
    }

    void ensure_parent_directory(const std::string& name) {
      if (is_virtual_path(name)) return;
      auto parent = fs::path(name).parent_path();
      if (!parent.empty()) fs::create_directories(parent);
    }

    void set_nodata(GDALRasterBand* band, DataType dtype, double nodata) {
      CPLErr err;
      if (dtype == DataType::int64) {
        err = band->SetNoDataValueAsInt64(static_cast<int64_t>(nodata));
      } else if (dtype == DataType::uint64) {
        err = band->SetNoDataValueAsUInt64(static_cast<uint64_t>(nodata));
      } else {
        err = band->SetNoDataValue(nodata);
      }
      if (err != CE_None) {
        throw BackendIOError(error_message("Failed to set nodata value."));
      }
    }
  }  // namespace

  struct RasterDatasetGDAL : public RasterDatasetInterface {
    GDALDatasetUniquePtr ds_;
    std::string name_;

    RasterDatasetGDAL(GDALDatasetUniquePtr ds, std::string name)
        : ds_(std::move(ds)), name_(std::move(name)) {}

    void write_block(const PixelWindow& window, int band,
                     const RasterBlock& block) override {
      if (!ds_) {
        throw BackendIOError("Dataset " + name_ + " is closed.");
      }
      GDALRasterBand* rb = ds_->GetRasterBand(band);
      if (rb == nullptr) {
        throw BackendIOError("Dataset " + name_ + " has no band " +
                             std::to_string(band) + ".");
      }
      CPLErrorReset();
      CPLErr err = rb->RasterIO(
          GF_Write, static_cast<int>(window.col_off),
          static_cast<int>(window.row_off), static_cast<int>(window.width),
          static_cast<int>(window.height), const_cast<void*>(block.raw()),
          static_cast<int>(window.width), static_cast<int>(window.height),
          to_gdal(block.dtype()), 0, 0, nullptr);
      if (err != CE_None) {
        throw BackendIOError(error_message("Write to " + name_ + " failed."));
      }
    }

    void close() override {
      if (!ds_) return;
      CPLErrorReset();
      if (GDALClose(GDALDataset::ToHandle(ds_.release())) != CE_None) {
        throw BackendIOError(error_message("Closing " + name_ + " failed."));
      }
    }

    const std::string& name() const override { return name_; }
  };

  struct RasterBackendGDAL : public RasterBackendInterface {
    RasterBackendGDAL() { GDALAllRegister(); }

    GDALDriver* gtiff_driver() {
      GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
      if (driver == nullptr) {
        throw BackendIOError("GDAL GTiff driver is not available.");
      }
      return driver;
    }

    std::unique_ptr<RasterDatasetInterface> open_for_write(
        const std::string& name, const RasterDescriptor& info,
        const WriteOptions& options) override {
      CPLStringList opts;
      opts.SetNameValue("TILED", "YES");
      opts.SetNameValue("BLOCKXSIZE", std::to_string(options.block_xsize).c_str());
      opts.SetNameValue("BLOCKYSIZE", std::to_string(options.block_ysize).c_str());
      opts.SetNameValue("BIGTIFF", options.bigtiff ? "YES" : "NO");
      for (const auto& [key, value] : options.codec) {
        opts.SetNameValue(key.c_str(), value.c_str());
      }

      ensure_parent_directory(name);
      CPLErrorReset();
      GDALDatasetUniquePtr ds(gtiff_driver()->Create(
          name.c_str(), static_cast<int>(info.width()),
          static_cast<int>(info.height()), static_cast<int>(info.band_count()),
          to_gdal(info.dtype()), opts.List()));
      if (!ds) {
        throw BackendIOError(error_message("Failed to create " + name + "."));
      }

      auto gt = info.transform().coef;
      if (ds->SetGeoTransform(gt.data()) != CE_None) {
        throw BackendIOError(
            error_message("Failed to set geotransform on " + name + "."));
      }
      if (!info.crs().empty()) {
        OGRSpatialReference srs;
        srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        if (srs.SetFromUserInput(info.crs().c_str()) != OGRERR_NONE) {
          throw BackendIOError(
              error_message("Unable to interpret CRS " + info.crs() + "."));
        }
        if (ds->SetSpatialRef(&srs) != CE_None) {
          throw BackendIOError(error_message("Failed to set CRS on " + name + "."));
        }
      }
      if (info.nodata().has_value()) {
        for (int b = 1; b <= ds->GetRasterCount(); ++b) {
          set_nodata(ds->GetRasterBand(b), info.dtype(), *info.nodata());
        }
      }
      return std::make_unique<RasterDatasetGDAL>(std::move(ds), name);
    }

    std::string memory_file_name(const std::string& dirname,
                                 const std::string& filename) override {
      return "/vsimem/" + dirname + "/" + filename;
    }

    void remove(const std::string& name) override {
      VSIStatBufL stat;
      if (VSIStatL(name.c_str(), &stat) != 0) return;
      if (VSIUnlink(name.c_str()) != 0) {
        throw BackendIOError("Failed to remove " + name + ".");
      }
    }

    /**
     * Describe the chain as a VRT whose bands list the other chain members as
     * explicit overviews, so the GTiff driver can copy them as they are
     * instead of recomputing or discovering them.
     */
    std::string chain_to_vrt(const std::vector<std::string>& chain) {
      GDALDatasetUniquePtr src(GDALDataset::Open(
          chain.front().c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
      if (!src) {
        throw BackendIOError(
            error_message("Failed to open " + chain.front() + "."));
      }

      std::string xml = fmt::format(R"(<VRTDataset rasterXSize="{}" rasterYSize="{}">)",
                                    src->GetRasterXSize(), src->GetRasterYSize());
      if (const OGRSpatialReference* srs = src->GetSpatialRef()) {
        char* wkt = nullptr;
        srs->exportToWkt(&wkt);
        xml += "<SRS>" + xml_escape(wkt ? wkt : "") + "</SRS>";
        CPLFree(wkt);
      }
      double gt[6];
      if (src->GetGeoTransform(gt) == CE_None) {
        xml += fmt::format("<GeoTransform>{:.17g}, {:.17g}, {:.17g}, {:.17g}, "
                           "{:.17g}, {:.17g}</GeoTransform>",
                           gt[0], gt[1], gt[2], gt[3], gt[4], gt[5]);
      }
      for (int b = 1; b <= src->GetRasterCount(); ++b) {
        GDALRasterBand* band = src->GetRasterBand(b);
        xml += fmt::format(R"(<VRTRasterBand dataType="{}" band="{}">)",
                           GDALGetDataTypeName(band->GetRasterDataType()), b);
        int has_nodata = FALSE;
        double nodata = band->GetNoDataValue(&has_nodata);
        if (has_nodata) {
          xml += fmt::format("<NoDataValue>{:.17g}</NoDataValue>", nodata);
        }
        xml += fmt::format(
            R"(<SimpleSource><SourceFilename relativeToVRT="0">{}</SourceFilename><SourceBand>{}</SourceBand></SimpleSource>)",
            xml_escape(chain.front()), b);
        for (size_t i = 1; i < chain.size(); ++i) {
          xml += fmt::format(
              R"(<Overview><SourceFilename relativeToVRT="0">{}</SourceFilename><SourceBand>{}</SourceBand></Overview>)",
              xml_escape(chain[i]), b);
        }
        xml += "</VRTRasterBand>";
      }
      xml += "</VRTDataset>";
      return xml;
    }

    void copy_with_overviews(const std::vector<std::string>& chain,
                             const std::string& destination,
                             const CopyOptions& options) override {
      if (chain.empty()) {
        throw BackendIOError("Nothing to copy to " + destination + ".");
      }
      auto& logger = logger::Logger::get_logger();
      CPLErrorReset();

      auto vrt_xml = chain_to_vrt(chain);
      GDALDatasetUniquePtr src(
          GDALDataset::Open(vrt_xml.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
      if (!src) {
        throw BackendIOError(
            error_message("Failed to assemble overview chain of " +
                          chain.front() + "."));
      }
      logger.debug("Copying {} with {} overviews to {}", chain.front(),
                   src->GetRasterBand(1)->GetOverviewCount(), destination);

      CPLStringList opts;
      opts.SetNameValue("TILED", "YES");
      opts.SetNameValue("BLOCKXSIZE", std::to_string(options.block_xsize).c_str());
      opts.SetNameValue("BLOCKYSIZE", std::to_string(options.block_ysize).c_str());
      opts.SetNameValue("BIGTIFF", options.bigtiff ? "YES" : "NO");
      opts.SetNameValue("COPY_SRC_OVERVIEWS", "YES");
      for (const auto& [key, value] : options.codec) {
        opts.SetNameValue(key.c_str(), value.c_str());
      }

      ensure_parent_directory(destination);
      CPLConfigOptionSetter ovr_blocksize(
          "GDAL_TIFF_OVR_BLOCKSIZE",
          std::to_string(options.overview_block_size).c_str(), false);
      GDALDatasetUniquePtr out(gtiff_driver()->CreateCopy(
          destination.c_str(), src.get(), FALSE, opts.List(), nullptr,
          nullptr));
      if (!out) {
        throw BackendIOError(
            error_message("Failed to write " + destination + "."));
      }
      if (GDALClose(GDALDataset::ToHandle(out.release())) != CE_None) {
        throw BackendIOError(
            error_message("Failed to close " + destination + "."));
      }
    }
  };

  std::unique_ptr<RasterBackendInterface> createRasterBackendGDAL() {
    return std::make_unique<RasterBackendGDAL>();
  }

}  // namespace cogsink::io
