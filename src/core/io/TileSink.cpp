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

#include <cogsink/common/datastructures.hpp>
#include <cogsink/common/formatters.hpp>
#include <cogsink/io/TileSink.hpp>
#include <cogsink/logger/logger.h>

namespace cogsink::io {

  namespace {
    template <class... Ts>
    struct overloaded : Ts... {
      using Ts::operator()...;
    };
  }  // namespace

  bool resolve_bigtiff(BigTiff mode, const RasterDescriptor& info) {
    switch (mode) {
      case BigTiff::Yes:
        return true;
      case BigTiff::No:
        return false;
      case BigTiff::Auto:
        break;
    }
    // do bigtiff if raw raster is larger than 4GB
    return info.raster_size() > kBigTiffThreshold;
  }

  TileSink::TileSink(RasterBackendInterface& backend, RasterDescriptor info,
                     Destination destination, TileSinkOptions options)
      : backend_(backend), info_(std::move(info)) {
    WriteOptions wopts;
    wopts.bigtiff = resolve_bigtiff(options.bigtiff, info_);
    wopts.block_xsize =
        adjust_blocksize(options.block_size, static_cast<int>(info_.width()));
    wopts.block_ysize =
        adjust_blocksize(options.block_size, static_cast<int>(info_.height()));
    wopts.codec =
        options.codec.merged_over(default_codec_options()).to_map();

    name_ = std::visit(
        overloaded{
            [](const dst::Path& p) { return p.path; },
            [&](const dst::Transient&) {
              auto uuid = make_uuid4();
              mem_mine_ = std::make_unique<MemoryFile>(
                  backend_, uuid.substr(0, 8), uuid.substr(9) + ".tif");
              return mem_mine_->name();
            },
            [](const dst::ExistingHandle& h) {
              if (h.file == nullptr || h.file->is_closed()) {
                throw InvalidArgument("Destination memory file is not open.");
              }
              return h.file->name();
            },
        },
        destination);

    out_ = backend_.open_for_write(name_, info_, wopts);
    if (options.lock) lock_ = std::make_unique<std::mutex>();

    auto& logger = logger::Logger::get_logger();
    logger.debug("Opened TileSink {} ({}, blocks {}x{}, bigtiff={})", name_,
                 info_, wopts.block_xsize, wopts.block_ysize, wopts.bigtiff);
  }

  TileSink::~TileSink() {
    try {
      close();
    } catch (const std::exception& e) {
      auto& logger = logger::Logger::get_logger();
      logger.error("Failed to close TileSink {}. {}", name_, e.what());
    }
  }

  PixelWindow TileSink::check_write(const Roi& roi,
                                    const RasterBlock& block) const {
    if (roi.size() == 3) {
      throw UnsupportedOperation("Multi-band windowed writes are not supported.");
    }
    if (roi.size() != 2) {
      throw InvalidArgument("Only accept 2 and 3 dimensional windows, got " +
                            std::to_string(roi.size()) + ".");
    }
    auto window = window_from_roi(roi, static_cast<std::int64_t>(info_.height()),
                                  static_cast<std::int64_t>(info_.width()));
    if (block.ndim() != 2) {
      throw InvalidArgument("Expected a 2 dimensional block for a 2 axis window.");
    }
    if (block.dtype() != info_.dtype()) {
      throw InvalidArgument(fmt::format(
          "Block element type {} does not match raster element type {}.",
          block.dtype(), info_.dtype()));
    }
    if (block.shape()[0] != static_cast<size_t>(window.height) ||
        block.shape()[1] != static_cast<size_t>(window.width)) {
      throw InvalidArgument(
          fmt::format("Block of {}x{} does not match {}.", block.shape()[1],
                      block.shape()[0], window));
    }
    return window;
  }

  void TileSink::write(const Roi& roi, const RasterBlock& block) {
    auto window = check_write(roi, block);
    if (window.empty()) return;

    auto do_write = [&]() {
      if (closed_) {
        throw cogsinkException("Write to closed TileSink " + name_ + ".");
      }
      out_->write_block(window, 1, block);
    };

    if (lock_) {
      std::lock_guard<std::mutex> guard(*lock_);
      do_write();
    } else {
      do_write();
    }
  }

  void TileSink::close() {
    std::unique_lock<std::mutex> guard;
    if (lock_) guard = std::unique_lock<std::mutex>(*lock_);
    if (closed_) return;
    closed_ = true;

    out_->close();
    if (mem_mine_) {
      mem_mine_->close();
      mem_mine_.reset();
    }
    auto& logger = logger::Logger::get_logger();
    logger.debug("Closed TileSink {}", name_);
  }

}  // namespace cogsink::io
