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

#include <algorithm>
#include <cogsink/common/datastructures.hpp>
#include <cogsink/common/formatters.hpp>
#include <cogsink/io/PyramidSink.hpp>
#include <cogsink/logger/logger.h>
#include <cogsink/misc/Downsampler.hpp>
#include <filesystem>

namespace cogsink::io {

  namespace fs = std::filesystem;

  std::vector<RasterDescriptor> plan_pyramid(const RasterDescriptor& info,
                                             int overview_block_size) {
    std::vector<RasterDescriptor> levels;
    RasterDescriptor ii = info;
    while (true) {
      levels.push_back(ii);
      if (levels.size() == kMaxPyramidLevels) break;

      // If last overview was odd sized do no more
      if ((ii.width() % 2) || (ii.height() % 2)) break;

      // If last overview was smaller than 1 block along any dimension don't
      // go further
      if (std::min(ii.width(), ii.height()) <
          static_cast<size_t>(overview_block_size))
        break;

      ii = ii.shrink2();
    }
    return levels;
  }

  PyramidSink::PyramidSink(RasterBackendInterface& backend,
                           const RasterDescriptor& info,
                           std::string destination, PyramidConfig cfg)
      : backend_(backend),
        destination_(std::move(destination)),
        cfg_(std::move(cfg)) {
    if (!cfg_.is_valid()) {
      throw ConfigurationError("Block sizes must be positive.");
    }
    auto& logger = logger::Logger::get_logger();

    const bool bigtiff = resolve_bigtiff(cfg_.bigtiff, info);
    TileSinkOptions sink_opts;
    sink_opts.bigtiff = bigtiff ? BigTiff::Yes : BigTiff::No;
    sink_opts.codec = temp_codec_options();
    sink_opts.lock = cfg_.lock;
    sink_opts.block_size = kTempBlockSize;

    const std::string temp = make_uuid4();
    std::string ext = ".tif";

    auto plan = plan_pyramid(info, cfg_.effective_overview_block_size());
    levels_.reserve(plan.size());
    for (size_t i = 0; i < plan.size(); ++i) {
      Level level{plan[i], "", std::nullopt, nullptr, nullptr};
      if (i > 0) level.overview_of = i - 1;

      Destination level_dst;
      if (cfg_.temp_folder) {
        level.name = (fs::path(*cfg_.temp_folder) / (temp + ext)).string();
        level_dst = dst::Path{level.name};
      } else {
        level.mem = std::make_unique<MemoryFile>(backend_, temp.substr(0, 8),
                                                 temp.substr(9) + ext);
        level.name = level.mem->name();
        level_dst = dst::ExistingHandle{level.mem.get()};
      }
      level.sink = std::make_unique<TileSink>(backend_, level.info, level_dst,
                                              sink_opts);
      logger.debug("Pyramid level {}: {} at {}", i, level.info, level.name);
      levels_.push_back(std::move(level));

      ext += ".ovr";
      if (sink_opts.block_size > kMinTempBlockSize) {
        sink_opts.block_size /= 2;
      }
    }
    logger.debug("PyramidSink for {} with {} levels", destination_,
                 levels_.size());
  }

  PyramidSink::~PyramidSink() {
    if (!finalized_) {
      auto& logger = logger::Logger::get_logger();
      logger.warning("PyramidSink for {} destroyed without finalize()",
                     destination_);
    }
  }

  void PyramidSink::write(const Roi& roi, const RasterBlock& block) {
    levels_.front().sink->check_write(roi, block);

    // Derive and check every overview before the first write, so that a
    // rejected window leaves all levels untouched.
    std::vector<std::pair<Roi, RasterBlock>> overviews;
    if (levels_.size() > 1) {
      auto ovr = misc::downsample(roi, block);
      for (size_t i = 1; i < levels_.size(); ++i) {
        if (ovr.second.empty()) break;
        levels_[i].sink->check_write(ovr.first, ovr.second);
        overviews.push_back(ovr);
        if (i + 1 < levels_.size()) {
          ovr = misc::downsample(ovr.first, ovr.second);
        }
      }
    }

    levels_.front().sink->write(roi, block);
    for (size_t i = 0; i < overviews.size(); ++i) {
      levels_[i + 1].sink->write(overviews[i].first, overviews[i].second);
    }
  }

  void PyramidSink::close() {
    for (auto& level : levels_) {
      level.sink->close();
    }
  }

  std::vector<std::string> PyramidSink::overview_chain() const {
    std::vector<std::string> chain;
    std::optional<size_t> current = 0;
    while (current) {
      chain.push_back(levels_[*current].name);
      auto next = std::find_if(levels_.begin(), levels_.end(),
                               [&](const Level& l) {
                                 return l.overview_of == current;
                               });
      if (next == levels_.end()) {
        current.reset();
      } else {
        current = static_cast<size_t>(std::distance(levels_.begin(), next));
      }
    }
    return chain;
  }

  void PyramidSink::finalize() {
    if (finalized_) {
      throw cogsinkException("PyramidSink for " + destination_ +
                             " was already finalized.");
    }
    finalized_ = true;
    auto& logger = logger::Logger::get_logger();

    // Write out any remainders if needed
    close();

    const auto& info = levels_.front().info;
    CopyOptions copts;
    copts.block_xsize =
        adjust_blocksize(cfg_.block_size, static_cast<int>(info.width()));
    copts.block_ysize =
        adjust_blocksize(cfg_.block_size, static_cast<int>(info.height()));
    copts.bigtiff = resolve_bigtiff(cfg_.bigtiff, info);
    copts.overview_block_size = cfg_.effective_overview_block_size();
    copts.codec = cfg_.codec.merged_over(default_codec_options()).to_map();

    auto chain = overview_chain();
    logger.info("Writing {} with {} overview levels", destination_,
                chain.size() - 1);
    try {
      backend_.copy_with_overviews(chain, destination_, copts);
    } catch (const std::exception& e) {
      logger.error("Failed to write {}, temporary levels are kept. {}",
                   destination_, e.what());
      throw;
    }
    remove_temporaries();
  }

  void PyramidSink::remove_temporaries() {
    for (auto& level : levels_) {
      if (level.mem) {
        level.mem->close();
      } else {
        backend_.remove(level.name);
      }
    }
  }

}  // namespace cogsink::io
