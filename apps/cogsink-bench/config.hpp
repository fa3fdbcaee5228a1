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

#include <cogsink/PyramidConfig.hpp>
#include <cogsink/common/RasterDescriptor.hpp>
#include <cogsink/common/common.hpp>
#include <cogsink/io/PyramidSink.hpp>
#include <cogsink/logger/logger.h>

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <toml++/toml.hpp>
#include <utility>

#include "fmt/format.h"
#include "parameter.hpp"
#include "validators.hpp"

namespace fs = std::filesystem;
namespace check = cogsink::validators;

struct BenchConfig {
  // raster
  int width = 8192;
  int height = 8192;
  std::string dtype = "uint16";
  std::string crs = "EPSG:3857";

  // output layout
  int block_size = 512;
  // 0 means equal to block_size
  int overview_block_size = 0;
  std::string bigtiff = "auto";
  std::string compress = "DEFLATE";
  int zlevel = 6;
  int predictor = 2;
  cogsink::StrMap creation_options;

  // writing
  int tile = 1024;
  bool lock = true;
  std::string temp_folder;
  std::string output_path;

  cogsink::RasterDescriptor raster_info() const {
    cogsink::GeoTransform gt;
    // unit pixels, origin at the top left
    gt.coef = {0., 1., 0., static_cast<double>(height), 0., -1.};
    return cogsink::RasterDescriptor(
        static_cast<size_t>(width), static_cast<size_t>(height), 1,
        cogsink::data_type_from_name(dtype), crs, gt);
  }

  cogsink::PyramidConfig pyramid_config() const {
    cogsink::PyramidConfig cfg;
    cfg.block_size = block_size;
    if (overview_block_size > 0) cfg.overview_block_size = overview_block_size;
    if (bigtiff == "yes") {
      cfg.bigtiff = cogsink::io::BigTiff::Yes;
    } else if (bigtiff == "no") {
      cfg.bigtiff = cogsink::io::BigTiff::No;
    } else {
      cfg.bigtiff = cogsink::io::BigTiff::Auto;
    }
    cfg.lock = lock;
    if (!temp_folder.empty()) cfg.temp_folder = temp_folder;
    cfg.codec.compress = compress;
    cfg.codec.zlevel = zlevel;
    cfg.codec.predictor = predictor;
    cfg.codec.extra = creation_options;
    return cfg;
  }
};

struct CLIArgs {
  std::string program_name;
  std::list<std::string> args;

  CLIArgs(int argc, const char* argv[]) {
    program_name = argv[0];
    // get the name of the bindary
    auto pos = program_name.find_last_of("/\\");
    if (pos != std::string::npos) {
      program_name = program_name.substr(pos + 1);
    }
    for (int i = 1; i < argc; i++) {
      args.push_back(argv[i]);
    }
  }
};

struct BenchConfigHandler {
  BenchConfig cfg_;

  using param_group_map = std::vector<std::pair<std::string, ParameterVector>>;

  param_group_map app_param_groups_;
  param_group_map param_groups_;
  std::unordered_map<std::string, ConfigParameter*> param_index_;
  std::unordered_map<std::string, ConfigParameter*> app_param_index_;

  // flags
  bool _print_help = false;
  bool _verbose = false;
  cogsink::logger::LogLevel _loglevel = cogsink::logger::LogLevel::info;
  std::string _config_path;
  int _jobs =
      std::max(1, static_cast<int>(std::thread::hardware_concurrency()));

  BenchConfigHandler() {
    ParameterVector general, raster, output, writing;

    general.add("help", 'h', "Show help message", _print_help);
    general.add("verbose", 'v', "Log debug messages", _verbose);
    general.add("jobs", 'j', "Number of writer threads", _jobs,
                {check::HigherThan<int>(0)});
    general.add("config", 'c', "Configuration file", _config_path);
    general.add("loglevel", "Specify loglevel", _loglevel);

    raster.add("width", "Raster width in pixels.", cfg_.width,
               {check::HigherThan<int>(0)});
    raster.add("height", "Raster height in pixels.", cfg_.height,
               {check::HigherThan<int>(0)});
    raster.add("dtype", "Element type of the raster.", cfg_.dtype,
               {check::OneOf<std::string>(
                   {"uint8", "int8", "uint16", "int16", "uint32", "int32",
                    "uint64", "int64", "float32", "float64"})});
    raster.add("crs", "Coordinate reference system of the raster.", cfg_.crs);

    output.add("block-size", "Internal tile size of the output.",
               cfg_.block_size, {check::HigherThan<int>(0)});
    output.add("overview-block-size",
               "Internal tile size of the overviews, also the size below which "
               "no further overview is made. 0 to use block-size.",
               cfg_.overview_block_size, {check::HigherOrEqualTo<int>(0)});
    output.add("bigtiff", "Write a BigTIFF.", cfg_.bigtiff,
               {check::OneOf<std::string>({"auto", "yes", "no"})});
    output.add("compress", "Compression method of the output.", cfg_.compress);
    output.add("zlevel", "DEFLATE compression level.", cfg_.zlevel,
               {check::InRange<int>(1, 9)});
    output.add("predictor",
               "Predictor, 1: none, 2: horizontal differencing, 3: floating "
               "point.",
               cfg_.predictor, {check::InRange<int>(1, 3)});

    writing.add("tile", "Edge length of the windows that are written.",
                cfg_.tile, {check::HigherThan<int>(0)});
    writing.add("lock", "Serialise writes to each pyramid level.", cfg_.lock);
    writing.add("temp-folder",
                "Folder for the temporary pyramid levels. Levels are kept in "
                "memory when not set.",
                cfg_.temp_folder, {check::DirIsWritable});

    app_param_groups_.emplace_back("General", std::move(general));
    param_groups_.emplace_back("Raster", std::move(raster));
    param_groups_.emplace_back("Output", std::move(output));
    param_groups_.emplace_back("Writing", std::move(writing));

    for (auto& [group_name, group] : param_groups_) {
      group.add_to_index(param_index_);
    }
    for (auto& [group_name, group] : app_param_groups_) {
      group.add_to_index(app_param_index_);
    }
  };

  void validate() {
    for (auto& [group_name, group] : param_groups_) {
      for (auto& param : group) {
        if (auto error_msg = param->validate()) {
          throw std::runtime_error(
              fmt::format("Validation error for {} parameter {}. {}",
                          group_name, param->longname_, *error_msg));
        }
      }
    }
    if (_jobs < 1) {
      throw std::runtime_error("Number of jobs must be at least 1.");
    }
    if (!cfg_.lock && _jobs > 1) {
      throw std::runtime_error("Writing without lock requires --jobs 1.");
    }
    // Windows must stay aligned on every overview level; a single window
    // that covers the whole raster is always fine.
    auto info = cfg_.raster_info();
    auto levels = cogsink::io::plan_pyramid(
        info, cfg_.pyramid_config().effective_overview_block_size());
    const int alignment = 1 << (levels.size() - 1);
    const bool single_window =
        static_cast<size_t>(cfg_.tile) >= std::max(info.width(), info.height());
    if (!single_window && cfg_.tile % alignment != 0) {
      throw std::runtime_error(fmt::format(
          "Tile size {} must be a multiple of {} for a pyramid of {} levels.",
          cfg_.tile, alignment, levels.size()));
    }
    if (cfg_.output_path.empty()) {
      throw std::runtime_error("No output path given.");
    }
    auto parent = fs::path(cfg_.output_path).parent_path().string();
    if (auto error_msg = check::DirIsWritable(parent.empty() ? "." : parent)) {
      throw std::runtime_error(
          fmt::format("Can't write output file. {}", *error_msg));
    }
  }

  template <typename T, typename node>
  void get_toml_value(const node& config, const std::string& key, T& result) {
    if (auto tml_value = config[key].template value<T>();
        tml_value.has_value()) {
      result = *tml_value;
    } else {
      throw std::runtime_error(
          fmt::format("Failed to read value for {} from config file.", key));
    }
  }

  void print_help(const std::string& program_name) {
    // see http://docopt.org/
    std::cout << "Write a synthetic raster with embedded overviews from "
                 "concurrent windowed writes\n\n";
    std::cout << "\033[1mUsage\033[0m:" << "\n";
    std::cout << "  " << program_name << " [options] <output.tif>\n";
    std::cout << "  " << program_name
              << " [options] (-c | --config) <config-file> [<output.tif>]\n";
    std::cout << "  " << program_name << " -h | --help" << "\n";
    std::cout << "\n";
    std::cout << "\033[1mPositional arguments:\033[0m" << "\n";
    std::cout << "  <output.tif>                 Path of the GeoTIFF to "
                 "write.\n";

    print_params(app_param_groups_);
    print_params(param_groups_);
  }

  void print_params(param_group_map& params) {
    const size_t param_column_width = 35;

    for (auto& [group_name, group] : params) {
      if (group.empty()) continue;
      std::cout << "\n";
      std::cout << "\033[1m" << group_name << " options:\033[0m\n";
      for (auto& param : group) {
        std::string param_text =
            param->cli_flag() + " " + param->type_description();
        if (param_text.size() <= param_column_width - 2) {
          std::cout << "  " << std::setw(param_column_width) << std::left
                    << param_text << param->description() << "\n";
        } else {
          std::cout << "  " << param_text << "\n"
                    << std::string(param_column_width + 2, ' ')
                    << param->description() << "\n";
        }
        std::cout << std::string(param_column_width + 2, ' ') << "\033[34m"
                  << "Default: " << param->default_to_string() << "\033[0m\n";
      }
    }
  }

  void parse_cli_first_pass(CLIArgs& c) {
    // parse program control arguments (not in config file)
    auto it = c.args.begin();
    while (it != c.args.end()) {
      const std::string& arg = *it;
      std::string argname = "";
      if (arg.starts_with("--")) {
        argname = arg.substr(2);
      } else if (arg.starts_with("-")) {
        argname = arg.substr(1);
      }
      if (auto p = app_param_index_.find(argname);
          !argname.empty() && p != app_param_index_.end()) {
        it = c.args.erase(it);
        it = p->second->set(c.args, it);
      } else {
        ++it;
      }
    }
    if (!_config_path.empty()) {
      if (auto error_msg = check::PathExists(_config_path)) {
        throw std::runtime_error(
            fmt::format("Invalid argument for -c or --config. {}", *error_msg));
      }
    }
    if (_verbose) _loglevel = cogsink::logger::LogLevel::debug;
  }

  void parse_cli_second_pass(CLIArgs& c) {
    auto it = c.args.begin();
    while (it != c.args.end()) {
      std::string arg = *it;

      try {
        if (arg.starts_with("--no-")) {
          auto argname = arg.substr(5);
          if (auto p = param_index_.find(argname); p != param_index_.end()) {
            it = c.args.erase(it);
            p->second->unset();
          } else {
            throw std::runtime_error(fmt::format("Unknown argument: {}.", arg));
          }
        } else if (arg.starts_with("--")) {
          auto argname = arg.substr(2);
          if (auto p = param_index_.find(argname); p != param_index_.end()) {
            it = c.args.erase(it);
            it = p->second->set(c.args, it);
          } else {
            throw std::runtime_error(fmt::format("Unknown argument: {}.", arg));
          }
        } else if (arg.starts_with("-") && arg.size() > 1) {
          throw std::runtime_error(fmt::format("Unknown argument: {}.", arg));
        } else {
          ++it;
        }
      } catch (const std::exception& e) {
        throw std::runtime_error(
            fmt::format("Error parsing argument: {}. {}", arg, e.what()));
      }
    }

    // now c.args should only contain the output path, if any
    if (c.args.size() == 1) {
      cfg_.output_path = c.args.back();
    } else if (c.args.size() > 1) {
      throw std::runtime_error("Too many positional arguments.");
    } else if (cfg_.output_path.empty()) {
      throw std::runtime_error(
          "Need to provide <output.tif> or set output in the config file.");
    }
  };

  void parse_config_file() {
    toml::table config;
    try {
      config = toml::parse_file(_config_path);
    } catch (const toml::parse_error& e) {
      throw std::runtime_error(
          fmt::format("Syntax error. {}", e.description()));
    }

    // iterate config table
    for (const auto& [key, value] : config) {
      try {
        if (key == "output") {
          get_toml_value(config, "output", cfg_.output_path);
        } else if (key == "creation-options") {
          const toml::table* tb = value.as_table();
          if (tb == nullptr) {
            throw std::runtime_error("Expected a table of strings.");
          }
          for (const auto& [opt, opt_value] : *tb) {
            std::string s;
            get_toml_value(*tb, std::string(opt.str()), s);
            cfg_.creation_options[std::string(opt.str())] = s;
          }
        } else if (auto p = param_index_.find(std::string(key.str()));
                   p != param_index_.end()) {
          p->second->set_from_toml(config, std::string(key.str()));
        } else {
          throw std::runtime_error(
              fmt::format("Unknown parameter in config file: {}.", key.str()));
        }
      } catch (const std::exception& e) {
        throw std::runtime_error(
            fmt::format("Failed to read value for {} from config file. {}",
                        key.str(), e.what()));
      }
    }
  }
};

template <>
struct fmt::formatter<BenchConfigHandler> {
  static constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
  template <typename Context>
  auto format(BenchConfigHandler const& cfgh, Context& ctx) const {
    fmt::format_to(ctx.out(), "BenchConfig(output={}", cfgh.cfg_.output_path);
    for (const auto& [groupname, param_list] : cfgh.param_groups_) {
      for (const auto& param : param_list) {
        fmt::format_to(ctx.out(), ", {}={}", param->longname_,
                       param->to_string());
      }
    }
    return fmt::format_to(ctx.out(), ")");
  }
};
