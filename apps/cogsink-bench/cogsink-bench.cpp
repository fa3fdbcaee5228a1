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

#include <atomic>
#include <chrono>
#include <cogsink/cogsink.h>
#include <cogsink/common/formatters.hpp>
#include <cogsink/logger/logger.h>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

#include "config.hpp"

// Windows of `tile` x `tile` pixels covering the raster in row major order,
// clipped at the right and bottom edges.
std::vector<cogsink::PixelWindow> tile_windows(
    const cogsink::RasterDescriptor& info, int tile) {
  std::vector<cogsink::PixelWindow> windows;
  const auto w = static_cast<std::int64_t>(info.width());
  const auto h = static_cast<std::int64_t>(info.height());
  for (std::int64_t r = 0; r < h; r += tile) {
    for (std::int64_t c = 0; c < w; c += tile) {
      windows.push_back({c, r, std::min<std::int64_t>(tile, w - c),
                         std::min<std::int64_t>(tile, h - r)});
    }
  }
  return windows;
}

// Deterministic diagonal gradient, so that the output can be checked by eye.
cogsink::RasterBlock make_pattern(cogsink::DataType dtype,
                                  const cogsink::PixelWindow& win) {
  cogsink::RasterBlock block(dtype, {static_cast<size_t>(win.height),
                                     static_cast<size_t>(win.width)});
  cogsink::visit_data_type(dtype, [&](auto v) {
    using T = decltype(v);
    T* out = block.data<T>();
    for (std::int64_t r = 0; r < win.height; ++r) {
      for (std::int64_t c = 0; c < win.width; ++c) {
        out[r * win.width + c] =
            static_cast<T>((win.row_off + r + win.col_off + c) % 251);
      }
    }
  });
  return block;
}

cogsink::Roi to_roi(const cogsink::PixelWindow& win) {
  return {cogsink::Slice{win.row_off, win.row_off + win.height, std::nullopt},
          cogsink::Slice{win.col_off, win.col_off + win.width, std::nullopt}};
}

int main(int argc, const char* argv[]) {
  auto& logger = cogsink::logger::Logger::get_logger();

  CLIArgs cli_args(argc, argv);
  BenchConfigHandler handler;

  // Parse basic command line arguments (not yet the configuration parameters)
  try {
    handler.parse_cli_first_pass(cli_args);
  } catch (const std::exception& e) {
    logger.error("Failed to parse command line arguments.");
    logger.error("{} Use '-h' to print usage information.", e.what());
    return EXIT_FAILURE;
  }
  if (handler._print_help) {
    handler.print_help(cli_args.program_name);
    return EXIT_SUCCESS;
  }

  // Read configuration file, config path has already been checked for existence
  if (!handler._config_path.empty()) {
    logger.info("Reading configuration from file {}", handler._config_path);
    try {
      handler.parse_config_file();
    } catch (const std::exception& e) {
      logger.error(
          "Unable to parse config file {}. {} Use '-h' to print usage "
          "information.",
          handler._config_path, e.what());
      return EXIT_FAILURE;
    }
  }

  // Parse further command line arguments, those will override values from
  // config file
  try {
    handler.parse_cli_second_pass(cli_args);
  } catch (const std::exception& e) {
    logger.error(
        "Failed to parse command line arguments. {} Use '-h' to print usage "
        "information.",
        e.what());
    return EXIT_FAILURE;
  }

  try {
    handler.validate();
  } catch (const std::exception& e) {
    logger.error(
        "Failed to validate parameter values. {} Use '-h' to print usage "
        "information.",
        e.what());
    return EXIT_FAILURE;
  }

  logger.set_level(handler._loglevel);
  logger.debug("{}", handler);

  const auto& cfg = handler.cfg_;
  try {
    auto info = cfg.raster_info();
    auto backend = cogsink::io::createRasterBackendGDAL();
    cogsink::io::PyramidSink sink(*backend, info, cfg.output_path,
                                  cfg.pyramid_config());

    logger.info("Writing {} in {} levels with {} threads", info,
                sink.num_levels(), handler._jobs);

    auto windows = tile_windows(info, cfg.tile);
    std::atomic<size_t> next{0};
    std::atomic<size_t> written{0};
    std::atomic<bool> failed{false};
    std::exception_ptr error;
    std::mutex error_mutex;

    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> workers;
    for (int j = 0; j < handler._jobs; ++j) {
      workers.emplace_back([&]() {
        try {
          for (size_t i = next++; i < windows.size() && !failed; i = next++) {
            const auto& win = windows[i];
            sink.write(to_roi(win), make_pattern(info.dtype(), win));
            logger.trace("write", ++written);
          }
        } catch (...) {
          failed = true;
          std::lock_guard<std::mutex> guard(error_mutex);
          if (!error) error = std::current_exception();
        }
      });
    }
    for (auto& worker : workers) worker.join();
    if (error) std::rethrow_exception(error);

    auto write_done = std::chrono::steady_clock::now();
    sink.finalize();
    auto end = std::chrono::steady_clock::now();

    std::chrono::duration<double> write_time = write_done - start;
    std::chrono::duration<double> finalize_time = end - write_done;
    const double mpix =
        static_cast<double>(info.width()) * info.height() / 1e6;
    logger.info("Wrote {} windows in {:.2f}s ({:.1f} Mpix/s), finalized in "
                "{:.2f}s",
                windows.size(), write_time.count(),
                mpix / write_time.count(), finalize_time.count());
    logger.info("Output written to {}", cfg.output_path);
  } catch (const std::exception& e) {
    logger.error("{}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
