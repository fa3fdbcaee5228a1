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

/**
 * spdlog logging backend implementation.
 * Messages up to warning go to stdout, error and critical to stderr, and
 * everything is mirrored to a JSON log file.
 */
#include <cogsink/logger/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace cogsink::logger {

  namespace {
    spdlog::level::level_enum cast_level(LogLevel level) {
      switch (level) {
        case LogLevel::off:
          return spdlog::level::off;
        case LogLevel::trace:
          return spdlog::level::trace;
        case LogLevel::debug:
          return spdlog::level::debug;
        case LogLevel::info:
          return spdlog::level::info;
        case LogLevel::warning:
          return spdlog::level::warn;
        case LogLevel::error:
          return spdlog::level::err;
        case LogLevel::critical:
          return spdlog::level::critical;
      }
      return spdlog::level::off;
    }

    const std::string json_record_pattern = {
        R"({"time": "%Y-%m-%dT%H:%M:%S.%f%z", "name": "%n", "level": "%^%l%$", "process": %P, "thread": %t, "message": "%v"})"};
  }  // namespace

  struct Logger::logger_impl {
    LogLevel level = LogLevel::default_level;

    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> stdout_sink =
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> stderr_sink =
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    std::shared_ptr<spdlog::sinks::basic_file_sink<std::mutex>> file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(logfile_path_,
                                                            true);

    spdlog::logger logger_stdout =
        spdlog::logger("cogsink", {stdout_sink, file_sink});
    spdlog::logger logger_stderr =
        spdlog::logger("cogsink", {stderr_sink, file_sink});

    logger_impl() {
      set_level(level);
      // Open the json array in the logfile, every record is terminated with a
      // comma and the closing record is written on destruction.
      file_sink->set_pattern("{\n \"log\": [");
      file_sink->log(spdlog::details::log_msg("", spdlog::level::critical, ""));
      file_sink->set_pattern(json_record_pattern + ",");
    }

    ~logger_impl() {
      file_sink->set_pattern(json_record_pattern);
      file_sink->log(
          spdlog::details::log_msg("cogsink", spdlog::level::info, "Finished."));
      file_sink->set_pattern("]\n}");
      file_sink->log(spdlog::details::log_msg("", spdlog::level::critical, ""));
      file_sink->flush();
    }

    void set_level(LogLevel new_level) {
      level = new_level;
      auto spdlog_level = cast_level(new_level);
      stdout_sink->set_level(spdlog_level);
      stderr_sink->set_level(spdlog_level);
      file_sink->set_level(spdlog_level);
      logger_stdout.set_level(spdlog_level);
      logger_stderr.set_level(spdlog_level);
    }
  };

  void Logger::set_level(LogLevel level) {
    if (impl_) impl_->set_level(level);
  }

  Logger &Logger::get_logger() {
    static Logger singleton;
    if (!singleton.impl_) {
      singleton.impl_ = std::make_shared<Logger::logger_impl>();
    }
    return singleton;
  }

  void Logger::log(LogLevel level, std::string_view message) {
    if (!impl_) return;
    switch (level) {
      case LogLevel::off:
        return;
      case LogLevel::trace:
        impl_->logger_stdout.trace(message);
        return;
      case LogLevel::debug:
        impl_->logger_stdout.debug(message);
        return;
      case LogLevel::info:
        impl_->logger_stdout.info(message);
        return;
      case LogLevel::warning:
        impl_->logger_stdout.warn(message);
        return;
      case LogLevel::error:
        impl_->logger_stderr.error(message);
        return;
      case LogLevel::critical:
        impl_->logger_stderr.critical(message);
        return;
    }
  }

}  // namespace cogsink::logger
