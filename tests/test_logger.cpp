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

#include <cogsink/logger/logger.h>

#include <catch2/catch_test_macros.hpp>

TEST_CASE("logger") {
  auto& logger = cogsink::logger::Logger::get_logger();
  logger.set_level(cogsink::logger::LogLevel::trace);
  logger.trace("write", 42);
  logger.debug("debug {}", 1);
  logger.info("info");
  logger.warning("warning {}", "text");
  logger.error("error");
  logger.critical("critical");
  logger.set_level(cogsink::logger::LogLevel::info);
}

TEST_CASE("logger is a single instance") {
  auto& a = cogsink::logger::Logger::get_logger();
  auto& b = cogsink::logger::Logger::get_logger();
  REQUIRE(&a == &b);
}
