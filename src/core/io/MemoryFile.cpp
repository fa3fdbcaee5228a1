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

#include <cogsink/io/RasterBackend.hpp>
#include <cogsink/logger/logger.h>

namespace cogsink::io {

  MemoryFile::MemoryFile(RasterBackendInterface& backend,
                         const std::string& dirname,
                         const std::string& filename)
      : backend_(backend), name_(backend.memory_file_name(dirname, filename)) {}

  MemoryFile::~MemoryFile() {
    try {
      close();
    } catch (const std::exception& e) {
      auto& logger = logger::Logger::get_logger();
      logger.error("Failed to release memory file {}. {}", name_, e.what());
    }
  }

  void MemoryFile::close() {
    if (closed_) return;
    closed_ = true;
    backend_.remove(name_);
  }

}  // namespace cogsink::io
