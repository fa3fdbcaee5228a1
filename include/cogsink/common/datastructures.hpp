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

#include <exception>
#include <string>

namespace cogsink {

  class cogsinkException : public std::exception {
   public:
    explicit cogsinkException(const std::string& message)
        : msg_("Error: " + message) {}
    virtual const char* what() const throw() { return msg_.c_str(); }

   protected:
    std::string msg_;
  };

  // Input or configuration that cannot describe a valid raster, eg. missing
  // georeferencing, a band axis that does not match the geobox or an unknown
  // element type.
  class ConfigurationError : public cogsinkException {
   public:
    explicit ConfigurationError(const std::string& message)
        : cogsinkException("Configuration error. " + message) {}
  };

  class UnsupportedOperation : public cogsinkException {
   public:
    explicit UnsupportedOperation(const std::string& message)
        : cogsinkException("Unsupported operation. " + message) {}
  };

  class InvalidArgument : public cogsinkException {
   public:
    explicit InvalidArgument(const std::string& message)
        : cogsinkException("Invalid argument. " + message) {}
  };

  // Raised by the raster backend when opening, writing, closing or copying a
  // dataset fails. Never retried.
  class BackendIOError : public cogsinkException {
   public:
    explicit BackendIOError(const std::string& message)
        : cogsinkException("Backend I/O error. " + message) {}
  };

}  // namespace cogsink
