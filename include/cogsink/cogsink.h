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
 * @file cogsink.h
 * @brief Write georeferenced rasters with embedded overviews from windowed,
 * out-of-order writes.
 *
 * Typical use:
 *
 *   auto backend = cogsink::io::createRasterBackendGDAL();
 *   cogsink::io::PyramidSink sink(*backend, info, "out.tif");
 *   // from any number of worker threads, non-overlapping windows:
 *   sink.write({cogsink::Slice{0, 512}, cogsink::Slice{0, 512}}, block);
 *   sink.finalize();
 */
#pragma once

#include <cogsink/PyramidConfig.hpp>
#include <cogsink/common/RasterBlock.hpp>
#include <cogsink/common/RasterDescriptor.hpp>
#include <cogsink/common/Window.hpp>
#include <cogsink/common/common.hpp>
#include <cogsink/common/datastructures.hpp>
#include <cogsink/io/CodecOptions.hpp>
#include <cogsink/io/PyramidSink.hpp>
#include <cogsink/io/RasterBackend.hpp>
#include <cogsink/io/TileSink.hpp>
#include <cogsink/misc/Downsampler.hpp>
