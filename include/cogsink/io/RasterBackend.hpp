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

#include <cogsink/common/RasterBlock.hpp>
#include <cogsink/common/RasterDescriptor.hpp>
#include <cogsink/common/Window.hpp>
#include <cogsink/common/common.hpp>
#include <memory>
#include <string>
#include <vector>

namespace cogsink::io {

  /**
   * @brief Creation options of a single tiled dataset.
   */
  struct WriteOptions {
    int block_xsize = 512;
    int block_ysize = 512;
    bool bigtiff = false;
    // Upper-case creation option key/values, see CodecOptions::to_map().
    StrMap codec;
  };

  /**
   * @brief Options for the final overview preserving copy.
   */
  struct CopyOptions {
    int block_xsize = 512;
    int block_ysize = 512;
    bool bigtiff = false;
    // Internal tile size of the overview levels in the output.
    int overview_block_size = 512;
    StrMap codec;
  };

  /**
   * @brief A raster dataset that is open for writing.
   */
  struct RasterDatasetInterface {
    virtual ~RasterDatasetInterface() = default;

    /**
     * @brief Write a 2D block into band `band` (1-based) at `window`. The
     * block shape is (window.height, window.width).
     */
    virtual void write_block(const PixelWindow& window, int band,
                             const RasterBlock& block) = 0;

    // Flush and release the dataset. Idempotent.
    virtual void close() = 0;

    virtual const std::string& name() const = 0;
  };

  /**
   * @brief The raster I/O collaborator that sinks sequence their calls into.
   */
  struct RasterBackendInterface {
    virtual ~RasterBackendInterface() = default;

    /**
     * @brief Create a new tiled dataset at `name` (a filesystem path or a
     * memory file name).
     *
     * @throws BackendIOError
     */
    virtual std::unique_ptr<RasterDatasetInterface> open_for_write(
        const std::string& name, const RasterDescriptor& info,
        const WriteOptions& options) = 0;

    /**
     * @brief Name under which an in-memory resource `dirname/filename` can be
     * opened with open_for_write(). Nothing is allocated until then.
     */
    virtual std::string memory_file_name(const std::string& dirname,
                                         const std::string& filename) = 0;

    /**
     * @brief Release a dataset that was written to `name`. Removing a name
     * that was never written is not an error.
     *
     * @throws BackendIOError
     */
    virtual void remove(const std::string& name) = 0;

    /**
     * @brief Copy `chain[0]` to `destination`, embedding `chain[1..]` as its
     * overview levels in that order. Every member of the chain is the
     * half-resolution overview of the one before it.
     *
     * @throws BackendIOError
     */
    virtual void copy_with_overviews(const std::vector<std::string>& chain,
                                     const std::string& destination,
                                     const CopyOptions& options) = 0;
  };

  std::unique_ptr<RasterBackendInterface> createRasterBackendGDAL();

  /**
   * @brief Owner of one in-memory raster resource.
   *
   * The resource is released by close(), which may be called any number of
   * times. Destruction closes too.
   */
  class MemoryFile {
    RasterBackendInterface& backend_;
    std::string name_;
    bool closed_ = false;

   public:
    MemoryFile(RasterBackendInterface& backend, const std::string& dirname,
               const std::string& filename);
    ~MemoryFile();

    MemoryFile(const MemoryFile&) = delete;
    MemoryFile& operator=(const MemoryFile&) = delete;

    const std::string& name() const { return name_; }
    bool is_closed() const { return closed_; }

    void close();
  };

}  // namespace cogsink::io
