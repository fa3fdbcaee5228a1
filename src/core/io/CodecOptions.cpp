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
#include <cctype>
#include <cogsink/io/CodecOptions.hpp>

namespace cogsink::io {

  namespace {
    std::string to_upper(std::string s) {
      std::transform(s.begin(), s.end(), s.begin(),
                     [](unsigned char c) { return std::toupper(c); });
      return s;
    }

    template <typename T>
    void override_with(std::optional<T>& dst, const std::optional<T>& src) {
      if (src.has_value()) dst = src;
    }
  }  // namespace

  CodecOptions CodecOptions::merged_over(const CodecOptions& defaults) const {
    CodecOptions out = defaults;
    override_with(out.compress, compress);
    override_with(out.zlevel, zlevel);
    override_with(out.zstd_level, zstd_level);
    override_with(out.predictor, predictor);
    override_with(out.num_threads, num_threads);
    override_with(out.sparse_ok, sparse_ok);
    for (const auto& [key, value] : extra) {
      // drop a differently cased default for the same key
      auto ukey = to_upper(key);
      std::erase_if(out.extra, [&](const auto& kv) {
        return to_upper(kv.first) == ukey;
      });
      out.extra[key] = value;
    }
    return out;
  }

  StrMap CodecOptions::to_map() const {
    StrMap out;
    if (compress) out["COMPRESS"] = to_upper(*compress);
    if (zlevel) out["ZLEVEL"] = std::to_string(*zlevel);
    if (zstd_level) out["ZSTD_LEVEL"] = std::to_string(*zstd_level);
    if (predictor) out["PREDICTOR"] = std::to_string(*predictor);
    if (num_threads) out["NUM_THREADS"] = *num_threads;
    if (sparse_ok) out["SPARSE_OK"] = *sparse_ok ? "TRUE" : "FALSE";
    for (const auto& [key, value] : extra) {
      out[to_upper(key)] = value;
    }
    return out;
  }

  CodecOptions default_codec_options() {
    CodecOptions opts;
    opts.compress = "DEFLATE";
    opts.zlevel = 6;
    opts.predictor = 2;
    opts.num_threads = "ALL_CPUS";
    return opts;
  }

  CodecOptions temp_codec_options() {
    CodecOptions opts;
    opts.compress = "ZSTD";
    opts.zstd_level = 1;
    opts.predictor = 1;
    opts.num_threads = "ALL_CPUS";
    opts.sparse_ok = true;
    return opts;
  }

}  // namespace cogsink::io
