//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/io/read.hpp"

#include "tally/error.hpp"

#include <fmt/format.h>

#include <fstream>
#include <system_error>

namespace tally::io {

caf::expected<blob> read(const std::filesystem::path& filename) {
  std::error_code err{};
  const auto size = std::filesystem::file_size(filename, err);
  if (size == static_cast<std::uintmax_t>(-1)) {
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to get file size for filename "
                                       "{}: {}",
                                       filename.string(), err.message()));
  }
  auto in = std::ifstream{filename, std::ios::binary};
  if (not in) {
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open {}", filename.string()));
  }
  auto buffer = blob{};
  buffer.resize(size);
  in.read(reinterpret_cast<char*>(buffer.data()),
          static_cast<std::streamsize>(size));
  if (static_cast<std::uintmax_t>(in.gcount()) != size) {
    return caf::make_error(ec::filesystem_error,
                           fmt::format("incomplete read of {}",
                                       filename.string()));
  }
  return buffer;
}

} // namespace tally::io
