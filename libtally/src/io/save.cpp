//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/io/save.hpp"

#include "tally/error.hpp"
#include "tally/logger.hpp"

#include <fmt/format.h>

#include <fstream>
#include <system_error>

namespace tally::io {

namespace {

caf::error
write(const std::filesystem::path& filename, std::span<const std::byte> xs) {
  auto out = std::ofstream{filename, std::ios::binary | std::ios::trunc};
  if (not out) {
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open {} for writing",
                                       filename.string()));
  }
  out.write(reinterpret_cast<const char*>(xs.data()),
            static_cast<std::streamsize>(xs.size()));
  out.flush();
  if (not out) {
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to write {} bytes to {}",
                                       xs.size(), filename.string()));
  }
  return caf::none;
}

} // namespace

caf::error
save(const std::filesystem::path& filename, std::span<const std::byte> xs) {
  std::error_code ec{};
  if (filename.has_parent_path()) {
    std::filesystem::create_directories(filename.parent_path(), ec);
    if (ec) {
      return caf::make_error(ec::filesystem_error,
                             fmt::format("failed to create directory {}: {}",
                                         filename.parent_path().string(),
                                         ec.message()));
    }
  }
  auto tmp = filename;
  tmp += ".tmp";
  if (auto err = write(tmp, xs)) {
    if (const auto removed = std::filesystem::remove(tmp, ec); !removed || ec)
      TALLY_WARN("failed to remove file {} : {}", tmp.string(), ec.message());
    return err;
  }
  std::filesystem::rename(tmp, filename, ec);
  if (ec) {
    auto err = caf::make_error(ec::filesystem_error,
                               fmt::format("failed to rename {} : {}",
                                           filename.string(), ec.message()));
    std::filesystem::remove(tmp, ec);
    return err;
  }
  return caf::none;
}

} // namespace tally::io
