//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include <caf/error.hpp>

#include <cstddef>
#include <filesystem>
#include <span>

namespace tally::io {

/// Writes a buffer to a temporary file and renames it to *filename*, so that
/// readers either see the old or the new contents.
/// @param filename The file to write to.
/// @param xs The buffer to write.
/// @returns An error if the operation failed.
caf::error
save(const std::filesystem::path& filename, std::span<const std::byte> xs);

} // namespace tally::io
