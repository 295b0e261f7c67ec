//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/blob.hpp"

#include <caf/expected.hpp>

#include <filesystem>

namespace tally::io {

/// Reads a file into a buffer.
/// @param filename The file to read from.
/// @returns The contents of *filename*.
caf::expected<blob> read(const std::filesystem::path& filename);

} // namespace tally::io
