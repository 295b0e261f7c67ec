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
#include "tally/error.hpp"

#include <caf/expected.hpp>
#include <flatbuffers/flatbuffers.h>
#include <fmt/core.h>

#include <span>

namespace tally {

/// Returns a finished FlatBuffers builder's contents as an owned blob.
inline auto release(flatbuffers::FlatBufferBuilder& builder) -> blob {
  return blob{std::span<const uint8_t>{builder.GetBufferPointer(),
                                       builder.GetSize()}};
}

/// Verifies that *bytes* hold a valid root table of type *Table* and returns
/// a pointer into *bytes*.
/// @param identifier The table's file identifier, if it has one.
/// @pre *bytes* must outlive the returned table.
template <class Table>
[[nodiscard]] auto
verified_root(std::span<const std::byte> bytes,
              const char* identifier = nullptr) -> caf::expected<const Table*> {
  // FlatBuffers does not correctly use '::flatbuffers::{s,u}offset_t' over
  // '{s,u}offset_t' in `FLATBUFFERS_{MIN,MAX}_BUFFER_SIZE`.
  using flatbuffers::soffset_t, flatbuffers::uoffset_t;
  const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
  if (bytes.size() < FLATBUFFERS_MIN_BUFFER_SIZE) {
    return caf::make_error(
      ec::serialization_error,
      fmt::format("failed to read {} because its size {} "
                  "is below the minimum required size of {}",
                  Table::GetFullyQualifiedName(), bytes.size(),
                  FLATBUFFERS_MIN_BUFFER_SIZE));
  }
  if (bytes.size() >= FLATBUFFERS_MAX_BUFFER_SIZE) {
    return caf::make_error(
      ec::serialization_error,
      fmt::format("failed to read {} because its size {} "
                  "exceeds the maximum allowed size of {}",
                  Table::GetFullyQualifiedName(), bytes.size(),
                  FLATBUFFERS_MAX_BUFFER_SIZE));
  }
  if (identifier != nullptr
      and not flatbuffers::BufferHasIdentifier(data, identifier)) {
    return caf::make_error(ec::serialization_error,
                           fmt::format("failed to read {} because its "
                                       "buffer identifier is wrong or "
                                       "missing",
                                       Table::GetFullyQualifiedName()));
  }
  auto verifier = flatbuffers::Verifier{data, bytes.size()};
  if (not verifier.VerifyBuffer<Table>(identifier)) {
    return caf::make_error(ec::serialization_error,
                           fmt::format("failed to verify {}",
                                       Table::GetFullyQualifiedName()));
  }
  return flatbuffers::GetRoot<Table>(data);
}

} // namespace tally
