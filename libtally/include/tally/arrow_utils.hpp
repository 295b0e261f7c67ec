//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/error.hpp"
#include "tally/panic.hpp"

#include <arrow/array.h>
#include <arrow/chunked_array.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <caf/error.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <source_location>
#include <string_view>
#include <variant>

namespace tally {

inline void
check(const arrow::Status& status, std::source_location location
                                   = std::source_location::current()) {
  if (not status.ok()) [[unlikely]] {
    panic_at(location, "{}", status.ToString());
  }
}

template <class T>
[[nodiscard]] auto
check(arrow::Result<T> result, std::source_location location
                               = std::source_location::current()) -> T {
  check(result.status(), location);
  return result.MoveValueUnsafe();
}

/// Converts a failed Arrow status into an error.
auto to_error(const arrow::Status& status) -> caf::error;

/// A single non-null value of a column. Dates and timestamps are represented
/// by their integral Arrow storage. Unsigned 64-bit values that do not fit into
/// an `int64_t` are represented as doubles.
using cell = std::variant<int64_t, double, bool, std::string_view>;

/// The coarse shape of an Arrow column as seen by analyzers.
enum class column_kind : uint8_t {
  integral,
  floating,
  boolean,
  string,
  temporal,
};

/// Classifies an Arrow data type.
/// @returns `std::nullopt` for types that analyzers do not support.
auto classify(const arrow::DataType& type) -> std::optional<column_kind>;

/// Calls *f* for every value of *column*, passing `std::nullopt` for nulls.
/// @returns an error of type `ec::type_clash` for unsupported column types.
auto for_each_cell(const arrow::ChunkedArray& column,
                   const std::function<void(const std::optional<cell>&)>& f)
  -> caf::error;

/// Interprets a cell as a number.
/// @returns `std::nullopt` for string cells.
auto as_double(const cell& x) -> std::optional<double>;

/// Renders a cell for histograms and samples.
auto to_string(const cell& x) -> std::string;

} // namespace tally
