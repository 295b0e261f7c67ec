//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/detail/assert.hpp"
#include "tally/detail/inspection_common.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <source_location>
#include <string>

namespace tally {

/// Tally's error codes.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The unspecified default error code.
  unspecified,
  /// The query engine failed to provide the requested data.
  data_access_error,
  /// Two analyzer states cannot be merged because their configuration differs.
  state_incompatibility,
  /// An anomaly detector does not have enough history to decide.
  insufficient_history,
  /// The type-specific pass of the column profiler failed.
  partial_profile,
  /// Saving or loading persisted state failed.
  store_error,
  /// Two analyzers produce the same metric key.
  duplicate_metric_key,
  /// A partition was already merged into the cumulative state.
  already_processed,
  /// An operation was cancelled before it ran.
  cancelled,
  /// Expected a different type.
  type_clash,
  /// An error with an input/output format.
  format_error,
  /// A dictionary or table lookup failed to return a value.
  lookup_error,
  /// An error caused by wrong internal application logic.
  logic_error,
  /// An error while accessing the filesystem.
  filesystem_error,
  /// A function received an invalid argument.
  invalid_argument,
  /// A computation produced no meaningful result.
  invalid_result,
  /// A component failed because its configuration was invalid.
  invalid_configuration,
  /// An error during serialization.
  serialization_error,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> const char*;

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

template <class Inspector>
auto inspect(Inspector& f, ec& x) {
  return detail::inspect_enum(f, x);
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

/// Attaches a human-readable note to an error, e.g., the analyzer or partition
/// it occurred in. Returns the input unchanged if it holds no error.
template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

inline void check(const caf::error& err, std::source_location location
                                         = std::source_location::current()) {
  if (err) [[unlikely]] {
    detail::panic_impl(render(err), location);
  }
}

template <class T>
[[nodiscard]] auto
check(caf::expected<T> result, std::source_location location
                               = std::source_location::current()) -> T {
  if (not result) [[unlikely]] {
    detail::panic_impl(render(result.error()), location);
  }
  return std::move(*result);
}

} // namespace tally

CAF_ERROR_CODE_ENUM(tally::ec)

template <>
struct fmt::formatter<caf::error> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const caf::error& x, FormatContext& ctx) const {
    auto str = tally::render(x);
    return fmt::formatter<std::string_view>::format(str, ctx);
  }
};

template <>
struct fmt::formatter<tally::ec> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(tally::ec x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(tally::to_string(x), ctx);
  }
};
