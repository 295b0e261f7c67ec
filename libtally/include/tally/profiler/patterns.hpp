//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/pattern.hpp"

#include <caf/expected.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally {

struct named_pattern {
  std::string name;
  pattern regex;
};

/// Returns the library of well-known string formats: `email`, `url`, `uuid`,
/// `ipv4`, `phone`, `iso_date` and `us_date`.
auto string_patterns() -> caf::expected<std::vector<named_pattern>>;

/// Returns the recognized textual date formats: `iso_datetime`, `iso_date`,
/// `us_date` and `eu_date`.
auto date_formats() -> caf::expected<std::vector<named_pattern>>;

/// Rewrites a date in one of the `date_formats` into ISO 8601, so that dates
/// compare lexicographically.
/// @returns `std::nullopt` if *format* is unknown or *value* is malformed.
auto normalize_date(std::string_view format, std::string_view value)
  -> std::optional<std::string>;

} // namespace tally
