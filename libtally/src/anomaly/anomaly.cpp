//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/anomaly/anomaly.hpp"

#include "tally/detail/assert.hpp"

#include <algorithm>
#include <array>

namespace tally {

namespace {

constexpr auto severity_names
  = std::array<std::string_view, 3>{"info", "warning", "critical"};

} // namespace

auto to_string(severity x) -> std::string_view {
  auto index = static_cast<size_t>(x);
  TALLY_ASSERT(index < severity_names.size());
  return severity_names[index];
}

auto parse_severity(std::string_view str) -> std::optional<severity> {
  for (size_t i = 0; i < severity_names.size(); ++i) {
    if (severity_names[i] == str) {
      return static_cast<severity>(i);
    }
  }
  return std::nullopt;
}

auto severity_of(double ratio) -> severity {
  if (ratio >= 3.0) {
    return severity::critical;
  }
  if (ratio >= 2.0) {
    return severity::warning;
  }
  return severity::info;
}

auto confidence_of(double ratio) -> double {
  return std::clamp(ratio / 2.0, 0.0, 1.0);
}

} // namespace tally
