//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/detail/inspection_common.hpp"

#include <fmt/format.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tally {

enum class severity : uint8_t {
  info,
  warning,
  critical,
};

/// @relates severity
auto to_string(severity x) -> std::string_view;

/// @relates severity
auto parse_severity(std::string_view str) -> std::optional<severity>;

template <class Inspector>
auto inspect(Inspector& f, severity& x) {
  return detail::inspect_enum(f, x);
}

/// Free-form annotations of a stored metric value.
using tag_map = std::map<std::string, std::string>;

/// A historical value of a metric.
struct metric_point {
  time timestamp = {};
  double value = 0.0;
  tag_map tags = {};

  friend auto operator==(const metric_point&, const metric_point&) -> bool
    = default;
};

/// A metric value that deviates from its expected range.
struct anomaly {
  std::string metric;
  double value = 0.0;
  /// The expected range of the value.
  double lower = 0.0;
  double upper = 0.0;
  tally::severity severity = tally::severity::info;
  /// How sure the detecting strategy is, in [0, 1].
  double confidence = 0.0;
  std::string strategy;
  std::string description;
  time detected_at = {};

  friend auto operator==(const anomaly&, const anomaly&) -> bool = default;
};

/// Maps the ratio of a deviation to its threshold onto a severity: critical
/// from 3, warning from 2, and info below.
auto severity_of(double ratio) -> severity;

/// Maps the ratio of a deviation to its threshold onto a confidence of
/// `min(1, ratio / 2)`.
auto confidence_of(double ratio) -> double;

} // namespace tally

template <>
struct fmt::formatter<tally::severity> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(tally::severity x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(tally::to_string(x), ctx);
  }
};
