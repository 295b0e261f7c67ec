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
#include "tally/metric_value.hpp"

#include <caf/error.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally {

/// The meaning of a column's values, as opposed to their storage type.
enum class semantic_type : uint8_t {
  integer,
  decimal,
  boolean,
  string,
  date,
  categorical,
  mixed,
  unknown,
};

/// @relates semantic_type
auto to_string(semantic_type x) -> std::string_view;

template <class Inspector>
auto inspect(Inspector& f, semantic_type& x) {
  return detail::inspect_enum(f, x);
}

/// The distribution of a numeric column.
struct numeric_summary {
  double mean = 0.0;
  /// The population standard deviation.
  double stddev = 0.0;
  double min = 0.0;
  double max = 0.0;
  /// Quantiles named `p01`, `p05`, ..., `p99`.
  distribution quantiles;
  /// The Tukey fences `Q1 - 1.5 IQR` and `Q3 + 1.5 IQR`.
  double lower_fence = 0.0;
  double upper_fence = 0.0;
  bool has_low_outliers = false;
  bool has_high_outliers = false;

  friend auto operator==(const numeric_summary&, const numeric_summary&)
    -> bool
    = default;
};

struct histogram_bucket {
  std::string value;
  uint64_t count = 0;
  /// The share of non-null rows with this value.
  double ratio = 0.0;

  friend auto operator==(const histogram_bucket&, const histogram_bucket&)
    -> bool
    = default;
};

/// The most frequent values of a categorical column.
struct categorical_summary {
  /// At most top-N buckets, ordered by count descending, then by value.
  std::vector<histogram_bucket> buckets;
  /// Whether the buckets cover all distinct values.
  bool is_complete = true;
  /// The number of rows whose value was not included in a bucket.
  uint64_t dropped_count = 0;
  /// The Shannon entropy of the full value distribution in bits.
  double entropy = 0.0;

  friend auto operator==(const categorical_summary&, const categorical_summary&)
    -> bool
    = default;
};

struct pattern_match {
  std::string pattern;
  uint64_t count = 0;
  double ratio = 0.0;

  friend auto operator==(const pattern_match&, const pattern_match&) -> bool
    = default;
};

/// Well-known formats and lengths of a string column.
struct string_summary {
  /// One entry per library pattern, counted over a sample.
  std::vector<pattern_match> patterns;
  uint64_t sample_size = 0;
  uint64_t min_length = 0;
  uint64_t max_length = 0;
  double mean_length = 0.0;

  friend auto operator==(const string_summary&, const string_summary&) -> bool
    = default;
};

/// The range and formats of a date column.
struct temporal_summary {
  /// ISO 8601 renderings of the earliest and latest value.
  std::string earliest;
  std::string latest;
  /// The detected formats, most frequent first.
  std::vector<std::string> formats;
  /// The share of values in the most frequent format.
  double format_consistency = 1.0;

  friend auto operator==(const temporal_summary&, const temporal_summary&)
    -> bool
    = default;
};

/// The profile of one column.
struct column_profile {
  std::string column;
  semantic_type type = semantic_type::unknown;
  double confidence = 0.0;
  uint64_t row_count = 0;
  uint64_t null_count = 0;
  double null_ratio = 0.0;
  uint64_t distinct_count = 0;
  /// Whether `distinct_count` is exact or a HyperLogLog estimate.
  bool distinct_is_exact = true;
  std::optional<numeric_summary> numeric;
  std::optional<categorical_summary> categorical;
  std::optional<string_summary> strings;
  std::optional<temporal_summary> temporal;
  /// The passes that ran, in order.
  std::vector<uint8_t> passes;

  friend auto operator==(const column_profile&, const column_profile&) -> bool
    = default;
};

/// A failure to profile one column.
struct column_error {
  std::string column;
  caf::error error;
};

/// The profiles of all columns of a table.
struct table_profile {
  std::string table;
  std::vector<column_profile> columns;
  std::vector<column_error> errors;

  /// Looks up the profile of a column.
  auto find(std::string_view column) const -> const column_profile*;
};

} // namespace tally

template <>
struct fmt::formatter<tally::semantic_type>
  : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(tally::semantic_type x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(tally::to_string(x), ctx);
  }
};
