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

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tally {

/// The outcome of a run.
enum class run_status : uint8_t {
  /// Every analyzer produced a metric.
  completed,
  /// At least one analyzer failed.
  completed_with_errors,
  /// The run was cancelled before all analyzers ran.
  cancelled,
};

/// @relates run_status
auto to_string(run_status x) -> std::string_view;

template <class Inspector>
auto inspect(Inspector& f, run_status& x) {
  return detail::inspect_enum(f, x);
}

/// A failure of a single analyzer.
struct analyzer_error {
  std::string analyzer;
  std::string key;
  caf::error error;
};

struct run_metadata {
  std::string table;
  time start = {};
  time end = {};
};

/// Counts of analyzer outcomes.
struct run_summary {
  size_t total = 0;
  size_t succeeded = 0;
  size_t failed = 0;
  size_t cancelled = 0;

  friend auto operator==(const run_summary&, const run_summary&) -> bool
    = default;
};

/// Metrics by key, ordered.
using metric_map = std::map<std::string, metric_value, std::less<>>;

/// The result of running a set of analyzers.
class analyzer_context {
public:
  analyzer_context() = default;

  explicit analyzer_context(run_metadata metadata)
    : metadata_{std::move(metadata)} {
    // nop
  }

  // -- accessors --------------------------------------------------------------

  auto metrics() const -> const metric_map& {
    return metrics_;
  }

  auto errors() const -> const std::vector<analyzer_error>& {
    return errors_;
  }

  /// Returns the keys of analyzers that did not run because the run was
  /// cancelled.
  auto cancelled() const -> const std::vector<std::string>& {
    return cancelled_;
  }

  auto metadata() const -> const run_metadata& {
    return metadata_;
  }

  auto status() const -> run_status;

  /// Looks up a metric by key.
  /// @returns `nullptr` if no metric exists for *key*.
  auto metric(std::string_view key) const -> const metric_value*;

  /// Returns all metrics whose key starts with *prefix*, ordered by key.
  auto metrics_with_prefix(std::string_view prefix) const
    -> std::vector<std::pair<std::string, metric_value>>;

  auto summary() const -> run_summary;

  // -- modifiers --------------------------------------------------------------

  void add_metric(std::string key, metric_value value);

  void add_error(analyzer_error error);

  void add_cancelled(std::string key);

  void finish(time end) {
    metadata_.end = end;
  }

private:
  metric_map metrics_;
  std::vector<analyzer_error> errors_;
  std::vector<std::string> cancelled_;
  run_metadata metadata_;
};

} // namespace tally

template <>
struct fmt::formatter<tally::run_status> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(tally::run_status x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(tally::to_string(x), ctx);
  }
};
