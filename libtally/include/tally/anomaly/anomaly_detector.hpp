//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/anomaly/anomaly.hpp"
#include "tally/anomaly/metrics_repository.hpp"
#include "tally/anomaly/strategies.hpp"
#include "tally/defaults.hpp"
#include "tally/glob.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <memory>
#include <string>
#include <vector>

namespace tally {

struct detection_options {
  /// Findings below this confidence are discarded.
  double min_confidence = defaults::anomaly::min_confidence;
  /// How far back history is read.
  duration history_window = defaults::anomaly::history_window;
  /// Record checked values in the repository after detection.
  bool store_current_metrics = defaults::anomaly::store_current_metrics;
};

/// A strategy that declined to decide.
struct abstention {
  std::string metric;
  std::string strategy;
  std::string reason;
};

/// A strategy or the repository failed while checking a metric. The strategy
/// is empty for repository failures.
struct detection_error {
  std::string metric;
  std::string strategy;
  caf::error error;
};

/// The findings of one detection pass.
struct detection_report {
  std::vector<anomaly> anomalies;
  std::vector<abstention> abstentions;
  std::vector<detection_error> errors;
  /// The number of anomalies discarded for their low confidence.
  size_t filtered = 0;
};

/// Checks metric values against their history with the strategies registered
/// for their names.
class anomaly_detector {
public:
  explicit anomaly_detector(std::shared_ptr<metrics_repository> repository,
                            detection_options options = {});

  /// Registers a strategy for all metrics whose name matches *pattern*, an
  /// exact name or a glob with `*` and `?`.
  /// @returns `ec::invalid_argument` for an empty pattern.
  auto add(std::string_view pattern,
           std::shared_ptr<const detection_strategy> strategy) -> caf::error;

  auto options() const -> const detection_options& {
    return options_;
  }

  /// Runs every matching strategy on one value.
  /// @returns the first repository error.
  auto detect(const std::string& metric, double current, time now,
              tag_map tags = {}) -> caf::expected<detection_report>;

  /// Runs the matching strategies on every numeric metric of a run. Repository
  /// errors are reported per metric.
  auto detect(const analyzer_context& context, time now) -> detection_report;

private:
  struct registration {
    std::string pattern;
    glob compiled;
    std::shared_ptr<const detection_strategy> strategy;
  };

  /// Checks one value and appends the findings to *report*.
  auto check(detection_report& report, const std::string& metric,
             double current, time now, tag_map tags) -> caf::error;

  std::shared_ptr<metrics_repository> repository_;
  detection_options options_;
  std::vector<registration> strategies_;
};

} // namespace tally
