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
#include "tally/defaults.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tally {

/// Keeps the history of metric values.
class metrics_repository {
public:
  virtual ~metrics_repository() noexcept = default;

  /// Records a value of a metric.
  virtual auto store(const std::string& metric, double value, time timestamp,
                     tag_map tags = {}) -> caf::error
    = 0;

  /// Returns the values of a metric in `[from, to)`, ordered by time.
  virtual auto history(const std::string& metric, time from, time to) const
    -> caf::expected<std::vector<metric_point>>
    = 0;
};

struct repository_limits {
  /// The most recent points of a metric that are kept.
  size_t max_points_per_metric = defaults::anomaly::max_points_per_metric;
  /// The number of distinct metrics; storing a new metric beyond it fails.
  size_t max_metrics = defaults::anomaly::max_metrics;
  /// Points older than the newest point of their metric minus this age are
  /// dropped.
  duration max_age = defaults::anomaly::max_age;
};

/// A metrics repository that keeps everything in memory.
class memory_metrics_repository final : public metrics_repository {
public:
  explicit memory_metrics_repository(repository_limits limits = {});

  auto store(const std::string& metric, double value, time timestamp,
             tag_map tags = {}) -> caf::error override;

  auto history(const std::string& metric, time from, time to) const
    -> caf::expected<std::vector<metric_point>> override;

  /// Returns the number of metrics with at least one point.
  auto size() const -> size_t;

  auto limits() const -> const repository_limits& {
    return limits_;
  }

private:
  repository_limits limits_;
  mutable std::mutex mutex_;
  std::map<std::string, std::vector<metric_point>> series_;
};

} // namespace tally
