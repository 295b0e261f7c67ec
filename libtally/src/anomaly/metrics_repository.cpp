//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/anomaly/metrics_repository.hpp"

#include "tally/error.hpp"
#include "tally/logger.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace tally {

memory_metrics_repository::memory_metrics_repository(repository_limits limits)
  : limits_{limits} {
  // nop
}

auto memory_metrics_repository::store(const std::string& metric, double value,
                                      time timestamp, tag_map tags)
  -> caf::error {
  auto guard = std::lock_guard{mutex_};
  auto it = series_.find(metric);
  if (it == series_.end()) {
    if (series_.size() >= limits_.max_metrics) {
      return caf::make_error(ec::store_error,
                             fmt::format("cannot store metric {}: the "
                                         "repository is limited to {} "
                                         "metrics",
                                         metric, limits_.max_metrics));
    }
    it = series_.emplace(metric, std::vector<metric_point>{}).first;
  }
  auto& points = it->second;
  auto point = metric_point{timestamp, value, std::move(tags)};
  // Points mostly arrive in order, so this is usually an append.
  auto pos = std::upper_bound(points.begin(), points.end(), timestamp,
                              [](time x, const metric_point& y) {
                                return x < y.timestamp;
                              });
  points.insert(pos, std::move(point));
  auto cutoff = points.back().timestamp - limits_.max_age;
  auto expired = std::lower_bound(points.begin(), points.end(), cutoff,
                                  [](const metric_point& x, time y) {
                                    return x.timestamp < y;
                                  });
  points.erase(points.begin(), expired);
  if (points.size() > limits_.max_points_per_metric) {
    auto excess = points.size() - limits_.max_points_per_metric;
    points.erase(points.begin(),
                 points.begin() + static_cast<std::ptrdiff_t>(excess));
  }
  TALLY_TRACE("stored {} = {} ({} points)", metric, value, points.size());
  return {};
}

auto memory_metrics_repository::history(const std::string& metric, time from,
                                        time to) const
  -> caf::expected<std::vector<metric_point>> {
  auto guard = std::lock_guard{mutex_};
  auto result = std::vector<metric_point>{};
  auto it = series_.find(metric);
  if (it == series_.end()) {
    return result;
  }
  for (const auto& point : it->second) {
    if (point.timestamp >= from and point.timestamp < to) {
      result.push_back(point);
    }
  }
  return result;
}

auto memory_metrics_repository::size() const -> size_t {
  auto guard = std::lock_guard{mutex_};
  return series_.size();
}

} // namespace tally
