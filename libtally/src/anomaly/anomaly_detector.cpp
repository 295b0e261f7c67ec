//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/anomaly/anomaly_detector.hpp"

#include "tally/analyzer_context.hpp"
#include "tally/error.hpp"
#include "tally/logger.hpp"

#include <fmt/format.h>

namespace tally {

anomaly_detector::anomaly_detector(
  std::shared_ptr<metrics_repository> repository, detection_options options)
  : repository_{std::move(repository)}, options_{options} {
  TALLY_ASSERT(repository_ != nullptr);
}

auto anomaly_detector::add(std::string_view pattern,
                           std::shared_ptr<const detection_strategy> strategy)
  -> caf::error {
  if (pattern.empty()) {
    return caf::make_error(ec::invalid_argument,
                           "metric pattern must not be empty");
  }
  if (not strategy) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("no strategy given for pattern {}",
                                       pattern));
  }
  TALLY_DEBUG("registering {} for metrics matching {}", strategy->name(),
              pattern);
  strategies_.push_back(
    {std::string{pattern}, parse_glob(pattern), std::move(strategy)});
  return {};
}

auto anomaly_detector::check(detection_report& report,
                             const std::string& metric, double current,
                             time now, tag_map tags) -> caf::error {
  auto history = std::optional<std::vector<metric_point>>{};
  for (const auto& entry : strategies_) {
    if (not matches(metric, entry.compiled)) {
      continue;
    }
    // Read the history once for all matching strategies.
    if (not history) {
      auto points
        = repository_->history(metric, now - options_.history_window, now);
      if (not points) {
        return add_context(points.error(), "failed to read history of {}",
                           metric);
      }
      history = std::move(*points);
    }
    const auto& strategy = *entry.strategy;
    auto result = strategy.detect(metric, *history, current);
    if (not result) {
      if (result.error() == ec::insufficient_history) {
        TALLY_DEBUG("{} abstains on {}: {}", strategy.name(), metric,
                    result.error());
        report.abstentions.push_back(
          {metric, std::string{strategy.name()}, render(result.error())});
      } else {
        TALLY_WARN("{} failed on {}: {}", strategy.name(), metric,
                   result.error());
        report.errors.push_back(
          {metric, std::string{strategy.name()}, std::move(result.error())});
      }
      continue;
    }
    if (not *result) {
      continue;
    }
    auto& finding = **result;
    if (finding.confidence < options_.min_confidence) {
      TALLY_DEBUG("discarding {} finding on {} with confidence {}",
                  strategy.name(), metric, finding.confidence);
      ++report.filtered;
      continue;
    }
    finding.metric = metric;
    finding.detected_at = now;
    TALLY_INFO("{} detected a {} anomaly in {}: {}", strategy.name(),
               finding.severity, metric, finding.description);
    report.anomalies.push_back(std::move(finding));
  }
  if (options_.store_current_metrics) {
    if (auto err = repository_->store(metric, current, now, std::move(tags))) {
      return add_context(err, "failed to store {}", metric);
    }
  }
  return {};
}

auto anomaly_detector::detect(const std::string& metric, double current,
                              time now, tag_map tags)
  -> caf::expected<detection_report> {
  auto report = detection_report{};
  if (auto err = check(report, metric, current, now, std::move(tags))) {
    return err;
  }
  return report;
}

auto anomaly_detector::detect(const analyzer_context& context, time now)
  -> detection_report {
  auto report = detection_report{};
  auto tags = tag_map{{"table", context.metadata().table}};
  for (const auto& [key, value] : context.metrics()) {
    auto current = value.to_double();
    if (not current) {
      continue;
    }
    if (auto err = check(report, key, *current, now, tags)) {
      TALLY_WARN("failed to check {}: {}", key, err);
      report.errors.push_back({key, {}, std::move(err)});
    }
  }
  return report;
}

} // namespace tally
