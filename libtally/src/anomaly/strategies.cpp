//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/anomaly/strategies.hpp"

#include "tally/error.hpp"
#include "tally/logger.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>
#include <numeric>

namespace tally {

namespace {

constexpr auto infinity = std::numeric_limits<double>::infinity();

auto insufficient_history(std::string_view reason) -> caf::error {
  return caf::make_error(ec::insufficient_history, std::string{reason});
}

auto check_history(std::span<const metric_point> history, size_t min_history)
  -> caf::error {
  if (history.size() < min_history) {
    return insufficient_history(fmt::format("need {} historical values, got {}",
                                            min_history, history.size()));
  }
  return {};
}

auto check_current(double current) -> caf::error {
  if (not std::isfinite(current)) {
    return insufficient_history(fmt::format("cannot judge the non-finite "
                                            "value {}",
                                            current));
  }
  return {};
}

auto check_threshold(const std::optional<double>& threshold,
                     std::string_view name) -> caf::error {
  if (threshold and not(std::isfinite(*threshold) and *threshold > 0.0)) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("{} must be finite and positive, got "
                                       "{}",
                                       name, *threshold));
  }
  return {};
}

auto mean_of(std::span<const metric_point> points) -> double {
  auto sum = std::accumulate(points.begin(), points.end(), 0.0,
                             [](double acc, const metric_point& x) {
                               return acc + x.value;
                             });
  return sum / static_cast<double>(points.size());
}

auto flag(std::string_view metric, double value, double lower, double upper,
          double ratio, std::string_view strategy, std::string description)
  -> std::optional<anomaly> {
  return anomaly{
    .metric = std::string{metric},
    .value = value,
    .lower = lower,
    .upper = upper,
    .severity = severity_of(ratio),
    .confidence = confidence_of(ratio),
    .strategy = std::string{strategy},
    .description = std::move(description),
  };
}

} // namespace

// -- baseline -----------------------------------------------------------------

auto baseline::compute(std::span<const metric_point> history) const
  -> caf::expected<double> {
  if (history.empty()) {
    return insufficient_history("history is empty");
  }
  switch (kind) {
    case method::last:
      return history.back().value;
    case method::mean:
      return mean_of(history);
    case method::window:
      if (points == 0 or history.size() < points) {
        return insufficient_history(fmt::format("window of {} values exceeds "
                                                "history of {}",
                                                points, history.size()));
      }
      return mean_of(history.last(points));
    case method::seasonal:
      if (points == 0 or history.size() < points) {
        return insufficient_history(fmt::format("season of {} values exceeds "
                                                "history of {}",
                                                points, history.size()));
      }
      return history[history.size() - points].value;
  }
  TALLY_UNREACHABLE();
}

// -- relative_rate_of_change --------------------------------------------------

auto relative_rate_of_change::make(rate_of_change_options options)
  -> caf::expected<relative_rate_of_change> {
  if (not options.max_increase and not options.max_decrease) {
    return caf::make_error(ec::invalid_argument,
                           "relative rate of change needs a threshold");
  }
  if (auto err = check_threshold(options.max_increase, "max_increase")) {
    return err;
  }
  if (auto err = check_threshold(options.max_decrease, "max_decrease")) {
    return err;
  }
  return relative_rate_of_change{options};
}

auto relative_rate_of_change::detect(std::string_view metric,
                                     std::span<const metric_point> history,
                                     double current) const
  -> caf::expected<std::optional<anomaly>> {
  if (auto err = check_current(current)) {
    return err;
  }
  if (auto err = check_history(history, options_.min_history)) {
    return err;
  }
  auto base = options_.baseline.compute(history);
  if (not base) {
    return std::move(base.error());
  }
  if (*base == 0.0) {
    return insufficient_history("the baseline is zero");
  }
  auto magnitude = std::abs(*base);
  auto rate = (current - *base) / magnitude;
  auto lower = options_.max_decrease ? *base - magnitude * *options_.max_decrease
                                     : -infinity;
  auto upper = options_.max_increase ? *base + magnitude * *options_.max_increase
                                     : infinity;
  TALLY_TRACE("{}: rate of change {} against baseline {}", metric, rate, *base);
  if (rate > 0.0 and options_.max_increase) {
    auto ratio = rate / *options_.max_increase;
    if (ratio > 1.0) {
      return flag(metric, current, lower, upper, ratio, name(),
                  fmt::format("increase of {:.1f}% exceeds {:.1f}%",
                              rate * 100.0,
                              *options_.max_increase * 100.0));
    }
  } else if (rate < 0.0 and options_.max_decrease) {
    auto ratio = -rate / *options_.max_decrease;
    if (ratio > 1.0) {
      return flag(metric, current, lower, upper, ratio, name(),
                  fmt::format("decrease of {:.1f}% exceeds {:.1f}%",
                              -rate * 100.0,
                              *options_.max_decrease * 100.0));
    }
  }
  return std::optional<anomaly>{};
}

// -- absolute_change ----------------------------------------------------------

auto absolute_change::make(absolute_change_options options)
  -> caf::expected<absolute_change> {
  if (not options.max_increase and not options.max_decrease) {
    return caf::make_error(ec::invalid_argument,
                           "absolute change needs a threshold");
  }
  if (auto err = check_threshold(options.max_increase, "max_increase")) {
    return err;
  }
  if (auto err = check_threshold(options.max_decrease, "max_decrease")) {
    return err;
  }
  return absolute_change{options};
}

auto absolute_change::detect(std::string_view metric,
                             std::span<const metric_point> history,
                             double current) const
  -> caf::expected<std::optional<anomaly>> {
  if (auto err = check_current(current)) {
    return err;
  }
  if (auto err = check_history(history, options_.min_history)) {
    return err;
  }
  auto base = options_.baseline.compute(history);
  if (not base) {
    return std::move(base.error());
  }
  auto delta = current - *base;
  auto lower
    = options_.max_decrease ? *base - *options_.max_decrease : -infinity;
  auto upper
    = options_.max_increase ? *base + *options_.max_increase : infinity;
  if (delta > 0.0 and options_.max_increase) {
    auto ratio = delta / *options_.max_increase;
    if (ratio > 1.0) {
      return flag(metric, current, lower, upper, ratio, name(),
                  fmt::format("increase by {} exceeds {}", delta,
                              *options_.max_increase));
    }
  } else if (delta < 0.0 and options_.max_decrease) {
    auto ratio = -delta / *options_.max_decrease;
    if (ratio > 1.0) {
      return flag(metric, current, lower, upper, ratio, name(),
                  fmt::format("decrease by {} exceeds {}", -delta,
                              *options_.max_decrease));
    }
  }
  return std::optional<anomaly>{};
}

// -- z_score ------------------------------------------------------------------

auto z_score::make(z_score_options options) -> caf::expected<z_score> {
  if (not(std::isfinite(options.threshold) and options.threshold > 0.0)) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("z-score threshold must be finite and "
                                       "positive, got {}",
                                       options.threshold));
  }
  if (options.min_history < 2) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("z-score needs a minimum history of at "
                                       "least 2, got {}",
                                       options.min_history));
  }
  return z_score{options};
}

auto z_score::detect(std::string_view metric,
                     std::span<const metric_point> history,
                     double current) const
  -> caf::expected<std::optional<anomaly>> {
  if (auto err = check_current(current)) {
    return err;
  }
  if (auto err = check_history(history, options_.min_history)) {
    return err;
  }
  auto mean = mean_of(history);
  auto squares = 0.0;
  for (const auto& point : history) {
    squares += (point.value - mean) * (point.value - mean);
  }
  auto stddev = std::sqrt(squares / static_cast<double>(history.size()));
  if (stddev == 0.0) {
    return insufficient_history("the history has no variance");
  }
  auto z = (current - mean) / stddev;
  auto ratio = std::abs(z) / options_.threshold;
  TALLY_TRACE("{}: z-score {} over {} values", metric, z, history.size());
  if (ratio <= 1.0) {
    return std::optional<anomaly>{};
  }
  return flag(metric, current, mean - options_.threshold * stddev,
              mean + options_.threshold * stddev, ratio, name(),
              fmt::format("value is {:.2f} standard deviations off the "
                          "mean {}",
                          z, mean));
}

// -- custom_strategy ----------------------------------------------------------

auto custom_strategy::detect(std::string_view metric,
                             std::span<const metric_point> history,
                             double current) const
  -> caf::expected<std::optional<anomaly>> {
  auto result = function_(metric, history, current);
  if (result and *result and (*result)->strategy.empty()) {
    (*result)->strategy = name_;
  }
  return result;
}

} // namespace tally
