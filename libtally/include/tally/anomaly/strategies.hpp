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

#include <caf/expected.hpp>

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tally {

/// Decides whether the current value of a metric deviates from its history.
class detection_strategy {
public:
  virtual ~detection_strategy() noexcept = default;

  virtual auto name() const -> std::string_view = 0;

  /// Checks a value against the history of its metric.
  /// @param history The historical values, ordered by time.
  /// @returns An anomaly, `std::nullopt` if the value is expected, or
  /// `ec::insufficient_history` if the strategy abstains.
  virtual auto detect(std::string_view metric,
                      std::span<const metric_point> history,
                      double current) const
    -> caf::expected<std::optional<anomaly>>
    = 0;
};

/// How a strategy derives the expected value from history.
struct baseline {
  enum class method : uint8_t {
    /// The most recent value.
    last,
    /// The mean of all values.
    mean,
    /// The mean of the most recent `points` values.
    window,
    /// The value `points` steps before the current one.
    seasonal,
  };

  method kind = method::last;
  size_t points = 0;

  static auto last() -> baseline {
    return {};
  }

  static auto mean() -> baseline {
    return {method::mean, 0};
  }

  static auto window(size_t points) -> baseline {
    return {method::window, points};
  }

  static auto seasonal(size_t period) -> baseline {
    return {method::seasonal, period};
  }

  /// Computes the baseline value.
  /// @returns `ec::insufficient_history` if the history is too short.
  auto compute(std::span<const metric_point> history) const
    -> caf::expected<double>;
};

struct rate_of_change_options {
  /// The largest allowed relative increase; no limit if absent.
  std::optional<double> max_increase;
  /// The largest allowed relative decrease; no limit if absent.
  std::optional<double> max_decrease;
  tally::baseline baseline = tally::baseline::last();
  size_t min_history = 1;
};

/// Flags values whose relative change to the baseline exceeds a threshold.
class relative_rate_of_change final : public detection_strategy {
public:
  /// @returns `ec::invalid_argument` unless at least one threshold is set and
  /// all set thresholds are finite and positive.
  static auto make(rate_of_change_options options)
    -> caf::expected<relative_rate_of_change>;

  auto name() const -> std::string_view override {
    return "relative_rate_of_change";
  }

  auto detect(std::string_view metric, std::span<const metric_point> history,
              double current) const
    -> caf::expected<std::optional<anomaly>> override;

private:
  explicit relative_rate_of_change(rate_of_change_options options)
    : options_{options} {
    // nop
  }

  rate_of_change_options options_;
};

struct absolute_change_options {
  std::optional<double> max_increase;
  std::optional<double> max_decrease;
  tally::baseline baseline = tally::baseline::last();
  size_t min_history = 1;
};

/// Flags values whose absolute difference to the baseline exceeds a
/// threshold.
class absolute_change final : public detection_strategy {
public:
  static auto make(absolute_change_options options)
    -> caf::expected<absolute_change>;

  auto name() const -> std::string_view override {
    return "absolute_change";
  }

  auto detect(std::string_view metric, std::span<const metric_point> history,
              double current) const
    -> caf::expected<std::optional<anomaly>> override;

private:
  explicit absolute_change(absolute_change_options options)
    : options_{options} {
    // nop
  }

  absolute_change_options options_;
};

struct z_score_options {
  /// The number of standard deviations a value may be off the mean.
  double threshold = defaults::anomaly::z_score_threshold;
  size_t min_history = defaults::anomaly::z_score_min_history;
};

/// Flags values that lie more than a number of standard deviations off the
/// historical mean.
class z_score final : public detection_strategy {
public:
  static auto make(z_score_options options) -> caf::expected<z_score>;

  auto name() const -> std::string_view override {
    return "z_score";
  }

  auto detect(std::string_view metric, std::span<const metric_point> history,
              double current) const
    -> caf::expected<std::optional<anomaly>> override;

private:
  explicit z_score(z_score_options options) : options_{options} {
    // nop
  }

  z_score_options options_;
};

/// Delegates detection to a user-provided function.
class custom_strategy final : public detection_strategy {
public:
  using function_type = std::function<caf::expected<std::optional<anomaly>>(
    std::string_view, std::span<const metric_point>, double)>;

  custom_strategy(std::string name, function_type function)
    : name_{std::move(name)}, function_{std::move(function)} {
    // nop
  }

  auto name() const -> std::string_view override {
    return name_;
  }

  auto detect(std::string_view metric, std::span<const metric_point> history,
              double current) const
    -> caf::expected<std::optional<anomaly>> override;

private:
  std::string name_;
  function_type function_;
};

} // namespace tally
