//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/analyzer.hpp"
#include "tally/defaults.hpp"
#include "tally/sketch/hyperloglog.hpp"
#include "tally/sketch/kll.hpp"
#include "tally/states.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tally {

/// Counts the rows of a table.
class size_analyzer {
public:
  using state_type = size_state;

  static auto name() -> std::string_view {
    return "size";
  }

  auto columns() const -> std::vector<std::string> {
    return {};
  }

  auto metric_key() const -> std::string {
    return std::string{name()};
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;
};

/// The common base of analyzers over a single column.
class column_analyzer {
public:
  explicit column_analyzer(std::string column) : column_{std::move(column)} {
    // nop
  }

  auto column() const -> const std::string& {
    return column_;
  }

  auto columns() const -> std::vector<std::string> {
    return {column_};
  }

protected:
  std::string column_;
};

/// The fraction of non-null values of a column.
class completeness_analyzer : public column_analyzer {
public:
  using state_type = completeness_state;
  using column_analyzer::column_analyzer;

  static auto name() -> std::string_view {
    return "completeness";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;
};

class sum_analyzer : public column_analyzer {
public:
  using state_type = sum_state;
  using column_analyzer::column_analyzer;

  static auto name() -> std::string_view {
    return "sum";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;
};

class mean_analyzer : public column_analyzer {
public:
  using state_type = mean_state;
  using column_analyzer::column_analyzer;

  static auto name() -> std::string_view {
    return "mean";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;
};

class minimum_analyzer : public column_analyzer {
public:
  using state_type = min_max_state;
  using column_analyzer::column_analyzer;

  static auto name() -> std::string_view {
    return "minimum";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;
};

class maximum_analyzer : public column_analyzer {
public:
  using state_type = min_max_state;
  using column_analyzer::column_analyzer;

  static auto name() -> std::string_view {
    return "maximum";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;
};

/// The population standard deviation of a numeric column.
class standard_deviation_analyzer : public column_analyzer {
public:
  using state_type = stddev_state;
  using column_analyzer::column_analyzer;

  static auto name() -> std::string_view {
    return "standard_deviation";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;
};

/// The exact number of distinct non-null values.
class count_distinct_analyzer : public column_analyzer {
public:
  using state_type = distinct_state;

  explicit count_distinct_analyzer(std::string column,
                                   uint64_t seed = defaults::sketch::seed)
    : column_analyzer{std::move(column)}, seed_{seed} {
    // nop
  }

  static auto name() -> std::string_view {
    return "count_distinct";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;

private:
  uint64_t seed_;
};

/// The ratio of distinct values to non-null values.
class distinctness_analyzer : public column_analyzer {
public:
  using state_type = distinct_state;

  explicit distinctness_analyzer(std::string column,
                                 uint64_t seed = defaults::sketch::seed)
    : column_analyzer{std::move(column)}, seed_{seed} {
    // nop
  }

  static auto name() -> std::string_view {
    return "distinctness";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;

private:
  uint64_t seed_;
};

/// The estimated number of distinct non-null values.
class approx_count_distinct_analyzer : public column_analyzer {
public:
  using state_type = hyperloglog;

  explicit approx_count_distinct_analyzer(
    std::string column, uint8_t precision = defaults::sketch::hll_precision,
    uint64_t seed = defaults::sketch::seed)
    : column_analyzer{std::move(column)}, precision_{precision}, seed_{seed} {
    // nop
  }

  static auto name() -> std::string_view {
    return "approx_count_distinct";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;

private:
  uint8_t precision_;
  uint64_t seed_;
};

/// Approximate quantiles of a numeric column. The metric is a distribution
/// with one entry per requested quantile, named after the quantile, e.g.,
/// `0.5` for the median.
class approx_quantile_analyzer : public column_analyzer {
public:
  using state_type = kll_sketch;

  approx_quantile_analyzer(std::string column, std::vector<double> quantiles,
                           uint32_t k = defaults::sketch::kll_k,
                           uint64_t seed = defaults::sketch::seed)
    : column_analyzer{std::move(column)},
      quantiles_{std::move(quantiles)},
      k_{k},
      seed_{seed} {
    // nop
  }

  static auto name() -> std::string_view {
    return "approx_quantile";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto quantiles() const -> const std::vector<double>& {
    return quantiles_;
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;

private:
  std::vector<double> quantiles_;
  uint32_t k_;
  uint64_t seed_;
};

/// The dispersion of the values of a column. The metric is a distribution
/// with the entries `entropy` in bits, `normalized_entropy`, `gini_impurity`,
/// `effective_values`, which is `2^entropy`, and `unique_values`, the number
/// of values that occur exactly once.
class entropy_analyzer : public column_analyzer {
public:
  using state_type = frequency_state;
  using column_analyzer::column_analyzer;

  static auto name() -> std::string_view {
    return "entropy";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;
};

/// Counts the values of a numeric column in equal-width buckets.
class histogram_analyzer : public column_analyzer {
public:
  using state_type = histogram_state;

  histogram_analyzer(std::string column, double lower, double upper,
                     size_t buckets = defaults::analyzers::histogram_buckets)
    : column_analyzer{std::move(column)},
      lower_{lower},
      upper_{upper},
      buckets_{buckets} {
    // nop
  }

  static auto name() -> std::string_view {
    return "histogram";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;

private:
  double lower_;
  double upper_;
  size_t buckets_;
};

/// Counts the values of a column by type. Strings are classified by their
/// content, so a string column of numbers counts as integer or decimal.
class data_type_analyzer : public column_analyzer {
public:
  using state_type = data_type_state;
  using column_analyzer::column_analyzer;

  static auto name() -> std::string_view {
    return "data_type";
  }

  auto metric_key() const -> std::string {
    return make_metric_key(name(), column_);
  }

  auto compute_state(const execution_context& ctx) const
    -> caf::expected<state_type>;

  auto compute_metric(const state_type& state) const
    -> caf::expected<metric_value>;
};

} // namespace tally
