//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/analyzers.hpp"

#include "tally/arrow_utils.hpp"
#include "tally/error.hpp"
#include "tally/logger.hpp"
#include "tally/profiler/type_inference.hpp"

#include <fmt/format.h>

#include <cmath>

namespace tally {

namespace {

auto read_column(const execution_context& ctx, const std::string& column)
  -> caf::expected<std::shared_ptr<arrow::ChunkedArray>> {
  auto result = ctx.engine().scan(ctx.table(), column);
  if (not result) {
    return std::move(result.error());
  }
  TALLY_TRACE("read {} rows of column {} from table {}", (*result)->length(),
              column, ctx.table());
  return result;
}

auto check_numeric(const arrow::ChunkedArray& array, const std::string& column)
  -> caf::error {
  auto kind = classify(*array.type());
  if (not kind or *kind == column_kind::string) {
    return caf::make_error(ec::data_access_error,
                           fmt::format("column {} of type {} is not numeric",
                                       column, array.type()->ToString()));
  }
  return {};
}

/// Calls *f* for every non-null value of a numeric column.
template <class F>
auto for_each_number(const execution_context& ctx, const std::string& column,
                     F f) -> caf::error {
  auto array = read_column(ctx, column);
  if (not array) {
    return std::move(array.error());
  }
  if (auto err = check_numeric(**array, column)) {
    return err;
  }
  return for_each_cell(**array, [&](const std::optional<cell>& x) {
    if (x) {
      f(*as_double(*x));
    }
  });
}

/// Calls *f* for every non-null value of a column.
template <class F>
auto for_each_value(const execution_context& ctx, const std::string& column,
                    F f) -> caf::error {
  auto array = read_column(ctx, column);
  if (not array) {
    return std::move(array.error());
  }
  return for_each_cell(**array, [&](const std::optional<cell>& x) {
    if (x) {
      f(*x);
    }
  });
}

auto undefined(std::string_view name, std::string_view what) -> caf::error {
  return caf::make_error(ec::invalid_result,
                         fmt::format("{} is undefined for {}", name, what));
}

} // namespace

// -- size ---------------------------------------------------------------------

auto size_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  auto rows = ctx.engine().num_rows(ctx.table());
  if (not rows) {
    return std::move(rows.error());
  }
  return size_state{*rows};
}

auto size_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  return state.to_metric();
}

// -- completeness -------------------------------------------------------------

auto completeness_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  auto result
    = ctx.engine().aggregate(ctx.table(), aggregate_request{.column = column_});
  if (not result) {
    return std::move(result.error());
  }
  return completeness_state{result->row_count,
                            result->row_count - result->null_count};
}

auto completeness_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  if (state.is_empty()) {
    return undefined(name(), "an empty column");
  }
  return state.to_metric();
}

// -- sum ----------------------------------------------------------------------

auto sum_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  auto result = ctx.engine().aggregate(
    ctx.table(), aggregate_request{.column = column_, .sum = true});
  if (not result) {
    return std::move(result.error());
  }
  if (not result->sum) {
    return caf::make_error(ec::data_access_error,
                           fmt::format("column {} is not numeric", column_));
  }
  return sum_state{*result->sum, result->row_count - result->null_count};
}

auto sum_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  // The sum of no values is zero.
  return state.to_metric();
}

// -- mean ---------------------------------------------------------------------

auto mean_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  auto result = ctx.engine().aggregate(
    ctx.table(), aggregate_request{.column = column_, .sum = true});
  if (not result) {
    return std::move(result.error());
  }
  if (not result->sum) {
    return caf::make_error(ec::data_access_error,
                           fmt::format("column {} is not numeric", column_));
  }
  return mean_state{*result->sum, result->row_count - result->null_count};
}

auto mean_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  if (state.is_empty()) {
    return undefined(name(), "zero values");
  }
  return state.to_metric();
}

// -- minimum and maximum ------------------------------------------------------

namespace {

auto compute_min_max(const execution_context& ctx, const std::string& column)
  -> caf::expected<min_max_state> {
  auto schema = ctx.engine().schema(ctx.table());
  if (not schema) {
    return std::move(schema.error());
  }
  if (auto field = (*schema)->GetFieldByName(column)) {
    auto kind = classify(*field->type());
    if (not kind or *kind == column_kind::string) {
      return caf::make_error(ec::data_access_error,
                             fmt::format("column {} of type {} is not numeric",
                                         column, field->type()->ToString()));
    }
  }
  auto result = ctx.engine().aggregate(
    ctx.table(), aggregate_request{.column = column, .min_max = true});
  if (not result) {
    return std::move(result.error());
  }
  auto state = min_max_state{};
  if (result->min and result->max) {
    state.count = result->row_count - result->null_count;
    state.min = *result->min;
    state.max = *result->max;
  }
  return state;
}

} // namespace

auto minimum_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  return compute_min_max(ctx, column_);
}

auto minimum_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  if (state.is_empty()) {
    return undefined(name(), "zero values");
  }
  return metric_value{state.min};
}

auto maximum_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  return compute_min_max(ctx, column_);
}

auto maximum_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  if (state.is_empty()) {
    return undefined(name(), "zero values");
  }
  return metric_value{state.max};
}

// -- standard deviation -------------------------------------------------------

auto standard_deviation_analyzer::compute_state(
  const execution_context& ctx) const -> caf::expected<state_type> {
  auto state = stddev_state{};
  auto err = for_each_number(ctx, column_, [&](double x) {
    state.add(x);
  });
  if (err) {
    return err;
  }
  return state;
}

auto standard_deviation_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  if (state.is_empty()) {
    return undefined(name(), "zero values");
  }
  return state.to_metric();
}

// -- distinct values ----------------------------------------------------------

auto count_distinct_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  auto state = distinct_state{seed_};
  auto err = for_each_value(ctx, column_, [&](const cell& x) {
    state.add(x);
  });
  if (err) {
    return err;
  }
  return state;
}

auto count_distinct_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  return state.to_metric();
}

auto distinctness_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  auto state = distinct_state{seed_};
  auto err = for_each_value(ctx, column_, [&](const cell& x) {
    state.add(x);
  });
  if (err) {
    return err;
  }
  return state;
}

auto distinctness_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  if (state.count() == 0) {
    return undefined(name(), "zero values");
  }
  return metric_value{static_cast<double>(state.distinct())
                      / static_cast<double>(state.count())};
}

auto approx_count_distinct_analyzer::compute_state(
  const execution_context& ctx) const -> caf::expected<state_type> {
  auto state = hyperloglog::make(precision_, seed_);
  if (not state) {
    return std::move(state.error());
  }
  auto err = for_each_value(ctx, column_, [&](const cell& x) {
    state->add(x);
  });
  if (err) {
    return err;
  }
  return state;
}

auto approx_count_distinct_analyzer::compute_metric(
  const state_type& state) const -> caf::expected<metric_value> {
  return state.to_metric();
}

// -- quantiles ----------------------------------------------------------------

auto approx_quantile_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  for (auto q : quantiles_) {
    if (not(q >= 0.0 and q <= 1.0)) {
      return caf::make_error(ec::invalid_argument,
                             fmt::format("quantile {} is outside [0, 1]", q));
    }
  }
  auto state = kll_sketch::make(k_, seed_);
  if (not state) {
    return std::move(state.error());
  }
  auto err = for_each_number(ctx, column_, [&](double x) {
    state->add(x);
  });
  if (err) {
    return err;
  }
  return state;
}

auto approx_quantile_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  if (state.is_empty()) {
    return undefined(name(), "zero values");
  }
  auto result = distribution{};
  result.entries.reserve(quantiles_.size());
  for (auto q : quantiles_) {
    result.entries.emplace_back(fmt::format("{}", q), state.quantile(q));
  }
  return metric_value{std::move(result)};
}

// -- entropy ------------------------------------------------------------------

auto entropy_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  auto state = frequency_state{};
  auto err = for_each_value(ctx, column_, [&](const cell& x) {
    state.add(x);
  });
  if (err) {
    return err;
  }
  return state;
}

auto entropy_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  if (state.is_empty()) {
    return undefined(name(), "zero values");
  }
  auto unique = uint64_t{0};
  for (const auto& [_, count] : state.counts()) {
    if (count == 1) {
      ++unique;
    }
  }
  auto entropy = state.entropy();
  return metric_value{distribution{{
    {"entropy", entropy},
    {"normalized_entropy", state.normalized_entropy()},
    {"gini_impurity", state.gini_impurity()},
    {"effective_values", std::exp2(entropy)},
    {"unique_values", static_cast<double>(unique)},
  }}};
}

// -- histogram ----------------------------------------------------------------

auto histogram_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  auto state = histogram_state::make(lower_, upper_, buckets_);
  if (not state) {
    return std::move(state.error());
  }
  auto err = for_each_number(ctx, column_, [&](double x) {
    state->add(x);
  });
  if (err) {
    return err;
  }
  return state;
}

auto histogram_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  if (state.is_empty()) {
    return undefined(name(), "zero values");
  }
  return state.to_metric();
}

// -- data type ----------------------------------------------------------------

auto data_type_analyzer::compute_state(const execution_context& ctx) const
  -> caf::expected<state_type> {
  auto array = read_column(ctx, column_);
  if (not array) {
    return std::move(array.error());
  }
  auto kind = classify(*(*array)->type());
  if (not kind) {
    return caf::make_error(ec::data_access_error,
                           fmt::format("column {} has unsupported type {}",
                                       column_, (*array)->type()->ToString()));
  }
  auto state = data_type_state{};
  if (*kind != column_kind::string) {
    auto type = semantic_type_of(*kind);
    auto values = (*array)->length() - (*array)->null_count();
    state.add(type, static_cast<uint64_t>(values));
    return state;
  }
  auto inference = type_inference::make();
  if (not inference) {
    return std::move(inference.error());
  }
  auto err = for_each_cell(**array, [&](const std::optional<cell>& x) {
    if (x) {
      state.add(inference->classify(std::get<std::string_view>(*x)));
    }
  });
  if (err) {
    return err;
  }
  return state;
}

auto data_type_analyzer::compute_metric(const state_type& state) const
  -> caf::expected<metric_value> {
  if (state.is_empty()) {
    return undefined(name(), "zero values");
  }
  return state.to_metric();
}

} // namespace tally
