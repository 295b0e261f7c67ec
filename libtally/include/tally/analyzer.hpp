//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/error.hpp"
#include "tally/execution_context.hpp"
#include "tally/metric_value.hpp"
#include "tally/state.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tally {

/// The capability of computing one metric in two phases: a state from data,
/// and a metric from the state.
template <class T>
concept analyzer
  = analyzer_state<typename T::state_type>
    and requires(const T& x, const execution_context& ctx,
                 const typename T::state_type& state) {
          { x.name() } -> std::convertible_to<std::string_view>;
          { x.columns() } -> std::same_as<std::vector<std::string>>;
          { x.metric_key() } -> std::same_as<std::string>;
          {
            x.compute_state(ctx)
          } -> std::same_as<caf::expected<typename T::state_type>>;
          { x.compute_metric(state) } -> std::same_as<caf::expected<metric_value>>;
        };

/// Returns `"{name}.{column}"`, or just the name for table-level analyzers.
inline auto make_metric_key(std::string_view name, std::string_view column)
  -> std::string {
  if (column.empty()) {
    return std::string{name};
  }
  return fmt::format("{}.{}", name, column);
}

/// An analyzer with its state type erased, so that runners can keep
/// heterogeneous analyzers in one container.
struct erased_analyzer {
  std::string name;
  std::string key;
  std::vector<std::string> columns;
  /// Reads data and computes a fresh state.
  std::function<caf::expected<any_state>(const execution_context&)>
    compute_state;
  /// Finalizes a state that was computed by `compute_state`, possibly merged
  /// with other states of the same analyzer.
  std::function<caf::expected<metric_value>(const any_state&)> compute_metric;

  /// Computes the metric directly from data.
  auto run(const execution_context& ctx) const -> caf::expected<metric_value> {
    auto state = compute_state(ctx);
    if (not state) {
      return std::move(state.error());
    }
    return compute_metric(*state);
  }
};

template <analyzer Analyzer>
auto erase(Analyzer x) -> erased_analyzer {
  using state_type = typename Analyzer::state_type;
  auto result = erased_analyzer{};
  result.name = std::string{x.name()};
  result.key = x.metric_key();
  result.columns = x.columns();
  result.compute_state
    = [x](const execution_context& ctx) -> caf::expected<any_state> {
    auto state = x.compute_state(ctx);
    if (not state) {
      return std::move(state.error());
    }
    return any_state{std::move(*state)};
  };
  result.compute_metric
    = [x](const any_state& state) -> caf::expected<metric_value> {
    const auto* concrete = state.as<state_type>();
    if (not concrete) {
      return caf::make_error(ec::type_clash,
                             fmt::format("analyzer {} expects a {} state, got "
                                         "a {} state",
                                         x.name(), state_type::kind,
                                         state.kind()));
    }
    return x.compute_metric(*concrete);
  };
  return result;
}

} // namespace tally
