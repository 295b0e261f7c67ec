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
#include "tally/analyzer_context.hpp"
#include "tally/defaults.hpp"
#include "tally/detail/inspection_common.hpp"
#include "tally/incremental/state_store.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace tally {

/// What to do with a partition that was already merged into the series.
enum class duplicate_policy : uint8_t {
  /// Fail with `ec::already_processed`.
  reject,
  /// Leave the series unchanged and report the partition as skipped.
  skip,
};

/// @relates duplicate_policy
auto to_string(duplicate_policy x) -> std::string_view;

/// @relates duplicate_policy
auto parse_duplicate_policy(std::string_view str)
  -> std::optional<duplicate_policy>;

template <class Inspector>
auto inspect(Inspector& f, duplicate_policy& x) {
  return detail::inspect_enum(f, x);
}

struct incremental_options {
  duplicate_policy on_duplicate = duplicate_policy::reject;
  /// Additionally keep the fresh states of every partition under
  /// `"{series}/{partition}"`.
  bool record_deltas = defaults::incremental::record_deltas;
  /// Upper bound for the worker threads of `process_partitions`.
  size_t max_concurrency = defaults::incremental::max_concurrency;
  /// Abort a partition without saving as soon as one analyzer fails.
  bool fail_fast = defaults::incremental::fail_fast;
};

/// The outcome of merging one partition into a series.
struct partition_report {
  std::string partition;
  /// The partition was processed before and left untouched.
  bool skipped = false;
  /// Metric keys whose columns do not exist in the partition.
  std::vector<std::string> gaps;
  /// Metric keys that first appeared after other partitions were processed.
  std::vector<std::string> partial_history;
  /// Analyzers that failed to compute or merge their state.
  std::vector<analyzer_error> errors;
};

/// A partition of a series and the table that holds its data.
struct partition_input {
  std::string partition;
  std::string table;
};

/// Metrics finalized from merged states.
struct cumulative_metrics {
  metric_map metrics;
  /// Analyzers whose state could not be finalized.
  std::vector<analyzer_error> errors;
  /// Metric keys whose state covers fewer partitions than requested.
  std::vector<std::string> partial_history;
  /// The number of partitions the metrics cover.
  uint64_t partitions = 0;

  auto metric(std::string_view key) const -> const metric_value* {
    auto it = metrics.find(key);
    return it == metrics.end() ? nullptr : &it->second;
  }
};

/// Maintains cumulative analyzer states of a series in a state store, so that
/// metrics over all processed partitions are available without rescanning
/// data.
class incremental_runner {
public:
  /// The reserved key of the entry that holds the processed partitions.
  static constexpr auto processed_key = std::string_view{"@processed"};

  /// The kind of the entry that holds the processed partitions.
  static constexpr auto partition_set_kind = std::string_view{"partition_set"};

  incremental_runner(std::shared_ptr<state_store> store, std::string series,
                     incremental_options options = {});

  /// Adds an analyzer.
  /// @returns `ec::duplicate_metric_key` if another analyzer produces the
  /// same metric key.
  template <analyzer Analyzer>
  auto add(Analyzer x) -> caf::error {
    return add(erase(std::move(x)));
  }

  auto add(erased_analyzer x) -> caf::error;

  auto series() const -> const std::string& {
    return series_;
  }

  auto options() const -> const incremental_options& {
    return options_;
  }

  /// Computes the states of one partition and merges them into the series.
  /// @returns `ec::already_processed` for a rejected duplicate,
  /// `ec::store_error` if persisting failed, the first analyzer error with
  /// `fail_fast`, or the error of reading the partition schema.
  auto process_partition(const execution_context& ctx,
                         const std::string& partition)
    -> caf::expected<partition_report>;

  /// Computes the states of many partitions concurrently and merges them into
  /// the series with a single save. Nothing is saved if any partition fails
  /// as a whole.
  auto process_partitions(const query_engine& engine,
                          std::span<const partition_input> inputs,
                          std::stop_token stop = {})
    -> caf::expected<std::vector<partition_report>>;

  /// Finalizes the cumulative states of all registered analyzers.
  auto metrics() const -> caf::expected<cumulative_metrics>;

  /// Finalizes the merged deltas of the given partitions.
  /// @pre The partitions were processed with `record_deltas`.
  auto metrics_for(std::span<const std::string> partitions) const
    -> caf::expected<cumulative_metrics>;

  /// Lists the processed partitions in processing order.
  auto processed_partitions() const -> caf::expected<std::vector<std::string>>;

  /// Deletes the delta records of all but the *keep_last* most recently
  /// processed partitions.
  /// @returns The deleted store keys.
  auto prune_deltas(size_t keep_last) -> caf::expected<std::vector<std::string>>;

  /// Deletes the series and all of its delta records.
  auto reset() -> caf::error;

  /// Returns the store key of the delta record of a partition.
  auto delta_key(std::string_view partition) const -> std::string {
    return fmt::format("{}/{}", series_, partition);
  }

private:
  /// Fresh states of one partition by metric key.
  using fresh_states = std::map<std::string, any_state>;

  /// Computes the states of all analyzers whose columns exist.
  auto compute(const execution_context& ctx, partition_report& report) const
    -> caf::expected<fresh_states>;

  /// Loads the cumulative state map. A missing series is empty.
  auto load() const -> caf::expected<state_map>;

  std::shared_ptr<state_store> store_;
  std::string series_;
  incremental_options options_;
  std::vector<erased_analyzer> analyzers_;
};

} // namespace tally

template <>
struct fmt::formatter<tally::duplicate_policy>
  : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(tally::duplicate_policy x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(tally::to_string(x), ctx);
  }
};
