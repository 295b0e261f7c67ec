//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/incremental/incremental_runner.hpp"

#include "tally/error.hpp"
#include "tally/fbs/state.hpp"
#include "tally/flatbuffer.hpp"
#include "tally/logger.hpp"

#include <arrow/type.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <thread>
#include <utility>

namespace tally {

namespace {

/// Merged states by metric key, with the number of partitions they cover.
using merged_states = std::map<std::string, std::pair<any_state, uint64_t>>;

struct merge_outcome {
  std::vector<std::string> partial_history;
  std::vector<analyzer_error> errors;
};

constexpr auto duplicate_policy_names
  = std::array<std::string_view, 2>{"reject", "skip"};

auto contains(const std::vector<std::string>& xs, std::string_view x) -> bool {
  return std::find(xs.begin(), xs.end(), x) != xs.end();
}

auto name_of(std::span<const erased_analyzer> analyzers, std::string_view key)
  -> std::string {
  for (const auto& analyzer : analyzers) {
    if (analyzer.key == key) {
      return analyzer.name;
    }
  }
  return {};
}

auto as_store_error(const caf::error& err, std::string_view series)
  -> caf::error {
  if (err == ec::store_error) {
    return add_context(err, "failed to persist series {}", series);
  }
  return caf::make_error(ec::store_error,
                         fmt::format("failed to persist series {}: {}", series,
                                     err));
}

auto pack_partitions(const std::vector<std::string>& partitions) -> blob {
  auto builder = flatbuffers::FlatBufferBuilder{};
  auto root = fbs::state::CreatePartitionSet(
    builder, builder.CreateVectorOfStrings(partitions));
  builder.Finish(root);
  return release(builder);
}

auto unpack_partitions(const state_map& states)
  -> caf::expected<std::vector<std::string>> {
  auto result = std::vector<std::string>{};
  auto it = states.find(std::string{incremental_runner::processed_key});
  if (it == states.end()) {
    return result;
  }
  if (it->second.kind != incremental_runner::partition_set_kind) {
    return caf::make_error(ec::serialization_error,
                           fmt::format("entry {} has kind {} instead of {}",
                                       incremental_runner::processed_key,
                                       it->second.kind,
                                       incremental_runner::partition_set_kind));
  }
  auto root = verified_root<fbs::state::PartitionSet>(it->second.payload);
  if (not root) {
    return std::move(root.error());
  }
  if (const auto* partitions = (*root)->partitions()) {
    result.reserve(partitions->size());
    for (const auto* partition : *partitions) {
      result.push_back(partition->str());
    }
  }
  return result;
}

auto to_persisted(const any_state& state, uint64_t partitions)
  -> persisted_state {
  return {
    .kind = std::string{to_string(state.kind())},
    .partitions = partitions,
    .payload = state.serialize(),
  };
}

/// Restores the persisted states of the given analyzers.
auto restore(const state_map& states,
             std::span<const erased_analyzer> analyzers,
             std::vector<analyzer_error>& errors) -> merged_states {
  auto result = merged_states{};
  for (const auto& analyzer : analyzers) {
    auto it = states.find(analyzer.key);
    if (it == states.end()) {
      continue;
    }
    auto state = any_state::deserialize(it->second.payload);
    if (not state) {
      errors.push_back({analyzer.name, analyzer.key,
                        add_context(state.error(),
                                    "failed to restore state of {}",
                                    analyzer.key)});
      continue;
    }
    result.emplace(analyzer.key,
                   std::pair{std::move(*state), it->second.partitions});
  }
  return result;
}

/// Merges fresh states into cumulative entries. Entries of other keys stay
/// untouched.
auto merge_into(state_map& cumulative, uint64_t previous,
                const merged_states& fresh,
                std::span<const erased_analyzer> analyzers) -> merge_outcome {
  auto result = merge_outcome{};
  for (const auto& item : fresh) {
    const auto& key = item.first;
    const auto& state = item.second.first;
    auto partitions = item.second.second;
    auto it = cumulative.find(key);
    if (it == cumulative.end()) {
      if (previous > 0) {
        TALLY_VERBOSE("metric {} starts after {} processed partitions", key,
                      previous);
        result.partial_history.push_back(key);
      }
      cumulative.emplace(key, to_persisted(state, partitions));
      continue;
    }
    auto fail = [&](caf::error err) {
      TALLY_WARN("failed to merge state of {}: {}", key, err);
      result.errors.push_back({name_of(analyzers, key), key, std::move(err)});
    };
    if (it->second.kind != to_string(state.kind())) {
      fail(caf::make_error(ec::state_incompatibility,
                           fmt::format("cannot merge a {} state into a "
                                       "persisted {} state",
                                       state.kind(), it->second.kind)));
      continue;
    }
    auto existing = any_state::deserialize(it->second.payload);
    if (not existing) {
      fail(add_context(existing.error(), "failed to restore state of {}", key));
      continue;
    }
    auto merged = existing->merge(state);
    if (not merged) {
      fail(std::move(merged.error()));
      continue;
    }
    it->second = to_persisted(*merged, it->second.partitions + partitions);
  }
  return result;
}

/// Finalizes merged states. Keys that already have an error are left out.
auto finalize(const merged_states& states, uint64_t partitions,
              std::span<const erased_analyzer> analyzers,
              std::vector<analyzer_error> errors) -> cumulative_metrics {
  auto result = cumulative_metrics{
    .errors = std::move(errors),
    .partitions = partitions,
  };
  for (const auto& analyzer : analyzers) {
    auto failed = std::any_of(result.errors.begin(), result.errors.end(),
                              [&](const auto& x) {
                                return x.key == analyzer.key;
                              });
    if (failed) {
      continue;
    }
    auto it = states.find(analyzer.key);
    if (it == states.end()) {
      if (partitions > 0) {
        result.partial_history.push_back(analyzer.key);
      }
      continue;
    }
    if (it->second.second < partitions) {
      result.partial_history.push_back(analyzer.key);
    }
    auto metric = analyzer.compute_metric(it->second.first);
    if (not metric) {
      result.errors.push_back(
        {analyzer.name, analyzer.key, std::move(metric.error())});
      continue;
    }
    result.metrics.emplace(analyzer.key, std::move(*metric));
  }
  return result;
}

} // namespace

auto to_string(duplicate_policy x) -> std::string_view {
  auto index = static_cast<size_t>(x);
  TALLY_ASSERT(index < duplicate_policy_names.size());
  return duplicate_policy_names[index];
}

auto parse_duplicate_policy(std::string_view str)
  -> std::optional<duplicate_policy> {
  for (size_t i = 0; i < duplicate_policy_names.size(); ++i) {
    if (duplicate_policy_names[i] == str) {
      return static_cast<duplicate_policy>(i);
    }
  }
  return std::nullopt;
}

incremental_runner::incremental_runner(std::shared_ptr<state_store> store,
                                       std::string series,
                                       incremental_options options)
  : store_{std::move(store)},
    series_{std::move(series)},
    options_{options} {
  TALLY_ASSERT(store_ != nullptr);
}

auto incremental_runner::add(erased_analyzer x) -> caf::error {
  auto duplicate
    = std::any_of(analyzers_.begin(), analyzers_.end(), [&](const auto& y) {
        return y.key == x.key;
      });
  if (duplicate) {
    return caf::make_error(ec::duplicate_metric_key,
                           fmt::format("analyzer {} produces the metric {} "
                                       "which is already taken in series {}",
                                       x.name, x.key, series_));
  }
  analyzers_.push_back(std::move(x));
  return {};
}

auto incremental_runner::load() const -> caf::expected<state_map> {
  auto states = store_->load_state(series_);
  if (not states) {
    return as_store_error(states.error(), series_);
  }
  if (not *states) {
    return state_map{};
  }
  return std::move(**states);
}

auto incremental_runner::compute(const execution_context& ctx,
                                 partition_report& report) const
  -> caf::expected<fresh_states> {
  auto schema = ctx.engine().schema(ctx.table());
  if (not schema) {
    return add_context(schema.error(), "failed to read partition {}",
                       report.partition);
  }
  auto result = fresh_states{};
  for (const auto& analyzer : analyzers_) {
    if (ctx.cancelled()) {
      return caf::make_error(ec::cancelled,
                             fmt::format("processing of partition {} was "
                                         "cancelled",
                                         report.partition));
    }
    auto missing = std::find_if(analyzer.columns.begin(),
                                analyzer.columns.end(), [&](const auto& x) {
                                  return (*schema)->GetFieldByName(x)
                                         == nullptr;
                                });
    if (missing != analyzer.columns.end()) {
      TALLY_VERBOSE("partition {} has no column {} for metric {}",
                    report.partition, *missing, analyzer.key);
      report.gaps.push_back(analyzer.key);
      continue;
    }
    auto state = analyzer.compute_state(ctx);
    if (not state) {
      if (options_.fail_fast) {
        return add_context(state.error(), "analyzer {} failed on partition {}",
                           analyzer.name, report.partition);
      }
      TALLY_WARN("analyzer {} failed on partition {}: {}", analyzer.name,
                 report.partition, state.error());
      report.errors.push_back(
        {analyzer.name, analyzer.key, std::move(state.error())});
      continue;
    }
    result.emplace(analyzer.key, std::move(*state));
  }
  return result;
}

auto incremental_runner::process_partition(const execution_context& ctx,
                                           const std::string& partition)
  -> caf::expected<partition_report> {
  auto guard = store_->lock(series_);
  auto cumulative = load();
  if (not cumulative) {
    return std::move(cumulative.error());
  }
  auto processed = unpack_partitions(*cumulative);
  if (not processed) {
    return add_context(processed.error(),
                       "failed to read processed partitions of series {}",
                       series_);
  }
  auto report = partition_report{.partition = partition};
  if (contains(*processed, partition)) {
    if (options_.on_duplicate == duplicate_policy::reject) {
      return caf::make_error(ec::already_processed,
                             fmt::format("partition {} of series {} was "
                                         "already processed",
                                         partition, series_));
    }
    TALLY_VERBOSE("skipping processed partition {} of series {}", partition,
                  series_);
    report.skipped = true;
    return report;
  }
  auto fresh = compute(ctx, report);
  if (not fresh) {
    return std::move(fresh.error());
  }
  auto merged = merged_states{};
  for (auto& [key, state] : *fresh) {
    merged.emplace(key, std::pair{std::move(state), uint64_t{1}});
  }
  if (options_.record_deltas) {
    auto delta = state_map{};
    for (const auto& [key, entry] : merged) {
      delta.emplace(key, to_persisted(entry.first, 1));
    }
    if (auto err = store_->save_state(delta_key(partition), delta)) {
      return as_store_error(err, series_);
    }
  }
  auto outcome = merge_into(*cumulative, processed->size(), merged, analyzers_);
  report.partial_history = std::move(outcome.partial_history);
  std::move(outcome.errors.begin(), outcome.errors.end(),
            std::back_inserter(report.errors));
  processed->push_back(partition);
  (*cumulative)[std::string{processed_key}] = persisted_state{
    .kind = std::string{partition_set_kind},
    .partitions = processed->size(),
    .payload = pack_partitions(*processed),
  };
  if (auto err = store_->save_state(series_, *cumulative)) {
    TALLY_ERROR("failed to save series {} after partition {}: {}", series_,
                partition, err);
    return as_store_error(err, series_);
  }
  TALLY_VERBOSE("merged partition {} into series {} ({} gaps, {} errors)",
                partition, series_, report.gaps.size(), report.errors.size());
  return report;
}

auto incremental_runner::process_partitions(
  const query_engine& engine, std::span<const partition_input> inputs,
  std::stop_token stop) -> caf::expected<std::vector<partition_report>> {
  auto guard = store_->lock(series_);
  auto cumulative = load();
  if (not cumulative) {
    return std::move(cumulative.error());
  }
  auto processed = unpack_partitions(*cumulative);
  if (not processed) {
    return add_context(processed.error(),
                       "failed to read processed partitions of series {}",
                       series_);
  }
  auto reports = std::vector<partition_report>{};
  reports.reserve(inputs.size());
  auto pending = std::vector<size_t>{};
  auto seen = *processed;
  for (size_t i = 0; i < inputs.size(); ++i) {
    const auto& partition = inputs[i].partition;
    reports.push_back(partition_report{.partition = partition});
    if (contains(seen, partition)) {
      if (options_.on_duplicate == duplicate_policy::reject) {
        return caf::make_error(ec::already_processed,
                               fmt::format("partition {} of series {} was "
                                           "already processed",
                                           partition, series_));
      }
      reports.back().skipped = true;
      continue;
    }
    seen.push_back(partition);
    pending.push_back(i);
  }
  if (pending.empty()) {
    return reports;
  }
  // Every slot is written by exactly one worker.
  auto results
    = std::vector<std::optional<caf::expected<fresh_states>>>(inputs.size());
  auto next = std::atomic<size_t>{0};
  auto work = [&] {
    for (auto i = next++; i < pending.size(); i = next++) {
      auto index = pending[i];
      auto ctx = execution_context{engine, inputs[index].table, stop};
      results[index] = compute(ctx, reports[index]);
    }
  };
  {
    auto workers = std::vector<std::jthread>{};
    auto concurrency = std::min(std::max(options_.max_concurrency, size_t{1}),
                                pending.size());
    TALLY_VERBOSE("computing {} partitions of series {} with {} workers",
                  pending.size(), series_, concurrency);
    workers.reserve(concurrency);
    for (size_t i = 0; i < concurrency; ++i) {
      workers.emplace_back(work);
    }
  }
  for (auto index : pending) {
    auto& result = *results[index];
    if (not result) {
      return add_context(result.error(), "failed to process partition {}",
                         inputs[index].partition);
    }
  }
  auto merged = merged_states{};
  for (auto index : pending) {
    for (const auto& [key, state] : **results[index]) {
      auto it = merged.find(key);
      if (it == merged.end()) {
        merged.emplace(key, std::pair{state, uint64_t{1}});
        continue;
      }
      auto combined = it->second.first.merge(state);
      if (not combined) {
        reports[index].errors.push_back(
          {name_of(analyzers_, key), key, std::move(combined.error())});
        continue;
      }
      it->second = std::pair{std::move(*combined), it->second.second + 1};
    }
  }
  if (options_.record_deltas) {
    for (auto index : pending) {
      auto delta = state_map{};
      for (const auto& [key, state] : **results[index]) {
        delta.emplace(key, to_persisted(state, 1));
      }
      auto key = delta_key(inputs[index].partition);
      if (auto err = store_->save_state(key, delta)) {
        return as_store_error(err, series_);
      }
    }
  }
  auto outcome = merge_into(*cumulative, processed->size(), merged, analyzers_);
  for (auto index : pending) {
    auto& report = reports[index];
    const auto& fresh = **results[index];
    for (const auto& key : outcome.partial_history) {
      if (fresh.contains(key)) {
        report.partial_history.push_back(key);
      }
    }
    for (const auto& error : outcome.errors) {
      if (fresh.contains(error.key)) {
        report.errors.push_back(error);
      }
    }
    processed->push_back(inputs[index].partition);
  }
  (*cumulative)[std::string{processed_key}] = persisted_state{
    .kind = std::string{partition_set_kind},
    .partitions = processed->size(),
    .payload = pack_partitions(*processed),
  };
  if (auto err = store_->save_state(series_, *cumulative)) {
    TALLY_ERROR("failed to save series {} after {} partitions: {}", series_,
                pending.size(), err);
    return as_store_error(err, series_);
  }
  return reports;
}

auto incremental_runner::metrics() const -> caf::expected<cumulative_metrics> {
  auto guard = store_->lock(series_);
  auto cumulative = load();
  if (not cumulative) {
    return std::move(cumulative.error());
  }
  auto processed = unpack_partitions(*cumulative);
  if (not processed) {
    return std::move(processed.error());
  }
  auto errors = std::vector<analyzer_error>{};
  auto states = restore(*cumulative, analyzers_, errors);
  return finalize(states, processed->size(), analyzers_, std::move(errors));
}

auto incremental_runner::metrics_for(std::span<const std::string> partitions)
  const -> caf::expected<cumulative_metrics> {
  auto guard = store_->lock(series_);
  auto cumulative = load();
  if (not cumulative) {
    return std::move(cumulative.error());
  }
  auto processed = unpack_partitions(*cumulative);
  if (not processed) {
    return std::move(processed.error());
  }
  auto errors = std::vector<analyzer_error>{};
  auto merged = merged_states{};
  for (const auto& partition : partitions) {
    if (not contains(*processed, partition)) {
      return caf::make_error(ec::lookup_error,
                             fmt::format("partition {} of series {} was not "
                                         "processed",
                                         partition, series_));
    }
    auto delta = store_->load_state(delta_key(partition));
    if (not delta) {
      return as_store_error(delta.error(), series_);
    }
    if (not *delta) {
      return caf::make_error(ec::lookup_error,
                             fmt::format("no delta recorded for partition {} "
                                         "of series {}",
                                         partition, series_));
    }
    for (auto& [key, entry] : restore(**delta, analyzers_, errors)) {
      auto it = merged.find(key);
      if (it == merged.end()) {
        merged.emplace(key, std::move(entry));
        continue;
      }
      auto combined = it->second.first.merge(entry.first);
      if (not combined) {
        errors.push_back(
          {name_of(analyzers_, key), key, std::move(combined.error())});
        continue;
      }
      it->second = std::pair{std::move(*combined),
                             it->second.second + entry.second};
    }
  }
  return finalize(merged, partitions.size(), analyzers_, std::move(errors));
}

auto incremental_runner::processed_partitions() const
  -> caf::expected<std::vector<std::string>> {
  auto guard = store_->lock(series_);
  auto cumulative = load();
  if (not cumulative) {
    return std::move(cumulative.error());
  }
  return unpack_partitions(*cumulative);
}

auto incremental_runner::prune_deltas(size_t keep_last)
  -> caf::expected<std::vector<std::string>> {
  auto guard = store_->lock(series_);
  auto cumulative = load();
  if (not cumulative) {
    return std::move(cumulative.error());
  }
  auto processed = unpack_partitions(*cumulative);
  if (not processed) {
    return std::move(processed.error());
  }
  auto keys = store_->list_partitions();
  if (not keys) {
    return as_store_error(keys.error(), series_);
  }
  std::sort(keys->begin(), keys->end());
  auto result = std::vector<std::string>{};
  if (processed->size() <= keep_last) {
    return result;
  }
  auto last = processed->end() - static_cast<std::ptrdiff_t>(keep_last);
  for (auto it = processed->begin(); it != last; ++it) {
    auto key = delta_key(*it);
    if (not std::binary_search(keys->begin(), keys->end(), key)) {
      continue;
    }
    if (auto err = store_->delete_state(key)) {
      return as_store_error(err, series_);
    }
    result.push_back(std::move(key));
  }
  TALLY_VERBOSE("pruned {} deltas of series {}", result.size(), series_);
  return result;
}

auto incremental_runner::reset() -> caf::error {
  auto guard = store_->lock(series_);
  auto keys = store_->list_partitions();
  if (not keys) {
    return as_store_error(keys.error(), series_);
  }
  auto prefix = fmt::format("{}/", series_);
  for (const auto& key : *keys) {
    if (key != series_ and not key.starts_with(prefix)) {
      continue;
    }
    if (auto err = store_->delete_state(key)) {
      return as_store_error(err, series_);
    }
  }
  TALLY_INFO("reset series {}", series_);
  return {};
}

} // namespace tally
