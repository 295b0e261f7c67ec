//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/analyzer_context.hpp"

#include "tally/detail/assert.hpp"

namespace tally {

auto to_string(run_status x) -> std::string_view {
  switch (x) {
    case run_status::completed:
      return "completed";
    case run_status::completed_with_errors:
      return "completed_with_errors";
    case run_status::cancelled:
      return "cancelled";
  }
  TALLY_UNREACHABLE();
}

auto analyzer_context::status() const -> run_status {
  if (not cancelled_.empty()) {
    return run_status::cancelled;
  }
  if (not errors_.empty()) {
    return run_status::completed_with_errors;
  }
  return run_status::completed;
}

auto analyzer_context::metric(std::string_view key) const
  -> const metric_value* {
  auto it = metrics_.find(key);
  if (it == metrics_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto analyzer_context::metrics_with_prefix(std::string_view prefix) const
  -> std::vector<std::pair<std::string, metric_value>> {
  auto result = std::vector<std::pair<std::string, metric_value>>{};
  for (auto it = metrics_.lower_bound(prefix);
       it != metrics_.end() and it->first.starts_with(prefix); ++it) {
    result.emplace_back(it->first, it->second);
  }
  return result;
}

auto analyzer_context::summary() const -> run_summary {
  auto result = run_summary{};
  result.succeeded = metrics_.size();
  result.failed = errors_.size();
  result.cancelled = cancelled_.size();
  result.total = result.succeeded + result.failed + result.cancelled;
  return result;
}

void analyzer_context::add_metric(std::string key, metric_value value) {
  auto [_, inserted] = metrics_.emplace(std::move(key), std::move(value));
  TALLY_ASSERT(inserted, "metric keys must be unique");
}

void analyzer_context::add_error(analyzer_error error) {
  errors_.push_back(std::move(error));
}

void analyzer_context::add_cancelled(std::string key) {
  cancelled_.push_back(std::move(key));
}

} // namespace tally
