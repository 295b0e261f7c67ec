//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/arrow_query_engine.hpp"

#include "tally/arrow_utils.hpp"
#include "tally/error.hpp"
#include "tally/logger.hpp"
#include "tally/states.hpp"

#include <fmt/format.h>

#include <mutex>

namespace tally {

void arrow_query_engine::add(std::string name,
                             std::shared_ptr<arrow::Table> table) {
  TALLY_ASSERT(table);
  TALLY_DEBUG("registering table {} with {} rows", name, table->num_rows());
  auto lock = std::unique_lock{mutex_};
  tables_.insert_or_assign(std::move(name), std::move(table));
}

auto arrow_query_engine::remove(std::string_view name) -> bool {
  auto lock = std::unique_lock{mutex_};
  auto it = tables_.find(name);
  if (it == tables_.end()) {
    return false;
  }
  tables_.erase(it);
  return true;
}

auto arrow_query_engine::find(std::string_view table) const
  -> caf::expected<std::shared_ptr<arrow::Table>> {
  auto lock = std::shared_lock{mutex_};
  auto it = tables_.find(table);
  if (it == tables_.end()) {
    return caf::make_error(ec::data_access_error,
                           fmt::format("no such table: {}", table));
  }
  return it->second;
}

auto arrow_query_engine::schema(std::string_view table) const
  -> caf::expected<std::shared_ptr<arrow::Schema>> {
  auto found = find(table);
  if (not found) {
    return std::move(found.error());
  }
  return (*found)->schema();
}

auto arrow_query_engine::num_rows(std::string_view table) const
  -> caf::expected<uint64_t> {
  auto found = find(table);
  if (not found) {
    return std::move(found.error());
  }
  return static_cast<uint64_t>((*found)->num_rows());
}

auto arrow_query_engine::scan(std::string_view table, std::string_view column,
                              std::optional<int64_t> limit) const
  -> caf::expected<std::shared_ptr<arrow::ChunkedArray>> {
  auto found = find(table);
  if (not found) {
    return std::move(found.error());
  }
  auto result = (*found)->GetColumnByName(std::string{column});
  if (not result) {
    return caf::make_error(ec::data_access_error,
                           fmt::format("table {} has no column {}", table,
                                       column));
  }
  if (limit and *limit < result->length()) {
    return result->Slice(0, *limit);
  }
  return result;
}

auto arrow_query_engine::aggregate(std::string_view table,
                                   const aggregate_request& request) const
  -> caf::expected<aggregate_result> {
  auto column = scan(table, request.column);
  if (not column) {
    return std::move(column.error());
  }
  auto kind = classify(*(*column)->type());
  if (not kind) {
    return caf::make_error(ec::data_access_error,
                           fmt::format("column {} of table {} has unsupported "
                                       "type {}",
                                       request.column, table,
                                       (*column)->type()->ToString()));
  }
  auto numeric = *kind != column_kind::string;
  auto result = aggregate_result{};
  auto distinct = distinct_state{request.seed};
  auto extremes = min_max_state{};
  auto total = sum_state{};
  auto err = for_each_cell(**column, [&](const std::optional<cell>& x) {
    ++result.row_count;
    if (not x) {
      ++result.null_count;
      return;
    }
    if (request.count_distinct) {
      distinct.add(*x);
    }
    if (numeric and (request.min_max or request.sum)) {
      auto value = *as_double(*x);
      extremes.add(value);
      total.add(value);
    }
  });
  if (err) {
    return caf::make_error(ec::data_access_error,
                           fmt::format("failed to aggregate column {} of "
                                       "table {}: {}",
                                       request.column, table, err));
  }
  if (request.count_distinct) {
    result.distinct_count = distinct.distinct();
  }
  if (request.min_max and not extremes.is_empty()) {
    result.min = extremes.min;
    result.max = extremes.max;
  }
  if (request.sum and numeric) {
    result.sum = total.sum;
  }
  return result;
}

} // namespace tally
