//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/defaults.hpp"

#include <arrow/chunked_array.h>
#include <arrow/type.h>
#include <caf/expected.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tally {

/// A combined aggregation over one column.
struct aggregate_request {
  std::string column;
  bool count_distinct = false;
  bool min_max = false;
  bool sum = false;
  /// The seed for hashing values when counting distinct values.
  uint64_t seed = defaults::sketch::seed;
};

/// The answer to an `aggregate_request`. Optional fields are set if and only
/// if they were requested and defined for the column.
struct aggregate_result {
  uint64_t row_count = 0;
  uint64_t null_count = 0;
  std::optional<uint64_t> distinct_count;
  std::optional<double> min;
  std::optional<double> max;
  std::optional<double> sum;
};

/// The read-only data source of analyzers and the profiler. Implementations
/// must support concurrent calls.
class query_engine {
public:
  virtual ~query_engine() noexcept = default;

  /// Returns the schema of a table.
  /// @returns `ec::data_access_error` if the table does not exist.
  virtual auto schema(std::string_view table) const
    -> caf::expected<std::shared_ptr<arrow::Schema>>
    = 0;

  /// Returns the number of rows of a table.
  /// @returns `ec::data_access_error` if the table does not exist.
  virtual auto num_rows(std::string_view table) const -> caf::expected<uint64_t>
    = 0;

  /// Reads one column of a table.
  /// @param limit The maximum number of rows to read.
  /// @returns `ec::data_access_error` if the table or column does not exist.
  virtual auto scan(std::string_view table, std::string_view column,
                    std::optional<int64_t> limit = std::nullopt) const
    -> caf::expected<std::shared_ptr<arrow::ChunkedArray>>
    = 0;

  /// Computes several aggregates over one column at once.
  virtual auto aggregate(std::string_view table,
                         const aggregate_request& request) const
    -> caf::expected<aggregate_result>
    = 0;
};

} // namespace tally
