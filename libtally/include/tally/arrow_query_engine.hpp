//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/query_engine.hpp"

#include <arrow/table.h>

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

namespace tally {

/// A query engine over in-memory Arrow tables.
class arrow_query_engine final : public query_engine {
public:
  /// Registers a table under a name, replacing any previous table.
  void add(std::string name, std::shared_ptr<arrow::Table> table);

  /// Removes a table.
  /// @returns Whether the table existed.
  auto remove(std::string_view name) -> bool;

  auto schema(std::string_view table) const
    -> caf::expected<std::shared_ptr<arrow::Schema>> override;

  auto num_rows(std::string_view table) const
    -> caf::expected<uint64_t> override;

  auto scan(std::string_view table, std::string_view column,
            std::optional<int64_t> limit = std::nullopt) const
    -> caf::expected<std::shared_ptr<arrow::ChunkedArray>> override;

  auto aggregate(std::string_view table,
                 const aggregate_request& request) const
    -> caf::expected<aggregate_result> override;

private:
  auto find(std::string_view table) const
    -> caf::expected<std::shared_ptr<arrow::Table>>;

  mutable std::shared_mutex mutex_;
  std::map<std::string, std::shared_ptr<arrow::Table>, std::less<>> tables_;
};

} // namespace tally
