//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/arrow_query_engine.hpp"
#include "tally/arrow_utils.hpp"

#include <arrow/array/builder_binary.h>
#include <arrow/array/builder_primitive.h>
#include <arrow/table.h>
#include <arrow/type.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tally::test {

using column = std::pair<std::string, std::shared_ptr<arrow::Array>>;

template <class Builder, class T>
auto make_array(const std::vector<std::optional<T>>& xs)
  -> std::shared_ptr<arrow::Array> {
  auto builder = Builder{};
  for (const auto& x : xs) {
    if (x) {
      check(builder.Append(*x));
    } else {
      check(builder.AppendNull());
    }
  }
  return check(builder.Finish());
}

inline auto int64_array(const std::vector<std::optional<int64_t>>& xs)
  -> std::shared_ptr<arrow::Array> {
  return make_array<arrow::Int64Builder>(xs);
}

inline auto uint64_array(const std::vector<std::optional<uint64_t>>& xs)
  -> std::shared_ptr<arrow::Array> {
  return make_array<arrow::UInt64Builder>(xs);
}

inline auto double_array(const std::vector<std::optional<double>>& xs)
  -> std::shared_ptr<arrow::Array> {
  return make_array<arrow::DoubleBuilder>(xs);
}

inline auto string_array(const std::vector<std::optional<std::string>>& xs)
  -> std::shared_ptr<arrow::Array> {
  return make_array<arrow::StringBuilder>(xs);
}

/// Builds a table from named columns of equal length.
inline auto make_table(std::vector<column> columns)
  -> std::shared_ptr<arrow::Table> {
  auto fields = arrow::FieldVector{};
  auto arrays = std::vector<std::shared_ptr<arrow::Array>>{};
  for (auto& [name, array] : columns) {
    fields.push_back(arrow::field(name, array->type()));
    arrays.push_back(std::move(array));
  }
  return arrow::Table::Make(arrow::schema(std::move(fields)),
                            std::move(arrays));
}

} // namespace tally::test
