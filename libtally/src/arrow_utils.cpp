//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/arrow_utils.hpp"

#include "tally/detail/overload.hpp"

#include <arrow/type.h>
#include <fmt/format.h>

#include <limits>

namespace tally {

namespace {

template <class Array, class Convert>
void visit_chunk(const arrow::Array& chunk, Convert convert,
                 const std::function<void(const std::optional<cell>&)>& f) {
  const auto& array = static_cast<const Array&>(chunk);
  for (int64_t i = 0; i < array.length(); ++i) {
    if (array.IsNull(i)) {
      f(std::nullopt);
    } else {
      f(cell{convert(array, i)});
    }
  }
}

constexpr auto to_int64 = [](const auto& array, int64_t i) {
  return static_cast<int64_t>(array.Value(i));
};

// Values beyond the range of int64 become doubles.
constexpr auto to_unsigned = [](const arrow::UInt64Array& array, int64_t i) {
  auto value = array.Value(i);
  if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return cell{static_cast<double>(value)};
  }
  return cell{static_cast<int64_t>(value)};
};

constexpr auto to_floating = [](const auto& array, int64_t i) {
  return static_cast<double>(array.Value(i));
};

constexpr auto to_view = [](const auto& array, int64_t i) {
  auto view = array.GetView(i);
  return std::string_view{view.data(), view.size()};
};

} // namespace

auto to_error(const arrow::Status& status) -> caf::error {
  if (status.ok()) {
    return {};
  }
  return caf::make_error(ec::data_access_error,
                         fmt::format("arrow: {}", status.ToString()));
}

auto classify(const arrow::DataType& type) -> std::optional<column_kind> {
  switch (type.id()) {
    case arrow::Type::INT8:
    case arrow::Type::INT16:
    case arrow::Type::INT32:
    case arrow::Type::INT64:
    case arrow::Type::UINT8:
    case arrow::Type::UINT16:
    case arrow::Type::UINT32:
    case arrow::Type::UINT64:
      return column_kind::integral;
    case arrow::Type::FLOAT:
    case arrow::Type::DOUBLE:
      return column_kind::floating;
    case arrow::Type::BOOL:
      return column_kind::boolean;
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
      return column_kind::string;
    case arrow::Type::DATE32:
    case arrow::Type::DATE64:
    case arrow::Type::TIMESTAMP:
      return column_kind::temporal;
    default:
      return std::nullopt;
  }
}

auto for_each_cell(const arrow::ChunkedArray& column,
                   const std::function<void(const std::optional<cell>&)>& f)
  -> caf::error {
  for (const auto& chunk : column.chunks()) {
    switch (chunk->type_id()) {
      case arrow::Type::INT8:
        visit_chunk<arrow::Int8Array>(*chunk, to_int64, f);
        break;
      case arrow::Type::INT16:
        visit_chunk<arrow::Int16Array>(*chunk, to_int64, f);
        break;
      case arrow::Type::INT32:
        visit_chunk<arrow::Int32Array>(*chunk, to_int64, f);
        break;
      case arrow::Type::INT64:
        visit_chunk<arrow::Int64Array>(*chunk, to_int64, f);
        break;
      case arrow::Type::UINT8:
        visit_chunk<arrow::UInt8Array>(*chunk, to_int64, f);
        break;
      case arrow::Type::UINT16:
        visit_chunk<arrow::UInt16Array>(*chunk, to_int64, f);
        break;
      case arrow::Type::UINT32:
        visit_chunk<arrow::UInt32Array>(*chunk, to_int64, f);
        break;
      case arrow::Type::UINT64:
        visit_chunk<arrow::UInt64Array>(*chunk, to_unsigned, f);
        break;
      case arrow::Type::FLOAT:
        visit_chunk<arrow::FloatArray>(*chunk, to_floating, f);
        break;
      case arrow::Type::DOUBLE:
        visit_chunk<arrow::DoubleArray>(*chunk, to_floating, f);
        break;
      case arrow::Type::BOOL:
        visit_chunk<arrow::BooleanArray>(
          *chunk,
          [](const arrow::BooleanArray& array, int64_t i) {
            return array.Value(i);
          },
          f);
        break;
      case arrow::Type::STRING:
        visit_chunk<arrow::StringArray>(*chunk, to_view, f);
        break;
      case arrow::Type::LARGE_STRING:
        visit_chunk<arrow::LargeStringArray>(*chunk, to_view, f);
        break;
      case arrow::Type::DATE32:
        visit_chunk<arrow::Date32Array>(*chunk, to_int64, f);
        break;
      case arrow::Type::DATE64:
        visit_chunk<arrow::Date64Array>(*chunk, to_int64, f);
        break;
      case arrow::Type::TIMESTAMP:
        visit_chunk<arrow::TimestampArray>(*chunk, to_int64, f);
        break;
      default:
        return caf::make_error(ec::type_clash,
                               fmt::format("unsupported column type {}",
                                           chunk->type()->ToString()));
    }
  }
  return {};
}

auto as_double(const cell& x) -> std::optional<double> {
  return std::visit(detail::overload{
                      [](int64_t y) -> std::optional<double> {
                        return static_cast<double>(y);
                      },
                      [](double y) -> std::optional<double> {
                        return y;
                      },
                      [](bool y) -> std::optional<double> {
                        return y ? 1.0 : 0.0;
                      },
                      [](std::string_view) -> std::optional<double> {
                        return std::nullopt;
                      },
                    },
                    x);
}

auto to_string(const cell& x) -> std::string {
  return std::visit(detail::overload{
                      [](int64_t y) {
                        return fmt::to_string(y);
                      },
                      [](double y) {
                        return fmt::to_string(y);
                      },
                      [](bool y) {
                        return std::string{y ? "true" : "false"};
                      },
                      [](std::string_view y) {
                        return std::string{y};
                      },
                    },
                    x);
}

} // namespace tally
