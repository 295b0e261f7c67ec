//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/profiler/type_inference.hpp"

#include "tally/detail/assert.hpp"
#include "tally/profiler/patterns.hpp"

#include <array>

namespace tally {

auto type_inference::make() -> caf::expected<type_inference> {
  auto result = type_inference{};
  auto integer = pattern::make(R"([+\-]?\d+)");
  if (not integer) {
    return std::move(integer.error());
  }
  auto decimal = pattern::make(R"([+\-]?(\d+\.\d*|\.\d+|\d+)([eE][+\-]?\d+)?)");
  if (not decimal) {
    return std::move(decimal.error());
  }
  auto boolean = pattern::make("true|false|yes|no",
                               pattern_options{.case_insensitive = true});
  if (not boolean) {
    return std::move(boolean.error());
  }
  auto dates = date_formats();
  if (not dates) {
    return std::move(dates.error());
  }
  result.integer_ = std::move(*integer);
  result.decimal_ = std::move(*decimal);
  result.boolean_ = std::move(*boolean);
  for (auto& format : *dates) {
    result.dates_.push_back(std::move(format.regex));
  }
  return result;
}

auto type_inference::classify(std::string_view value) const -> semantic_type {
  if (boolean_.match(value)) {
    return semantic_type::boolean;
  }
  if (integer_.match(value)) {
    return semantic_type::integer;
  }
  if (decimal_.match(value)) {
    return semantic_type::decimal;
  }
  for (const auto& date : dates_) {
    if (date.match(value)) {
      return semantic_type::date;
    }
  }
  return semantic_type::string;
}

auto type_inference::infer(std::span<const std::string> sample,
                           double threshold) const -> inferred_type {
  if (sample.empty()) {
    return {};
  }
  // Votes indexed by semantic type.
  auto votes = std::array<size_t, 8>{};
  for (const auto& value : sample) {
    ++votes[static_cast<size_t>(classify(value))];
  }
  auto total = static_cast<double>(sample.size());
  auto share = [&](semantic_type x) {
    return static_cast<double>(votes[static_cast<size_t>(x)]) / total;
  };
  auto best = semantic_type::integer;
  for (auto x : {semantic_type::decimal, semantic_type::boolean,
                 semantic_type::string, semantic_type::date}) {
    if (share(x) > share(best)) {
      best = x;
    }
  }
  if (share(best) >= threshold) {
    return {best, share(best)};
  }
  auto numeric = share(semantic_type::integer) + share(semantic_type::decimal);
  if (numeric >= threshold) {
    return {semantic_type::decimal, numeric};
  }
  return {semantic_type::mixed, share(best)};
}

auto semantic_type_of(column_kind kind) -> semantic_type {
  switch (kind) {
    case column_kind::integral:
      return semantic_type::integer;
    case column_kind::floating:
      return semantic_type::decimal;
    case column_kind::boolean:
      return semantic_type::boolean;
    case column_kind::string:
      return semantic_type::string;
    case column_kind::temporal:
      return semantic_type::date;
  }
  TALLY_UNREACHABLE();
}

} // namespace tally
