//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/profiler/column_profile.hpp"

#include "tally/detail/assert.hpp"

#include <algorithm>

namespace tally {

auto to_string(semantic_type x) -> std::string_view {
  switch (x) {
    case semantic_type::integer:
      return "integer";
    case semantic_type::decimal:
      return "decimal";
    case semantic_type::boolean:
      return "boolean";
    case semantic_type::string:
      return "string";
    case semantic_type::date:
      return "date";
    case semantic_type::categorical:
      return "categorical";
    case semantic_type::mixed:
      return "mixed";
    case semantic_type::unknown:
      return "unknown";
  }
  TALLY_UNREACHABLE();
}

auto table_profile::find(std::string_view column) const
  -> const column_profile* {
  auto it = std::find_if(columns.begin(), columns.end(), [&](const auto& x) {
    return x.column == column;
  });
  return it == columns.end() ? nullptr : &*it;
}

} // namespace tally
