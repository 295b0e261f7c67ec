//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/arrow_utils.hpp"
#include "tally/pattern.hpp"
#include "tally/profiler/column_profile.hpp"

#include <caf/expected.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tally {

struct inferred_type {
  semantic_type type = semantic_type::unknown;
  /// The share of sampled values that support the type.
  double confidence = 0.0;

  friend auto operator==(const inferred_type&, const inferred_type&) -> bool
    = default;
};

/// Infers the semantic type of textual values by majority vote.
class type_inference {
public:
  static auto make() -> caf::expected<type_inference>;

  /// Classifies a single value as integer, decimal, boolean, date or string.
  auto classify(std::string_view value) const -> semantic_type;

  /// Votes over a sample. A type wins if its share reaches *threshold*.
  /// Integers also count as decimals if neither wins alone. Without a winner,
  /// the type is `mixed`; for an empty sample it is `unknown`.
  auto infer(std::span<const std::string> sample, double threshold) const
    -> inferred_type;

private:
  pattern integer_;
  pattern decimal_;
  pattern boolean_;
  std::vector<pattern> dates_;
};

/// Returns the semantic type of a non-string Arrow column.
auto semantic_type_of(column_kind kind) -> semantic_type;

} // namespace tally
