//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tally {

/// Matches any sequence of characters, including the empty one.
struct glob_star {
  friend auto operator==(glob_star, glob_star) -> bool = default;
};

/// Matches exactly one character.
struct glob_question {
  friend auto operator==(glob_question, glob_question) -> bool = default;
};

using glob_part = std::variant<std::string, glob_star, glob_question>;

using glob = std::vector<glob_part>;

using glob_view = std::span<const glob_part>;

/// Parses a pattern over metric names, e.g., `completeness.*` or
/// `mean.price_?`.
auto parse_glob(std::string_view string) -> glob;

auto matches(std::string_view string, glob_view glob) -> bool;

/// Returns whether the pattern contains no wildcard.
auto is_literal(glob_view glob) -> bool;

} // namespace tally
