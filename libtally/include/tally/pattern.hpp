//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include <caf/expected.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace tally {

struct regex_impl;

struct pattern_options {
  bool case_insensitive = false;
};

/// A compiled regular expression.
class pattern {
public:
  pattern() = default;

  /// Compiles a regular expression.
  /// @returns `ec::format_error` if *str* is not a valid expression.
  static auto make(std::string str, pattern_options options = {})
    -> caf::expected<pattern>;

  /// Checks whether the pattern matches all of *str*.
  auto match(std::string_view str) const -> bool;

  /// Checks whether the pattern matches a substring of *str*.
  auto search(std::string_view str) const -> bool;

  auto string() const -> const std::string&;

  auto options() const -> const pattern_options&;

private:
  std::string str_;
  pattern_options options_;
  std::shared_ptr<const regex_impl> regex_;
};

} // namespace tally
