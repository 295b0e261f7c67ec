//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/glob.hpp"

#include "tally/detail/overload.hpp"

#include <algorithm>

namespace tally {

auto parse_glob(std::string_view string) -> glob {
  auto result = glob{};
  while (true) {
    auto pos = string.find_first_of("*?");
    if (pos != 0 and not string.empty()) {
      result.emplace_back(std::string{string.substr(0, pos)});
    }
    if (pos == std::string_view::npos) {
      return result;
    }
    if (string[pos] == '?') {
      result.emplace_back(glob_question{});
    } else if (result.empty()
               or not std::holds_alternative<glob_star>(result.back())) {
      // Consecutive stars collapse into one.
      result.emplace_back(glob_star{});
    }
    string = string.substr(pos + 1);
  }
}

auto matches(std::string_view string, glob_view glob) -> bool {
  if (glob.empty()) {
    // The empty glob only matches the empty string.
    return string.empty();
  }
  const auto& head = glob[0];
  auto tail = glob.subspan(1);
  return std::visit(detail::overload{
                      [&](const std::string& part) {
                        // The given part must be a prefix.
                        if (not string.starts_with(part)) {
                          return false;
                        }
                        return matches(string.substr(part.size()), tail);
                      },
                      [&](glob_star) {
                        if (matches(string, tail)) {
                          // The star is allowed to consume nothing.
                          return true;
                        }
                        // Make it consume something.
                        if (string.empty()) {
                          return false;
                        }
                        return matches(string.substr(1), glob);
                      },
                      [&](glob_question) {
                        if (string.empty()) {
                          return false;
                        }
                        return matches(string.substr(1), tail);
                      },
                    },
                    head);
}

auto is_literal(glob_view glob) -> bool {
  return std::all_of(glob.begin(), glob.end(), [](const glob_part& part) {
    return std::holds_alternative<std::string>(part);
  });
}

} // namespace tally
