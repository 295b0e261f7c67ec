//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <source_location>
#include <string>
#include <string_view>

namespace tally::detail {

[[noreturn]] void panic_impl(std::string message, std::source_location source);

[[noreturn]] void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source);

} // namespace tally::detail

/// Checks an invariant and panics if it does not hold. An optional second
/// argument provides an explanation.
#define TALLY_ASSERT(expr, ...)                                                \
  do {                                                                         \
    if (not static_cast<bool>(expr)) [[unlikely]] {                            \
      ::tally::detail::fail_assertion_impl(#expr,                              \
                                           std::string_view{__VA_ARGS__},      \
                                           std::source_location::current());   \
    }                                                                          \
  } while (false)

#define TALLY_UNREACHABLE()                                                    \
  ::tally::detail::panic_impl("unreachable", std::source_location::current())
