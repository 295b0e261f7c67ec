//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#ifdef SUITE
#  define CAF_SUITE SUITE
#endif

#include <caf/detail/stringification_inspector.hpp>
#include <caf/expected.hpp>
#include <caf/inspector_access.hpp>
#include <caf/test/test.hpp>
#include <fmt/format.h>

#include <cmath>
#include <optional>
#include <set>
#include <string>

namespace tally::test::detail {

template <class T>
auto stringify(const T& value) {
  if constexpr (std::is_same_v<T, std::nullptr_t>) {
    return std::string{"null"};
  } else if constexpr (std::is_convertible_v<T, std::string>) {
    return std::string{value};
  } else {
    return caf::deep_to_string(value);
  }
}

template <class T0, class T1>
bool check_eq(const T0& lhs, const T1& rhs,
              caf::detail::source_location location
              = caf::detail::source_location::current()) {
  if (lhs == rhs) {
    caf::test::reporter::instance().pass(location);
    return true;
  }
  caf::test::reporter::instance().fail(
    caf::test::binary_predicate::eq, stringify(lhs), stringify(rhs), location);
  return false;
}

} // namespace tally::test::detail

// -- logging macros -----------------------------------------------------------

#define MESSAGE(...) fmt::println(__VA_ARGS__)

// -- macros for checking results ----------------------------------------------
// Checks that abort the current test on failure
#define REQUIRE(x)                                                             \
  ::caf::test::runnable::current().require(static_cast<bool>(x))
#define REQUIRE_EQUAL(x, y)                                                    \
  ::caf::test::runnable::current().require_eq((x), (y))
#define REQUIRE_NOT_EQUAL(x, y)                                                \
  ::caf::test::runnable::current().require_ne((x), (y))
#define REQUIRE_NOERROR(x)                                                     \
  do {                                                                         \
    if (not(x)) {                                                              \
      ::caf::test::runnable::current().fail("Unexpected error {} in: {}",      \
                                            (x).error(), __FILE__);            \
    }                                                                          \
  } while (false)
#define REQUIRE_SUCCESS(x) REQUIRE_EQUAL((x), caf::none)
#define REQUIRE_FAILURE(x) REQUIRE_NOT_EQUAL((x), caf::none)
#define FAIL ::caf::test::runnable::current().fail
// Checks that continue with the current test on failure
#define CHECK(x) ::caf::test::runnable::current().check(static_cast<bool>(x))
#define CHECK_EQUAL(x, y) ::tally::test::detail::check_eq((x), (y))
#define CHECK_NOT_EQUAL(x, y)                                                  \
  ::caf::test::runnable::current().check_ne((x), (y))
#define CHECK_LESS(x, y) ::caf::test::runnable::current().check_lt((x), (y))
#define CHECK_LESS_EQUAL(x, y)                                                 \
  ::caf::test::runnable::current().check_le((x), (y))
#define CHECK_GREATER(x, y) ::caf::test::runnable::current().check_gt((x), (y))
#define CHECK_GREATER_EQUAL(x, y)                                              \
  ::caf::test::runnable::current().check_ge((x), (y))
#define CHECK_ERROR(x) CHECK_EQUAL(not(x), true)
#define CHECK_SUCCESS(x) CHECK_EQUAL((x), caf::none)
#define CHECK_FAILURE(x) CHECK_NOT_EQUAL((x), caf::none)

// Checks that two floating-point values differ by at most `eps`.
#define CHECK_CLOSE(x, y, eps) CHECK(std::abs((x) - (y)) <= (eps))

// -- global state -------------------------------------------------------------

namespace tally::test {

template <class T>
T unbox(std::optional<T> x) {
  if (not x) {
    FAIL("x == none");
  }
  return std::move(*x);
}

template <class T>
T unbox(caf::expected<T> x) {
  if (not x) {
    FAIL("expected<T> contains an error: {}", x.error());
  }
  return std::move(*x);
}

template <class T>
T unbox(T* x) {
  if (not x) {
    FAIL("T* contains nullptr");
  }
  return std::move(*x);
}

// Holds global configuration options passed on the command line after the
// special -- delimiter.
extern std::set<std::string> config;

} // namespace tally::test

namespace tally {

using test::unbox;

} // namespace tally
