//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/pattern.hpp"

#include "tally/error.hpp"
#include "tally/test/test.hpp"

using namespace tally;

TEST("pattern matching") {
  auto digits = unbox(pattern::make(R"(\d+)"));
  CHECK(digits.match("12345"));
  CHECK(not digits.match("123a"));
  CHECK(digits.search("abc 123 def"));
  CHECK(not digits.search("no digits here"));
  CHECK_EQUAL(digits.string(), R"(\d+)");
}

TEST("case-insensitive pattern") {
  auto yes = unbox(pattern::make("yes", pattern_options{.case_insensitive
                                                        = true}));
  CHECK(yes.match("YES"));
  CHECK(yes.match("Yes"));
  CHECK(yes.options().case_insensitive);
  auto strict = unbox(pattern::make("yes"));
  CHECK(not strict.match("YES"));
}

TEST("invalid pattern") {
  auto result = pattern::make("(unbalanced");
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::format_error);
}

TEST("default-constructed pattern matches nothing") {
  auto none = pattern{};
  CHECK(not none.match(""));
  CHECK(not none.search("anything"));
}
