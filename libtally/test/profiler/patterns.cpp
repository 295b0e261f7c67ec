//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/profiler/patterns.hpp"

#include "tally/profiler/type_inference.hpp"
#include "tally/test/test.hpp"

#include <algorithm>

using namespace tally;

namespace {

auto matches_format(const std::vector<named_pattern>& patterns,
                    std::string_view name, std::string_view value) -> bool {
  auto it = std::find_if(patterns.begin(), patterns.end(), [&](const auto& x) {
    return x.name == name;
  });
  REQUIRE(it != patterns.end());
  return it->regex.match(value);
}

} // namespace

TEST("well-known string formats") {
  auto patterns = unbox(string_patterns());
  CHECK_EQUAL(patterns.size(), 7u);
  CHECK(matches_format(patterns, "email", "jane.doe+tag@example.org"));
  CHECK(not matches_format(patterns, "email", "jane.doe@localhost"));
  CHECK(matches_format(patterns, "url", "https://example.org/path?q=1"));
  CHECK(not matches_format(patterns, "url", "example.org"));
  CHECK(matches_format(patterns, "uuid", "123e4567-e89b-12d3-a456-426614174000"));
  CHECK(matches_format(patterns, "ipv4", "192.168.0.1"));
  CHECK(not matches_format(patterns, "ipv4", "256.1.1.1"));
  CHECK(matches_format(patterns, "phone", "+1 555-123-4567"));
  CHECK(matches_format(patterns, "iso_date", "2024-02-29"));
  CHECK(matches_format(patterns, "us_date", "2/29/2024"));
}

TEST("date normalization") {
  CHECK_EQUAL(unbox(normalize_date("iso_date", "2024-02-29")), "2024-02-29");
  CHECK_EQUAL(unbox(normalize_date("iso_datetime", "2024-02-29 12:00")),
              "2024-02-29T12:00");
  CHECK_EQUAL(unbox(normalize_date("us_date", "2/9/2024")), "2024-02-09");
  CHECK_EQUAL(unbox(normalize_date("eu_date", "9.2.2024")), "2024-02-09");
  CHECK(not normalize_date("unknown", "2024-02-29"));
}

TEST("type inference") {
  auto inference = unbox(type_inference::make());
  CHECK(inference.classify("42") == semantic_type::integer);
  CHECK(inference.classify("-4.2e3") == semantic_type::decimal);
  CHECK(inference.classify("Yes") == semantic_type::boolean);
  CHECK(inference.classify("2024-01-01T10:00:00Z") == semantic_type::date);
  CHECK(inference.classify("hello") == semantic_type::string);
  auto sample = std::vector<std::string>{"1", "2", "3", "x"};
  auto inferred = inference.infer(sample, 0.7);
  CHECK(inferred.type == semantic_type::integer);
  CHECK_EQUAL(inferred.confidence, 0.75);
  auto mixed = std::vector<std::string>{"1", "x", "true", "2024-01-01"};
  CHECK(inference.infer(mixed, 0.7).type == semantic_type::mixed);
  CHECK(inference.infer({}, 0.7) == inferred_type{});
}
