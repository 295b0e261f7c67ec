//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/analyzers.hpp"

#include "tally/analysis_runner.hpp"
#include "tally/arrow_query_engine.hpp"
#include "tally/error.hpp"
#include "tally/execution_context.hpp"
#include "tally/test/tables.hpp"
#include "tally/test/test.hpp"

#include <cmath>
#include <string>

using namespace tally;
using namespace tally::test;

namespace {

struct fixture {
  fixture() {
    engine.add("events",
               make_table({
                 {"id", int64_array({1, 2, 3, 4, 5, 6})},
                 {"level", string_array({"info", "warn", "info", "error",
                                         std::nullopt, "info"})},
                 {"latency",
                  double_array({0.5, 1.5, 2.0, 9.0, 12.0, std::nullopt})},
                 {"raw", string_array({"12", "7", "3.5", "yes", "hello",
                                       std::nullopt})},
               }));
  }

  auto run(analysis_runner& runner) -> analyzer_context {
    return unbox(runner.run(execution_context{engine, "events"}));
  }

  auto entries(const analyzer_context& result, std::string_view key)
    -> distribution {
    const auto* value = result.metric(key);
    REQUIRE(value != nullptr);
    REQUIRE(value->as_distribution() != nullptr);
    return *value->as_distribution();
  }

  arrow_query_engine engine;
};

} // namespace

WITH_FIXTURE(fixture) {

TEST("entropy of a column") {
  auto runner = analysis_runner{};
  REQUIRE_SUCCESS(runner.add(entropy_analyzer{"level"}));
  REQUIRE_SUCCESS(runner.add(entropy_analyzer{"id"}));
  auto result = run(runner);
  CHECK(result.errors().empty());
  auto level = entries(result, "entropy.level");
  auto entropy = -(0.6 * std::log2(0.6) + 2 * 0.2 * std::log2(0.2));
  CHECK_CLOSE(*level.find("entropy"), entropy, 1e-12);
  CHECK_CLOSE(*level.find("normalized_entropy"), entropy / std::log2(3.0),
              1e-12);
  CHECK_CLOSE(*level.find("gini_impurity"), 1.0 - (0.36 + 0.04 + 0.04),
              1e-12);
  CHECK_CLOSE(*level.find("effective_values"), std::exp2(entropy), 1e-12);
  CHECK_EQUAL(*level.find("unique_values"), 2.0);
  MESSAGE("unique values reach the maximum entropy");
  auto id = entries(result, "entropy.id");
  CHECK_CLOSE(*id.find("entropy"), std::log2(6.0), 1e-12);
  CHECK_CLOSE(*id.find("normalized_entropy"), 1.0, 1e-12);
  CHECK_EQUAL(*id.find("unique_values"), 6.0);
}

TEST("entropy of nothing is undefined") {
  engine.add("empty", make_table({{"level", string_array({std::nullopt})}}));
  auto runner = analysis_runner{};
  REQUIRE_SUCCESS(runner.add(entropy_analyzer{"level"}));
  auto result = unbox(runner.run(execution_context{engine, "empty"}));
  REQUIRE_EQUAL(result.errors().size(), 1u);
  CHECK_EQUAL(result.errors()[0].error, ec::invalid_result);
}

TEST("histogram of a numeric column") {
  auto runner = analysis_runner{};
  REQUIRE_SUCCESS(runner.add(histogram_analyzer{"latency", 0.0, 10.0, 5}));
  auto result = run(runner);
  CHECK(result.errors().empty());
  auto buckets = entries(result, "histogram.latency");
  REQUIRE_EQUAL(buckets.entries.size(), 7u);
  CHECK_EQUAL(*buckets.find("[0, 2)"), 2.0);
  CHECK_EQUAL(*buckets.find("[2, 4)"), 1.0);
  CHECK_EQUAL(*buckets.find("[4, 6)"), 0.0);
  CHECK_EQUAL(*buckets.find("[8, 10]"), 1.0);
  CHECK_EQUAL(*buckets.find("underflow"), 0.0);
  CHECK_EQUAL(*buckets.find("overflow"), 1.0);
}

TEST("histogram misconfigurations") {
  auto runner = analysis_runner{};
  REQUIRE_SUCCESS(runner.add(histogram_analyzer{"latency", 5.0, 1.0}));
  REQUIRE_SUCCESS(runner.add(histogram_analyzer{"level", 0.0, 1.0}));
  auto result = run(runner);
  REQUIRE_EQUAL(result.errors().size(), 2u);
  CHECK_EQUAL(result.errors()[0].error, ec::invalid_argument);
  MESSAGE("strings have no histogram");
  CHECK_EQUAL(result.errors()[1].error, ec::data_access_error);
}

TEST("data types of typed and textual columns") {
  auto runner = analysis_runner{};
  REQUIRE_SUCCESS(runner.add(data_type_analyzer{"id"}));
  REQUIRE_SUCCESS(runner.add(data_type_analyzer{"raw"}));
  auto result = run(runner);
  CHECK(result.errors().empty());
  auto id = entries(result, "data_type.id");
  CHECK_EQUAL(*id.find("integer"), 6.0);
  CHECK_EQUAL(*id.find("string"), 0.0);
  CHECK_EQUAL(*id.find("consistency"), 1.0);
  auto raw = entries(result, "data_type.raw");
  CHECK_EQUAL(*raw.find("integer"), 2.0);
  CHECK_EQUAL(*raw.find("decimal"), 1.0);
  CHECK_EQUAL(*raw.find("boolean"), 1.0);
  CHECK_EQUAL(*raw.find("string"), 1.0);
  CHECK_EQUAL(*raw.find("date"), 0.0);
  CHECK_EQUAL(*raw.find("consistency"), 0.4);
}

} // WITH_FIXTURE(fixture)
