//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/anomaly/metrics_repository.hpp"

#include "tally/error.hpp"
#include "tally/test/test.hpp"

#include <chrono>

using namespace tally;
using namespace std::chrono_literals;

namespace {

auto day(int n) -> time {
  return time{} + std::chrono::days{20'000 + n};
}

auto values(const std::vector<metric_point>& points) -> std::vector<double> {
  auto result = std::vector<double>{};
  for (const auto& point : points) {
    result.push_back(point.value);
  }
  return result;
}

} // namespace

TEST("severity and confidence of deviations") {
  CHECK(severity_of(1.2) == severity::info);
  CHECK(severity_of(2.0) == severity::warning);
  CHECK(severity_of(2.9) == severity::warning);
  CHECK(severity_of(3.0) == severity::critical);
  CHECK_EQUAL(confidence_of(1.0), 0.5);
  CHECK_EQUAL(confidence_of(1.5), 0.75);
  CHECK_EQUAL(confidence_of(4.0), 1.0);
  CHECK_EQUAL(std::string{to_string(severity::critical)}, "critical");
  CHECK(parse_severity("warning") == severity::warning);
  CHECK(not parse_severity("fatal"));
}

TEST("metric history is ordered by time") {
  auto repo = memory_metrics_repository{};
  REQUIRE_SUCCESS(repo.store("size", 3.0, day(3)));
  REQUIRE_SUCCESS(repo.store("size", 1.0, day(1)));
  REQUIRE_SUCCESS(repo.store("size", 2.0, day(2), {{"table", "orders"}}));
  auto history = unbox(repo.history("size", day(0), day(10)));
  CHECK_EQUAL(values(history), (std::vector<double>{1.0, 2.0, 3.0}));
  CHECK_EQUAL(history[1].tags.at("table"), "orders");
  CHECK(history[1].timestamp == day(2));
  MESSAGE("ranges include their start and exclude their end");
  CHECK_EQUAL(values(unbox(repo.history("size", day(1), day(3)))),
              (std::vector<double>{1.0, 2.0}));
  CHECK(unbox(repo.history("size", day(4), day(10))).empty());
  CHECK(unbox(repo.history("unknown", day(0), day(10))).empty());
  CHECK_EQUAL(repo.size(), 1u);
}

TEST("metric history keeps the newest points") {
  auto repo = memory_metrics_repository{
    repository_limits{.max_points_per_metric = 3}};
  for (auto i = 0; i < 5; ++i) {
    REQUIRE_SUCCESS(repo.store("size", static_cast<double>(i), day(i)));
  }
  CHECK_EQUAL(values(unbox(repo.history("size", day(0), day(10)))),
              (std::vector<double>{2.0, 3.0, 4.0}));
}

TEST("metric history expires old points") {
  auto repo = memory_metrics_repository{repository_limits{.max_age = 48h}};
  for (auto i = 0; i < 4; ++i) {
    REQUIRE_SUCCESS(repo.store("size", static_cast<double>(i), day(i)));
  }
  CHECK_EQUAL(values(unbox(repo.history("size", day(0), day(10)))),
              (std::vector<double>{1.0, 2.0, 3.0}));
}

TEST("the number of metrics is bounded") {
  auto repo = memory_metrics_repository{repository_limits{.max_metrics = 2}};
  REQUIRE_SUCCESS(repo.store("a", 1.0, day(0)));
  REQUIRE_SUCCESS(repo.store("b", 1.0, day(0)));
  auto err = repo.store("c", 1.0, day(0));
  CHECK_EQUAL(err, ec::store_error);
  MESSAGE("known metrics still accept points");
  CHECK_SUCCESS(repo.store("a", 2.0, day(1)));
  CHECK_EQUAL(repo.size(), 2u);
}
