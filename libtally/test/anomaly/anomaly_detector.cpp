//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/anomaly/anomaly_detector.hpp"

#include "tally/analyzer_context.hpp"
#include "tally/error.hpp"
#include "tally/test/test.hpp"

#include <chrono>
#include <memory>

using namespace tally;
using namespace std::chrono_literals;

namespace {

auto day(int n) -> time {
  return time{} + std::chrono::days{20'000 + n};
}

auto rate_of_change(double max_increase)
  -> std::shared_ptr<const detection_strategy> {
  return std::make_shared<relative_rate_of_change>(unbox(
    relative_rate_of_change::make({.max_increase = max_increase})));
}

auto failing_strategy() -> std::shared_ptr<const detection_strategy> {
  return std::make_shared<custom_strategy>(
    "broken", [](std::string_view, std::span<const metric_point>,
                 double) -> caf::expected<std::optional<anomaly>> {
      return caf::make_error(ec::unspecified, "strategy failure");
    });
}

struct fixture {
  fixture() {
    REQUIRE_SUCCESS(repository->store("size", 100.0, day(1)));
    REQUIRE_SUCCESS(repository->store("size", 100.0, day(2)));
    REQUIRE_SUCCESS(repository->store("mean.price", 10.0, day(2)));
  }

  auto make_detector(detection_options options = {}) -> anomaly_detector {
    return anomaly_detector{repository, options};
  }

  /// Returns the stored values of a metric up to and including *now*.
  auto stored(const std::string& metric) -> std::vector<metric_point> {
    return unbox(repository->history(metric, day(0), now + 1s));
  }

  std::shared_ptr<memory_metrics_repository> repository
    = std::make_shared<memory_metrics_repository>();
  time now = day(3);
};

} // namespace

WITH_FIXTURE(fixture) {

TEST("detecting anomalies in single values") {
  auto detector = make_detector();
  REQUIRE_SUCCESS(detector.add("size", rate_of_change(0.5)));
  auto report = unbox(detector.detect("size", 300.0, now));
  REQUIRE_EQUAL(report.anomalies.size(), 1u);
  const auto& finding = report.anomalies[0];
  CHECK_EQUAL(finding.metric, "size");
  CHECK_EQUAL(finding.strategy, "relative_rate_of_change");
  CHECK(finding.detected_at == now);
  CHECK(finding.severity == severity::critical);
  CHECK(report.abstentions.empty());
  CHECK(report.errors.empty());
  auto quiet = unbox(detector.detect("size", 120.0, now + 1h));
  CHECK(quiet.anomalies.empty());
}

TEST("strategies apply to matching metrics") {
  auto detector = make_detector();
  REQUIRE_SUCCESS(detector.add("mean.*", rate_of_change(0.5)));
  REQUIRE_SUCCESS(detector.add("*", rate_of_change(1.0)));
  auto size = unbox(detector.detect("size", 180.0, now));
  CHECK(size.anomalies.empty());
  auto mean = unbox(detector.detect("mean.price", 18.0, now));
  REQUIRE_EQUAL(mean.anomalies.size(), 1u);
  MESSAGE("every matching strategy runs");
  auto both = unbox(detector.detect("mean.price", 40.0, now + 1h));
  CHECK_EQUAL(both.anomalies.size(), 2u);
  auto unmatched = make_detector();
  REQUIRE_SUCCESS(unmatched.add("mean.?", rate_of_change(0.1)));
  CHECK(unbox(unmatched.detect("mean.price", 100.0, now)).anomalies.empty());
}

TEST("invalid registrations") {
  auto detector = make_detector();
  CHECK_EQUAL(detector.add("", rate_of_change(0.5)), ec::invalid_argument);
  CHECK_EQUAL(detector.add("size", nullptr), ec::invalid_argument);
}

TEST("findings below the minimum confidence") {
  auto detector = make_detector({.min_confidence = 0.9});
  REQUIRE_SUCCESS(detector.add("size", rate_of_change(0.5)));
  auto report = unbox(detector.detect("size", 160.0, now));
  CHECK(report.anomalies.empty());
  CHECK_EQUAL(report.filtered, 1u);
  auto confident = unbox(detector.detect("size", 500.0, now + 1h));
  CHECK_EQUAL(confident.anomalies.size(), 1u);
  CHECK_EQUAL(confident.filtered, 0u);
}

TEST("checked values become history") {
  auto detector = make_detector();
  REQUIRE_SUCCESS(detector.add("size", rate_of_change(0.5)));
  REQUIRE_NOERROR(detector.detect("size", 110.0, now, {{"table", "orders"}}));
  auto history = stored("size");
  REQUIRE_EQUAL(history.size(), 3u);
  CHECK_EQUAL(history.back().value, 110.0);
  CHECK(history.back().timestamp == now);
  CHECK_EQUAL(history.back().tags.at("table"), "orders");
  MESSAGE("values without a matching strategy are stored as well");
  REQUIRE_NOERROR(detector.detect("unchecked", 1.0, now));
  CHECK_EQUAL(stored("unchecked").size(), 1u);
}

TEST("detection without storing values") {
  auto detector = make_detector({.store_current_metrics = false});
  REQUIRE_SUCCESS(detector.add("size", rate_of_change(0.5)));
  REQUIRE_NOERROR(detector.detect("size", 110.0, now));
  CHECK_EQUAL(stored("size").size(), 2u);
}

TEST("history outside the window is ignored") {
  auto detector = make_detector({.history_window = 36h});
  auto strategy = std::make_shared<relative_rate_of_change>(
    unbox(relative_rate_of_change::make({
      .max_increase = 0.5,
      .baseline = baseline::mean(),
    })));
  REQUIRE_SUCCESS(detector.add("size", strategy));
  REQUIRE_SUCCESS(repository->store("size", 1000.0, day(1) + 1h));
  MESSAGE("only the value of day 2 lies within the window");
  auto report = unbox(detector.detect("size", 300.0, now));
  CHECK_EQUAL(report.anomalies.size(), 1u);
  auto unbounded = make_detector({.history_window = 72h});
  REQUIRE_SUCCESS(unbounded.add("size", strategy));
  CHECK(unbox(unbounded.detect("size", 300.0, now + 1h)).anomalies.empty());
}

TEST("strategies abstain without enough history") {
  auto detector = make_detector();
  auto strategy = std::make_shared<z_score>(unbox(z_score::make({})));
  REQUIRE_SUCCESS(detector.add("size", strategy));
  auto report = unbox(detector.detect("size", 500.0, now));
  CHECK(report.anomalies.empty());
  REQUIRE_EQUAL(report.abstentions.size(), 1u);
  CHECK_EQUAL(report.abstentions[0].metric, "size");
  CHECK_EQUAL(report.abstentions[0].strategy, "z_score");
  CHECK(not report.abstentions[0].reason.empty());
}

TEST("failing strategies do not stop detection") {
  auto detector = make_detector();
  REQUIRE_SUCCESS(detector.add("size", failing_strategy()));
  REQUIRE_SUCCESS(detector.add("size", rate_of_change(0.5)));
  auto report = unbox(detector.detect("size", 300.0, now));
  REQUIRE_EQUAL(report.errors.size(), 1u);
  CHECK_EQUAL(report.errors[0].strategy, "broken");
  CHECK_EQUAL(report.errors[0].error, ec::unspecified);
  CHECK_EQUAL(report.anomalies.size(), 1u);
}

TEST("detecting anomalies in analysis results") {
  auto detector = make_detector();
  REQUIRE_SUCCESS(detector.add("size", rate_of_change(0.5)));
  REQUIRE_SUCCESS(detector.add("mean.*", rate_of_change(0.5)));
  auto context = analyzer_context{run_metadata{.table = "orders"}};
  context.add_metric("size", metric_value{int64_t{300}});
  context.add_metric("mean.price", metric_value{11.0});
  context.add_metric("approx_quantile.price",
                     metric_value{distribution{{{"0.5", 10.0}}}});
  auto report = detector.detect(context, now);
  CHECK(report.errors.empty());
  REQUIRE_EQUAL(report.anomalies.size(), 1u);
  CHECK_EQUAL(report.anomalies[0].metric, "size");
  MESSAGE("distributions are not checked or stored");
  CHECK(stored("approx_quantile.price").empty());
  auto history = stored("mean.price");
  REQUIRE_EQUAL(history.size(), 2u);
  CHECK_EQUAL(history.back().tags.at("table"), "orders");
}

TEST("repository failures") {
  repository = std::make_shared<memory_metrics_repository>(
    repository_limits{.max_metrics = 1});
  REQUIRE_SUCCESS(repository->store("size", 100.0, day(2)));
  auto detector = make_detector();
  auto result = detector.detect("mean.price", 10.0, now);
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::store_error);
  auto context = analyzer_context{run_metadata{.table = "orders"}};
  context.add_metric("size", metric_value{int64_t{100}});
  context.add_metric("mean.price", metric_value{10.0});
  auto report = detector.detect(context, now);
  REQUIRE_EQUAL(report.errors.size(), 1u);
  CHECK_EQUAL(report.errors[0].metric, "mean.price");
  CHECK(report.errors[0].strategy.empty());
  CHECK_EQUAL(report.errors[0].error, ec::store_error);
}

} // WITH_FIXTURE(fixture)
