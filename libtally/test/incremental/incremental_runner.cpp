//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/incremental/incremental_runner.hpp"

#include "tally/analysis_runner.hpp"
#include "tally/analyzers.hpp"
#include "tally/arrow_query_engine.hpp"
#include "tally/error.hpp"
#include "tally/execution_context.hpp"
#include "tally/test/tables.hpp"
#include "tally/test/test.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace tally;
using namespace tally::test;

namespace {

/// A memory store whose writes can be made to fail.
class unreliable_store final : public memory_state_store {
public:
  auto save_state(const std::string& key, const state_map& states)
    -> caf::error override {
    if (failing) {
      return caf::make_error(ec::filesystem_error, "disk full");
    }
    return memory_state_store::save_state(key, states);
  }

  bool failing = false;
};

void add_analyzers(incremental_runner& runner) {
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  REQUIRE_SUCCESS(runner.add(completeness_analyzer{"price"}));
  REQUIRE_SUCCESS(runner.add(sum_analyzer{"price"}));
  REQUIRE_SUCCESS(runner.add(mean_analyzer{"price"}));
  REQUIRE_SUCCESS(runner.add(minimum_analyzer{"price"}));
  REQUIRE_SUCCESS(runner.add(maximum_analyzer{"price"}));
  REQUIRE_SUCCESS(runner.add(standard_deviation_analyzer{"price"}));
  REQUIRE_SUCCESS(runner.add(count_distinct_analyzer{"email"}));
  REQUIRE_SUCCESS(runner.add(distinctness_analyzer{"email"}));
  REQUIRE_SUCCESS(runner.add(approx_count_distinct_analyzer{"email"}));
  REQUIRE_SUCCESS(runner.add(approx_quantile_analyzer{"price", {0.5}}));
}

void check_same_metrics(const metric_map& xs, const metric_map& ys) {
  REQUIRE_EQUAL(xs.size(), ys.size());
  for (const auto& [key, x] : xs) {
    MESSAGE("comparing {}", key);
    auto it = ys.find(key);
    REQUIRE(it != ys.end());
    const auto& y = it->second;
    if (auto value = x.to_double()) {
      CHECK_CLOSE(*value, unbox(y.to_double()), 1e-9);
    } else {
      CHECK(x == y);
    }
  }
}

struct fixture {
  fixture() {
    engine.add("a", make_table({
                      {"price", double_array({10.0, 20.0})},
                      {"email", string_array({"a", "b"})},
                    }));
    engine.add("b", make_table({
                      {"price", double_array({30.0, std::nullopt})},
                      {"email", string_array({"a", "c"})},
                    }));
    engine.add("union", make_table({
                          {"price", double_array({10.0, 20.0, 30.0,
                                                  std::nullopt})},
                          {"email", string_array({"a", "b", "a", "c"})},
                        }));
    engine.add("prices", make_table({{"price", double_array({40.0})}}));
  }

  auto ctx(std::string table) -> execution_context {
    return execution_context{engine, std::move(table)};
  }

  auto make_runner(incremental_options options = {}) -> incremental_runner {
    return incremental_runner{store, "orders", options};
  }

  arrow_query_engine engine;
  std::shared_ptr<memory_state_store> store
    = std::make_shared<memory_state_store>();
};

} // namespace

TEST("duplicate policy names") {
  CHECK_EQUAL(std::string{to_string(duplicate_policy::reject)}, "reject");
  CHECK_EQUAL(std::string{to_string(duplicate_policy::skip)}, "skip");
  CHECK(parse_duplicate_policy("skip") == duplicate_policy::skip);
  CHECK(not parse_duplicate_policy("sometimes"));
}

WITH_FIXTURE(fixture) {

TEST("merged partitions equal a single run over their union") {
  auto runner = make_runner();
  add_analyzers(runner);
  auto first = unbox(runner.process_partition(ctx("a"), "A"));
  CHECK(not first.skipped);
  CHECK(first.gaps.empty());
  CHECK(first.partial_history.empty());
  CHECK(first.errors.empty());
  auto second = unbox(runner.process_partition(ctx("b"), "B"));
  CHECK(second.errors.empty());
  CHECK(second.partial_history.empty());
  auto cumulative = unbox(runner.metrics());
  CHECK_EQUAL(cumulative.partitions, 2u);
  CHECK(cumulative.errors.empty());
  CHECK(cumulative.partial_history.empty());
  auto single = analysis_runner{};
  REQUIRE_SUCCESS(single.add(size_analyzer{}));
  REQUIRE_SUCCESS(single.add(completeness_analyzer{"price"}));
  REQUIRE_SUCCESS(single.add(sum_analyzer{"price"}));
  REQUIRE_SUCCESS(single.add(mean_analyzer{"price"}));
  REQUIRE_SUCCESS(single.add(minimum_analyzer{"price"}));
  REQUIRE_SUCCESS(single.add(maximum_analyzer{"price"}));
  REQUIRE_SUCCESS(single.add(standard_deviation_analyzer{"price"}));
  REQUIRE_SUCCESS(single.add(count_distinct_analyzer{"email"}));
  REQUIRE_SUCCESS(single.add(distinctness_analyzer{"email"}));
  REQUIRE_SUCCESS(single.add(approx_count_distinct_analyzer{"email"}));
  REQUIRE_SUCCESS(single.add(approx_quantile_analyzer{"price", {0.5}}));
  auto expected = unbox(single.run(ctx("union")));
  REQUIRE(expected.status() == run_status::completed);
  check_same_metrics(cumulative.metrics, expected.metrics());
  CHECK_EQUAL(unbox(cumulative.metric("size")->as_integer()), 4);
  CHECK_EQUAL(unbox(cumulative.metric("mean.price")->as_double()), 20.0);
  CHECK_EQUAL(unbox(cumulative.metric("count_distinct.email")->as_integer()),
              3);
  CHECK_EQUAL(unbox(runner.processed_partitions()),
              (std::vector<std::string>{"A", "B"}));
}

TEST("the processed partitions are a reserved entry") {
  auto runner = make_runner();
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  REQUIRE_NOERROR(runner.process_partition(ctx("a"), "A"));
  auto states = unbox(unbox(store->load_state("orders")));
  auto it = states.find(std::string{incremental_runner::processed_key});
  REQUIRE(it != states.end());
  CHECK_EQUAL(it->second.kind, "partition_set");
  CHECK_EQUAL(it->second.partitions, 1u);
  REQUIRE(states.contains("size"));
  CHECK_EQUAL(states["size"].kind, "size");
  CHECK_EQUAL(states["size"].partitions, 1u);
}

TEST("rejecting processed partitions") {
  auto runner = make_runner();
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  REQUIRE_NOERROR(runner.process_partition(ctx("a"), "A"));
  auto result = runner.process_partition(ctx("a"), "A");
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::already_processed);
  CHECK_EQUAL(unbox(unbox(runner.metrics()).metric("size")->as_integer()), 2);
}

TEST("skipping processed partitions") {
  auto runner
    = make_runner(incremental_options{.on_duplicate = duplicate_policy::skip});
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  REQUIRE_NOERROR(runner.process_partition(ctx("a"), "A"));
  auto report = unbox(runner.process_partition(ctx("b"), "A"));
  CHECK(report.skipped);
  auto cumulative = unbox(runner.metrics());
  CHECK_EQUAL(cumulative.partitions, 1u);
  CHECK_EQUAL(unbox(cumulative.metric("size")->as_integer()), 2);
}

TEST("failing to persist leaves the series unchanged") {
  auto unreliable = std::make_shared<unreliable_store>();
  auto runner = incremental_runner{unreliable, "orders"};
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  REQUIRE_NOERROR(runner.process_partition(ctx("a"), "A"));
  unreliable->failing = true;
  auto result = runner.process_partition(ctx("b"), "B");
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::store_error);
  unreliable->failing = false;
  CHECK_EQUAL(unbox(runner.processed_partitions()),
              (std::vector<std::string>{"A"}));
  CHECK_EQUAL(unbox(unbox(runner.metrics()).metric("size")->as_integer()), 2);
  MESSAGE("the partition can be processed again after the failure");
  REQUIRE_NOERROR(runner.process_partition(ctx("b"), "B"));
  CHECK_EQUAL(unbox(unbox(runner.metrics()).metric("size")->as_integer()), 4);
}

TEST("foreign entries survive merging") {
  auto foreign = state_map{};
  foreign.emplace("lineage", persisted_state{.kind = "note",
                                             .partitions = 0,
                                             .payload = blob{std::byte{7}}});
  REQUIRE_SUCCESS(store->save_state("orders", foreign));
  auto runner = make_runner();
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  REQUIRE_NOERROR(runner.process_partition(ctx("a"), "A"));
  auto states = unbox(unbox(store->load_state("orders")));
  REQUIRE(states.contains("lineage"));
  CHECK(states["lineage"] == foreign["lineage"]);
}

TEST("partitions without a column leave gaps") {
  auto runner = make_runner();
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  REQUIRE_SUCCESS(runner.add(sum_analyzer{"price"}));
  REQUIRE_SUCCESS(runner.add(count_distinct_analyzer{"email"}));
  REQUIRE_NOERROR(runner.process_partition(ctx("a"), "A"));
  auto report = unbox(runner.process_partition(ctx("prices"), "C"));
  CHECK_EQUAL(report.gaps, (std::vector<std::string>{"count_distinct.email"}));
  CHECK(report.errors.empty());
  auto cumulative = unbox(runner.metrics());
  CHECK_EQUAL(cumulative.partitions, 2u);
  CHECK_EQUAL(cumulative.partial_history,
              (std::vector<std::string>{"count_distinct.email"}));
  CHECK_EQUAL(unbox(cumulative.metric("size")->as_integer()), 3);
  CHECK_EQUAL(unbox(cumulative.metric("sum.price")->as_double()), 70.0);
  CHECK_EQUAL(unbox(cumulative.metric("count_distinct.email")->as_integer()),
              2);
}

TEST("analyzers added later have a partial history") {
  auto before = make_runner();
  REQUIRE_SUCCESS(before.add(size_analyzer{}));
  REQUIRE_NOERROR(before.process_partition(ctx("a"), "A"));
  auto after = make_runner();
  REQUIRE_SUCCESS(after.add(size_analyzer{}));
  REQUIRE_SUCCESS(after.add(mean_analyzer{"price"}));
  auto report = unbox(after.process_partition(ctx("b"), "B"));
  CHECK_EQUAL(report.partial_history,
              (std::vector<std::string>{"mean.price"}));
  auto cumulative = unbox(after.metrics());
  CHECK_EQUAL(cumulative.partial_history,
              (std::vector<std::string>{"mean.price"}));
  CHECK_EQUAL(unbox(cumulative.metric("size")->as_integer()), 4);
  CHECK_EQUAL(unbox(cumulative.metric("mean.price")->as_double()), 30.0);
}

TEST("analyzer failures with and without fail-fast") {
  auto tolerant = make_runner();
  REQUIRE_SUCCESS(tolerant.add(size_analyzer{}));
  REQUIRE_SUCCESS(tolerant.add(mean_analyzer{"email"}));
  auto report = unbox(tolerant.process_partition(ctx("a"), "A"));
  REQUIRE_EQUAL(report.errors.size(), 1u);
  CHECK_EQUAL(report.errors[0].key, "mean.email");
  CHECK_EQUAL(report.errors[0].error, ec::data_access_error);
  auto strict = incremental_runner{std::make_shared<memory_state_store>(),
                                   "orders",
                                   incremental_options{.fail_fast = true}};
  REQUIRE_SUCCESS(strict.add(size_analyzer{}));
  REQUIRE_SUCCESS(strict.add(mean_analyzer{"email"}));
  auto result = strict.process_partition(ctx("a"), "A");
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::data_access_error);
  CHECK(unbox(strict.processed_partitions()).empty());
}

TEST("a missing partition table") {
  auto runner = make_runner();
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  auto result = runner.process_partition(ctx("nope"), "X");
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::data_access_error);
  CHECK(unbox(runner.processed_partitions()).empty());
}

TEST("concurrent processing equals sequential processing") {
  auto sequential = make_runner();
  add_analyzers(sequential);
  REQUIRE_NOERROR(sequential.process_partition(ctx("a"), "A"));
  REQUIRE_NOERROR(sequential.process_partition(ctx("b"), "B"));
  auto concurrent = incremental_runner{std::make_shared<memory_state_store>(),
                                       "orders",
                                       incremental_options{
                                         .max_concurrency = 2}};
  add_analyzers(concurrent);
  auto inputs = std::vector<partition_input>{{"A", "a"}, {"B", "b"}};
  auto reports = unbox(concurrent.process_partitions(engine, inputs));
  REQUIRE_EQUAL(reports.size(), 2u);
  CHECK_EQUAL(reports[0].partition, "A");
  CHECK_EQUAL(reports[1].partition, "B");
  CHECK(reports[0].errors.empty());
  CHECK(reports[1].errors.empty());
  CHECK_EQUAL(unbox(concurrent.processed_partitions()),
              (std::vector<std::string>{"A", "B"}));
  auto xs = unbox(sequential.metrics());
  auto ys = unbox(concurrent.metrics());
  CHECK_EQUAL(ys.partitions, 2u);
  check_same_metrics(xs.metrics, ys.metrics);
}

TEST("concurrent processing of processed partitions") {
  auto runner = make_runner();
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  REQUIRE_NOERROR(runner.process_partition(ctx("a"), "A"));
  auto inputs = std::vector<partition_input>{{"A", "a"}, {"B", "b"}};
  auto rejected = runner.process_partitions(engine, inputs);
  REQUIRE(not rejected);
  CHECK_EQUAL(rejected.error(), ec::already_processed);
  auto skipping
    = make_runner(incremental_options{.on_duplicate = duplicate_policy::skip});
  REQUIRE_SUCCESS(skipping.add(size_analyzer{}));
  auto reports = unbox(skipping.process_partitions(engine, inputs));
  REQUIRE_EQUAL(reports.size(), 2u);
  CHECK(reports[0].skipped);
  CHECK(not reports[1].skipped);
  CHECK_EQUAL(unbox(unbox(skipping.metrics()).metric("size")->as_integer()),
              4);
}

TEST("concurrent processing saves nothing if a partition fails") {
  auto runner = make_runner();
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  auto inputs = std::vector<partition_input>{{"A", "a"}, {"X", "nope"}};
  auto result = runner.process_partitions(engine, inputs);
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::data_access_error);
  CHECK(unbox(runner.processed_partitions()).empty());
}

TEST("metrics of selected partitions") {
  auto runner = make_runner(incremental_options{.record_deltas = true});
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  REQUIRE_SUCCESS(runner.add(sum_analyzer{"price"}));
  REQUIRE_NOERROR(runner.process_partition(ctx("a"), "A"));
  REQUIRE_NOERROR(runner.process_partition(ctx("b"), "B"));
  REQUIRE_NOERROR(runner.process_partition(ctx("prices"), "C"));
  CHECK_EQUAL(runner.delta_key("B"), "orders/B");
  CHECK(unbox(store->load_state("orders/B")));
  auto selection = std::vector<std::string>{"B", "C"};
  auto selected = unbox(runner.metrics_for(selection));
  CHECK_EQUAL(selected.partitions, 2u);
  CHECK_EQUAL(unbox(selected.metric("size")->as_integer()), 3);
  CHECK_EQUAL(unbox(selected.metric("sum.price")->as_double()), 70.0);
  auto unknown = std::vector<std::string>{"Z"};
  auto result = runner.metrics_for(unknown);
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::lookup_error);
}

TEST("pruning deltas") {
  auto runner = make_runner(incremental_options{.record_deltas = true});
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  REQUIRE_NOERROR(runner.process_partition(ctx("a"), "A"));
  REQUIRE_NOERROR(runner.process_partition(ctx("b"), "B"));
  REQUIRE_NOERROR(runner.process_partition(ctx("prices"), "C"));
  auto pruned = unbox(runner.prune_deltas(1));
  CHECK_EQUAL(pruned, (std::vector<std::string>{"orders/A", "orders/B"}));
  CHECK(unbox(runner.prune_deltas(1)).empty());
  auto selection = std::vector<std::string>{"A"};
  auto result = runner.metrics_for(selection);
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::lookup_error);
  MESSAGE("cumulative metrics do not depend on deltas");
  CHECK_EQUAL(unbox(unbox(runner.metrics()).metric("size")->as_integer()), 5);
}

TEST("resetting a series") {
  auto runner = make_runner(incremental_options{.record_deltas = true});
  REQUIRE_SUCCESS(runner.add(size_analyzer{}));
  REQUIRE_NOERROR(runner.process_partition(ctx("a"), "A"));
  REQUIRE_SUCCESS(store->save_state("other", {}));
  REQUIRE_SUCCESS(runner.reset());
  CHECK(unbox(runner.processed_partitions()).empty());
  CHECK_EQUAL(unbox(store->list_partitions()),
              (std::vector<std::string>{"other"}));
  auto cumulative = unbox(runner.metrics());
  CHECK_EQUAL(cumulative.partitions, 0u);
  CHECK(cumulative.metrics.empty());
  MESSAGE("a reset series accepts its partitions again");
  REQUIRE_NOERROR(runner.process_partition(ctx("a"), "A"));
}

} // WITH_FIXTURE(fixture)
