//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/states.hpp"

#include "tally/panic.hpp"
#include "tally/sketch/hyperloglog.hpp"
#include "tally/state.hpp"
#include "tally/test/test.hpp"

#include <cmath>
#include <string>

using namespace tally;

TEST("empty states are merge identities") {
  CHECK(size_state{5}.merge(size_state{}) == size_state{5});
  CHECK((sum_state{1.5, 2}.merge(sum_state{}) == sum_state{1.5, 2}));
  CHECK((mean_state{}.merge(mean_state{6.0, 3}) == mean_state{6.0, 3}));
  CHECK((completeness_state{4, 3}.merge(completeness_state{})
         == completeness_state{4, 3}));
  auto extremes = min_max_state{};
  extremes.add(-2.0);
  extremes.add(7.0);
  CHECK(extremes.merge(min_max_state{}) == extremes);
  CHECK(min_max_state{}.merge(extremes) == extremes);
  auto moments = stddev_state{};
  moments.add(1.0);
  moments.add(4.0);
  CHECK(moments.merge(stddev_state{}) == moments);
  CHECK(stddev_state{}.merge(moments) == moments);
}

TEST("merging is associative") {
  auto sizes = std::vector<size_state>{{2}, {0}, {5}};
  auto sums = std::vector<sum_state>{{1.5, 2}, {-4.0, 1}, {10.25, 3}};
  auto means = std::vector<mean_state>{{3.0, 2}, {}, {7.5, 3}};
  auto completeness = std::vector<completeness_state>{{4, 3}, {2, 0}, {5, 5}};
  auto check = [](const auto& xs) {
    CHECK(xs[0].merge(xs[1]).merge(xs[2]) == xs[0].merge(xs[1].merge(xs[2])));
  };
  check(sizes);
  check(sums);
  check(means);
  check(completeness);
  auto extremes = std::vector<min_max_state>(3);
  extremes[0].add(3.0);
  extremes[1].add(-8.0);
  extremes[1].add(1.0);
  extremes[2].add(12.0);
  check(extremes);
  auto distinct = std::vector<distinct_state>(3);
  auto frequencies = std::vector<frequency_state>(3);
  auto types = std::vector<data_type_state>(3);
  auto sketches = std::vector<hyperloglog>{};
  for (auto i = 0; i < 3; ++i) {
    sketches.push_back(unbox(hyperloglog::make(10)));
  }
  for (auto i = int64_t{0}; i < 3'000; ++i) {
    auto part = static_cast<size_t>(i % 3);
    auto value = cell{i % 700};
    distinct[part].add(value);
    frequencies[part].add(value);
    sketches[part].add(value);
    types[part].add(i % 2 == 0 ? semantic_type::integer
                               : semantic_type::string);
  }
  check(distinct);
  check(frequencies);
  check(sketches);
  check(types);
  auto histograms = std::vector<histogram_state>{};
  for (auto i = 0; i < 3; ++i) {
    histograms.push_back(unbox(histogram_state::make(0.0, 10.0, 5)));
  }
  for (auto x : {-1.0, 0.0, 2.5, 9.9, 10.0, 11.0}) {
    histograms[0].add(x);
    histograms[2].add(x / 2.0);
  }
  check(histograms);
  MESSAGE("standard deviation is associative up to rounding");
  auto moments = std::vector<stddev_state>(3);
  for (auto x : {1.0, 2.0, 4.0}) {
    moments[0].add(x);
  }
  moments[1].add(10.0);
  for (auto x : {-3.0, 0.5}) {
    moments[2].add(x);
  }
  auto left = moments[0].merge(moments[1]).merge(moments[2]);
  auto right = moments[0].merge(moments[1].merge(moments[2]));
  CHECK_EQUAL(left.count, right.count);
  CHECK_CLOSE(left.mean, right.mean, 1e-12);
  CHECK_CLOSE(left.m2, right.m2, 1e-9);
}

TEST("empty states are identities on both sides") {
  auto check = [](const auto& x, const auto& empty) {
    CHECK(x.merge(empty) == x);
    CHECK(empty.merge(x) == x);
  };
  check(size_state{3}, size_state{});
  check(sum_state{2.5, 2}, sum_state{});
  check(mean_state{9.0, 3}, mean_state{});
  check(completeness_state{7, 4}, completeness_state{});
  auto distinct = distinct_state{};
  auto frequencies = frequency_state{};
  auto sketch = unbox(hyperloglog::make(12));
  for (auto x : {"a", "b", "a", "c"}) {
    distinct.add(cell{std::string_view{x}});
    frequencies.add(cell{std::string_view{x}});
    sketch.add(cell{std::string_view{x}});
  }
  check(distinct, distinct_state{});
  check(frequencies, frequency_state{});
  check(sketch, unbox(hyperloglog::make(12)));
  auto histogram = unbox(histogram_state::make(-1.0, 1.0, 4));
  histogram.add(0.25);
  histogram.add(5.0);
  check(histogram, unbox(histogram_state::make(-1.0, 1.0, 4)));
  auto types = data_type_state{};
  types.add(semantic_type::date, 2);
  check(types, data_type_state{});
}

TEST("empty states finalize to NaN") {
  CHECK(std::isnan(*any_state{mean_state{}}.to_metric().as_double()));
  CHECK(std::isnan(*any_state{stddev_state{}}.to_metric().as_double()));
  CHECK(std::isnan(*any_state{completeness_state{}}.to_metric().as_double()));
  CHECK(std::isnan(*any_state{frequency_state{}}.to_metric().as_double()));
  CHECK_EQUAL(*any_state{size_state{}}.to_metric().as_integer(), 0);
  CHECK_EQUAL(*any_state{sum_state{}}.to_metric().as_double(), 0.0);
}

TEST("standard deviation merges like a single pass") {
  auto a = stddev_state{};
  a.add(10.0);
  a.add(20.0);
  auto b = stddev_state{};
  b.add(30.0);
  auto whole = stddev_state{};
  for (auto x : {10.0, 20.0, 30.0}) {
    whole.add(x);
  }
  auto merged = a.merge(b);
  CHECK_EQUAL(merged.count, 3u);
  CHECK_CLOSE(merged.mean, 20.0, 1e-9);
  CHECK_CLOSE(merged.variance(), whole.variance(), 1e-9);
  CHECK_CLOSE(*merged.to_metric().as_double(), std::sqrt(200.0 / 3.0), 1e-9);
  auto reversed = b.merge(a);
  CHECK_CLOSE(reversed.mean, merged.mean, 1e-9);
  CHECK_CLOSE(reversed.m2, merged.m2, 1e-9);
}

TEST("partial aggregates merge into the metrics of the whole") {
  auto a = mean_state{};
  a.add(1.0);
  a.add(2.0);
  auto b = mean_state{};
  b.add(6.0);
  CHECK_EQUAL(*a.merge(b).to_metric().as_double(), 3.0);
  CHECK_EQUAL(*b.merge(a).to_metric().as_double(), 3.0);
  auto completeness
    = completeness_state{4, 3}.merge(completeness_state{6, 2});
  CHECK_EQUAL(*completeness.to_metric().as_double(), 0.5);
  auto extremes = min_max_state{};
  extremes.add(3.0);
  auto more = min_max_state{};
  more.add(-1.0);
  more.add(9.0);
  auto combined = extremes.merge(more);
  CHECK_EQUAL(combined.count, 3u);
  CHECK_EQUAL(combined.min, -1.0);
  CHECK_EQUAL(combined.max, 9.0);
  const auto* range = combined.to_metric().as_distribution();
  REQUIRE(range != nullptr);
  CHECK_EQUAL(*range->find("min"), -1.0);
  CHECK_EQUAL(*range->find("max"), 9.0);
}

TEST("exact distinct counting") {
  auto a = distinct_state{};
  for (auto x : {"foo", "bar", "foo"}) {
    a.add(cell{std::string_view{x}});
  }
  auto b = distinct_state{};
  for (auto x : {"bar", "baz"}) {
    b.add(cell{std::string_view{x}});
  }
  CHECK_EQUAL(a.distinct(), 2u);
  CHECK_EQUAL(a.count(), 3u);
  auto merged = a.merge(b);
  CHECK_EQUAL(merged.distinct(), 3u);
  CHECK_EQUAL(merged.count(), 5u);
  CHECK(merged == b.merge(a));
  CHECK_EQUAL(*merged.to_metric().as_integer(), 3);
}

TEST("type-erased states") {
  auto a = any_state{size_state{3}};
  auto b = any_state{size_state{4}};
  CHECK_EQUAL(a.kind(), state_kind::size);
  auto merged = unbox(a.merge(b));
  REQUIRE(merged.as<size_state>() != nullptr);
  CHECK_EQUAL(merged.as<size_state>()->count, 7u);
  CHECK(merged.as<sum_state>() == nullptr);
  CHECK_EQUAL(*merged.to_metric().as_integer(), 7);
  MESSAGE("serialized states restore with their kind");
  auto restored = unbox(any_state::deserialize(merged.serialize()));
  CHECK(restored == merged);
  CHECK_EQUAL(std::string{to_string(restored.kind())}, "size");
}

TEST("distinct states with different seeds do not merge") {
  auto a = any_state{distinct_state{1}};
  auto b = any_state{distinct_state{2}};
  auto merged = a.merge(b);
  REQUIRE(not merged);
  CHECK_EQUAL(merged.error(), ec::state_incompatibility);
}

TEST("merging states of different kinds panics") {
  auto a = any_state{size_state{3}};
  auto b = any_state{mean_state{1.0, 1}};
  auto panicked = false;
  try {
    auto merged = a.merge(b);
    CHECK(not merged);
  } catch (const panic_exception& err) {
    panicked = true;
    CHECK_NOT_EQUAL(err.message.find("cannot merge a size state with a mean "
                                     "state"),
                    std::string::npos);
  }
  CHECK(panicked);
}

TEST("value frequencies") {
  auto frequencies = frequency_state{};
  for (auto x : {"a", "b", "a", "c", "a", "b"}) {
    frequencies.add(cell{std::string_view{x}});
  }
  CHECK_EQUAL(frequencies.total(), 6u);
  CHECK_EQUAL(frequencies.distinct(), 3u);
  CHECK_EQUAL(frequencies.counts().at("a"), 3u);
  auto entropy = -(0.5 * std::log2(0.5) + 2.0 / 6.0 * std::log2(2.0 / 6.0)
                   + 1.0 / 6.0 * std::log2(1.0 / 6.0));
  CHECK_CLOSE(frequencies.entropy(), entropy, 1e-12);
  CHECK_CLOSE(frequencies.normalized_entropy(), entropy / std::log2(3.0),
              1e-12);
  CHECK_CLOSE(frequencies.gini_impurity(), 1.0 - 14.0 / 36.0, 1e-12);
  CHECK_CLOSE(*frequencies.to_metric().as_double(), entropy, 1e-12);
  MESSAGE("a single value has no entropy");
  auto constant = frequency_state{};
  constant.add(cell{int64_t{7}});
  CHECK_EQUAL(constant.entropy(), 0.0);
  CHECK_EQUAL(constant.normalized_entropy(), 0.0);
  MESSAGE("serialized frequencies restore");
  auto restored = unbox(any_state::deserialize(any_state{frequencies}.serialize()));
  REQUIRE(restored.as<frequency_state>() != nullptr);
  CHECK(*restored.as<frequency_state>() == frequencies);
}

TEST("histogram buckets") {
  CHECK_EQUAL(histogram_state::make(1.0, 1.0).error(), ec::invalid_argument);
  CHECK_EQUAL(histogram_state::make(0.0, 1.0, 0).error(), ec::invalid_argument);
  CHECK_EQUAL(histogram_state::make(0.0, 1.0, 1'001).error(),
              ec::invalid_argument);
  CHECK_EQUAL(histogram_state::make(0.0, std::nan("")).error(),
              ec::invalid_argument);
  auto histogram = unbox(histogram_state::make(0.0, 10.0, 4));
  for (auto x : {-0.5, 0.0, 2.4, 2.5, 7.5, 10.0, 10.5, std::nan("")}) {
    histogram.add(x);
  }
  CHECK_EQUAL(histogram.counts(), (std::vector<uint64_t>{2, 1, 0, 2}));
  CHECK_EQUAL(histogram.underflow(), 1u);
  CHECK_EQUAL(histogram.overflow(), 1u);
  CHECK_EQUAL(histogram.count(), 7u);
  auto metric = histogram.to_metric();
  const auto* buckets = metric.as_distribution();
  REQUIRE(buckets != nullptr);
  REQUIRE_EQUAL(buckets->entries.size(), 6u);
  CHECK_EQUAL(buckets->entries[0].first, "[0, 2.5)");
  CHECK_EQUAL(buckets->entries[3].first, "[7.5, 10]");
  CHECK_EQUAL(*buckets->find("[2.5, 5)"), 1.0);
  CHECK_EQUAL(*buckets->find("underflow"), 1.0);
  CHECK_EQUAL(*buckets->find("overflow"), 1.0);
  MESSAGE("histograms over different buckets do not merge");
  auto other = any_state{unbox(histogram_state::make(0.0, 10.0, 5))};
  auto merged = any_state{histogram}.merge(other);
  REQUIRE(not merged);
  CHECK_EQUAL(merged.error(), ec::state_incompatibility);
  MESSAGE("serialized histograms restore");
  auto restored = unbox(any_state::deserialize(any_state{histogram}.serialize()));
  REQUIRE(restored.as<histogram_state>() != nullptr);
  CHECK(*restored.as<histogram_state>() == histogram);
}

TEST("data type counts") {
  auto types = data_type_state{};
  types.add(semantic_type::integer, 6);
  types.add(semantic_type::decimal);
  types.add(semantic_type::string);
  CHECK_EQUAL(types.total(), 8u);
  CHECK_EQUAL(types.count(semantic_type::integer), 6u);
  CHECK_EQUAL(types.count(semantic_type::date), 0u);
  CHECK_EQUAL(types.consistency(), 0.75);
  auto metric = types.to_metric();
  const auto* counts = metric.as_distribution();
  REQUIRE(counts != nullptr);
  CHECK_EQUAL(*counts->find("integer"), 6.0);
  CHECK_EQUAL(*counts->find("string"), 1.0);
  CHECK_EQUAL(*counts->find("consistency"), 0.75);
  auto empty = data_type_state{}.to_metric();
  CHECK(std::isnan(*empty.as_distribution()->find("consistency")));
  auto restored = unbox(any_state::deserialize(any_state{types}.serialize()));
  REQUIRE(restored.as<data_type_state>() != nullptr);
  CHECK(*restored.as<data_type_state>() == types);
}

TEST("state kind names") {
  CHECK_EQUAL(std::string{to_string(state_kind::standard_deviation)},
              "standard_deviation");
  CHECK(parse_state_kind("kll") == state_kind::kll);
  CHECK(not parse_state_kind("tdigest"));
}

TEST("malformed state buffers") {
  auto garbage = blob(16, std::byte{0x2a});
  auto restored = any_state::deserialize(garbage);
  REQUIRE(not restored);
  CHECK_EQUAL(restored.error(), ec::serialization_error);
}
