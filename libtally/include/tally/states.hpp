//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/arrow_utils.hpp"
#include "tally/defaults.hpp"
#include "tally/profiler/column_profile.hpp"
#include "tally/state.hpp"

#include <tsl/robin_map.h>
#include <tsl/robin_set.h>

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace tally {

/// Counts rows.
struct size_state {
  static constexpr auto kind = state_kind::size;

  uint64_t count = 0;

  auto merge(const size_state& other) const -> size_state;
  auto to_metric() const -> metric_value;
  auto is_empty() const -> bool {
    return count == 0;
  }
  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;
  static auto unpack(const fbs::state::State& table)
    -> caf::expected<size_state>;

  friend auto operator==(const size_state&, const size_state&) -> bool
    = default;
};

/// Sums up non-null values.
struct sum_state {
  static constexpr auto kind = state_kind::sum;

  double sum = 0.0;
  uint64_t count = 0;

  void add(double x) {
    sum += x;
    ++count;
  }

  auto merge(const sum_state& other) const -> sum_state;
  auto to_metric() const -> metric_value;
  auto is_empty() const -> bool {
    return count == 0;
  }
  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;
  static auto unpack(const fbs::state::State& table)
    -> caf::expected<sum_state>;

  friend auto operator==(const sum_state&, const sum_state&) -> bool
    = default;
};

/// Tracks sum and count of non-null values.
struct mean_state {
  static constexpr auto kind = state_kind::mean;

  double sum = 0.0;
  uint64_t count = 0;

  void add(double x) {
    sum += x;
    ++count;
  }

  auto mean() const -> double {
    return sum / static_cast<double>(count);
  }

  auto merge(const mean_state& other) const -> mean_state;
  /// Returns NaN for the empty state.
  auto to_metric() const -> metric_value;
  auto is_empty() const -> bool {
    return count == 0;
  }
  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;
  static auto unpack(const fbs::state::State& table)
    -> caf::expected<mean_state>;

  friend auto operator==(const mean_state&, const mean_state&) -> bool
    = default;
};

/// A Welford accumulator for the population standard deviation. Partial
/// accumulators merge with the parallel update of Chan et al.
struct stddev_state {
  static constexpr auto kind = state_kind::standard_deviation;

  uint64_t count = 0;
  double mean = 0.0;
  double m2 = 0.0;

  void add(double x);

  auto variance() const -> double {
    return m2 / static_cast<double>(count);
  }

  auto merge(const stddev_state& other) const -> stddev_state;
  /// Returns NaN for the empty state.
  auto to_metric() const -> metric_value;
  auto is_empty() const -> bool {
    return count == 0;
  }
  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;
  static auto unpack(const fbs::state::State& table)
    -> caf::expected<stddev_state>;

  friend auto operator==(const stddev_state&, const stddev_state&) -> bool
    = default;
};

/// Tracks the extremes of non-null values.
struct min_max_state {
  static constexpr auto kind = state_kind::min_max;

  uint64_t count = 0;
  double min = std::numeric_limits<double>::infinity();
  double max = -std::numeric_limits<double>::infinity();

  void add(double x);

  auto merge(const min_max_state& other) const -> min_max_state;
  /// Returns a distribution with the entries `min` and `max`.
  auto to_metric() const -> metric_value;
  auto is_empty() const -> bool {
    return count == 0;
  }
  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;
  static auto unpack(const fbs::state::State& table)
    -> caf::expected<min_max_state>;

  friend auto operator==(const min_max_state&, const min_max_state&) -> bool
    = default;
};

/// Counts rows and non-null rows.
struct completeness_state {
  static constexpr auto kind = state_kind::completeness;

  uint64_t total = 0;
  uint64_t non_null = 0;

  auto merge(const completeness_state& other) const -> completeness_state;
  /// Returns NaN for the empty state.
  auto to_metric() const -> metric_value;
  auto is_empty() const -> bool {
    return total == 0;
  }
  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;
  static auto unpack(const fbs::state::State& table)
    -> caf::expected<completeness_state>;

  friend auto operator==(const completeness_state&, const completeness_state&)
    -> bool
    = default;
};

/// Counts distinct values exactly by keeping the 64-bit digest of every
/// distinct value. Also counts the non-null values it has seen.
class distinct_state {
public:
  static constexpr auto kind = state_kind::distinct;

  explicit distinct_state(uint64_t seed = defaults::sketch::seed)
    : seed_{seed} {
    // nop
  }

  void add(const cell& x);

  auto distinct() const -> uint64_t {
    return digests_.size();
  }

  /// Returns the number of values added.
  auto count() const -> uint64_t {
    return count_;
  }

  auto seed() const -> uint64_t {
    return seed_;
  }

  auto compatible_with(const distinct_state& other) const -> caf::error;

  /// @pre `compatible_with(other)` holds no error.
  auto merge(const distinct_state& other) const -> distinct_state;
  auto to_metric() const -> metric_value;
  auto is_empty() const -> bool {
    return digests_.empty();
  }
  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;
  static auto unpack(const fbs::state::State& table)
    -> caf::expected<distinct_state>;

  friend auto operator==(const distinct_state& x, const distinct_state& y)
    -> bool {
    return x.seed_ == y.seed_ and x.count_ == y.count_
           and x.digests_ == y.digests_;
  }

private:
  uint64_t seed_;
  uint64_t count_ = 0;
  tsl::robin_set<uint64_t> digests_;
};

/// Counts the occurrences of every distinct non-null value, keyed by the
/// rendering of the value.
class frequency_state {
public:
  static constexpr auto kind = state_kind::frequencies;

  void add(const cell& x) {
    add(to_string(x));
  }

  void add(std::string value, uint64_t count = 1);

  /// Returns the number of values added.
  auto total() const -> uint64_t {
    return total_;
  }

  auto distinct() const -> uint64_t {
    return counts_.size();
  }

  auto counts() const -> const tsl::robin_map<std::string, uint64_t>& {
    return counts_;
  }

  /// Returns the Shannon entropy in bits.
  auto entropy() const -> double;

  /// Returns the entropy divided by its maximum `log2(distinct())`, or 0 for
  /// fewer than two distinct values.
  auto normalized_entropy() const -> double;

  /// Returns the probability that two values drawn with replacement differ.
  auto gini_impurity() const -> double;

  auto merge(const frequency_state& other) const -> frequency_state;
  /// Returns the entropy, or NaN for the empty state.
  auto to_metric() const -> metric_value;
  auto is_empty() const -> bool {
    return total_ == 0;
  }
  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;
  static auto unpack(const fbs::state::State& table)
    -> caf::expected<frequency_state>;

  friend auto operator==(const frequency_state& x, const frequency_state& y)
    -> bool {
    return x.total_ == y.total_ and x.counts_ == y.counts_;
  }

private:
  uint64_t total_ = 0;
  tsl::robin_map<std::string, uint64_t> counts_;
};

/// Counts numbers in equal-width buckets over a fixed range. The upper bound
/// belongs to the last bucket. Numbers outside the range count as underflow
/// or overflow, and NaN is ignored.
class histogram_state {
public:
  static constexpr auto kind = state_kind::histogram;

  /// Constructs an empty histogram.
  /// @returns `ec::invalid_argument` unless `lower < upper`, both are finite,
  /// and *buckets* is in [1, 1000].
  static auto make(double lower, double upper,
                   size_t buckets = defaults::analyzers::histogram_buckets)
    -> caf::expected<histogram_state>;

  void add(double x);

  auto lower() const -> double {
    return lower_;
  }

  auto upper() const -> double {
    return upper_;
  }

  auto counts() const -> const std::vector<uint64_t>& {
    return counts_;
  }

  auto underflow() const -> uint64_t {
    return underflow_;
  }

  auto overflow() const -> uint64_t {
    return overflow_;
  }

  /// Returns the number of values added, including underflow and overflow.
  auto count() const -> uint64_t;

  auto compatible_with(const histogram_state& other) const -> caf::error;

  /// @pre `compatible_with(other)` holds no error.
  auto merge(const histogram_state& other) const -> histogram_state;

  /// Returns a distribution with one entry per bucket, named after its range,
  /// e.g., `[0, 2.5)`, followed by `underflow` and `overflow`.
  auto to_metric() const -> metric_value;

  auto is_empty() const -> bool {
    return count() == 0;
  }

  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;

  static auto unpack(const fbs::state::State& table)
    -> caf::expected<histogram_state>;

  friend auto operator==(const histogram_state&, const histogram_state&)
    -> bool
    = default;

private:
  histogram_state(double lower, double upper, size_t buckets);

  double lower_;
  double upper_;
  std::vector<uint64_t> counts_;
  uint64_t underflow_ = 0;
  uint64_t overflow_ = 0;
};

/// Counts non-null values by the type they represent.
struct data_type_state {
  static constexpr auto kind = state_kind::data_type;

  /// The semantic types a single value can have, in the order of `counts`.
  static constexpr auto types = std::array{
    semantic_type::integer, semantic_type::decimal, semantic_type::boolean,
    semantic_type::string,  semantic_type::date,
  };

  std::array<uint64_t, types.size()> counts = {};

  /// @pre *type* is one of `types`.
  void add(semantic_type type, uint64_t n = 1);

  auto count(semantic_type type) const -> uint64_t;

  auto total() const -> uint64_t;

  /// Returns the share of the most frequent type.
  /// @pre `not is_empty()`
  auto consistency() const -> double;

  auto merge(const data_type_state& other) const -> data_type_state;
  /// Returns a distribution with the count of every type, followed by the
  /// entry `consistency`, which is NaN for the empty state.
  auto to_metric() const -> metric_value;
  auto is_empty() const -> bool {
    return total() == 0;
  }
  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;
  static auto unpack(const fbs::state::State& table)
    -> caf::expected<data_type_state>;

  friend auto operator==(const data_type_state&, const data_type_state&)
    -> bool
    = default;
};

} // namespace tally
