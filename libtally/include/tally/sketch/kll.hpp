//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/defaults.hpp"
#include "tally/state.hpp"

#include <caf/expected.hpp>

#include <cstdint>
#include <limits>
#include <random>
#include <vector>

namespace tally {

/// A KLL quantile sketch over doubles.
///
/// Level `h` holds items of weight `2^h`. When the sketch exceeds its total
/// capacity, the lowest full level is sorted and every second item moves up
/// one level, starting at a random offset. The normalized rank error is
/// approximately `2.296 / k^0.9723`.
class kll_sketch {
public:
  static constexpr auto kind = state_kind::kll;

  static constexpr uint32_t min_k = 8;
  static constexpr uint32_t max_k = 65'535;

  /// Constructs an empty sketch with the default size parameter.
  kll_sketch();

  /// Constructs an empty sketch.
  /// @param k The size parameter. Larger values trade memory for accuracy.
  /// @param seed The seed of the random source for compactions.
  /// @returns `ec::invalid_argument` if *k* is outside [8, 65535].
  static auto make(uint32_t k = defaults::sketch::kll_k,
                   uint64_t seed = defaults::sketch::seed)
    -> caf::expected<kll_sketch>;

  /// Adds a value. NaN values are ignored.
  void add(double x);

  /// Returns the number of values added.
  auto n() const -> uint64_t {
    return n_;
  }

  auto min() const -> double {
    return min_;
  }

  auto max() const -> double {
    return max_;
  }

  auto k() const -> uint32_t {
    return k_;
  }

  auto seed() const -> uint64_t {
    return seed_;
  }

  /// Returns the number of retained items.
  auto retained() const -> size_t {
    return size_;
  }

  /// Returns the approximate value at normalized rank *phi*.
  /// @pre `not is_empty()`
  auto quantile(double phi) const -> double;

  /// Returns the approximate normalized rank of *x*, i.e., the fraction of
  /// values less than or equal to *x*.
  auto rank(double x) const -> double;

  /// Returns the normalized rank error for the size parameter.
  auto normalized_rank_error() const -> double;

  auto compatible_with(const kll_sketch& other) const -> caf::error;

  /// @pre `compatible_with(other)` holds no error.
  auto merge(const kll_sketch& other) const -> kll_sketch;

  /// Returns the serialized sketch as a sketch handle.
  auto to_metric() const -> metric_value;

  auto is_empty() const -> bool {
    return n_ == 0;
  }

  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;

  static auto unpack(const fbs::state::State& table)
    -> caf::expected<kll_sketch>;

  /// Compares configuration, counts, extremes and the retained items of
  /// every level, irrespective of their order within a level.
  friend auto operator==(const kll_sketch& x, const kll_sketch& y) -> bool;

private:
  kll_sketch(uint32_t k, uint64_t seed);

  auto capacity(size_t level) const -> size_t;

  void update_capacity();

  void compress();

  void compact(size_t level);

  uint32_t k_;
  uint64_t seed_;
  uint64_t n_ = 0;
  double min_ = std::numeric_limits<double>::infinity();
  double max_ = -std::numeric_limits<double>::infinity();
  std::vector<std::vector<double>> levels_;
  size_t size_ = 0;
  size_t max_size_ = 0;
  std::mt19937_64 rng_;
};

} // namespace tally
