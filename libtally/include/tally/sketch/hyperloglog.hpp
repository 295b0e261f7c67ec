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
#include "tally/state.hpp"

#include <caf/expected.hpp>

#include <cstdint>
#include <vector>

namespace tally {

/// A HyperLogLog cardinality estimator over 64-bit XXH3 digests.
///
/// The estimator has `m = 2^p` one-byte registers. The first `p` bits of a
/// digest select a register, and the register keeps the largest 1-based
/// position of the leftmost 1-bit in the remaining bits. The relative standard
/// error of the estimate is `1.04 / sqrt(m)`.
class hyperloglog {
public:
  static constexpr auto kind = state_kind::hyperloglog;

  static constexpr uint8_t min_precision = 4;
  static constexpr uint8_t max_precision = 18;

  /// Constructs an empty estimator with the default precision.
  hyperloglog();

  /// Constructs an empty estimator.
  /// @returns `ec::invalid_argument` if *precision* is outside [4, 18].
  static auto make(uint8_t precision = defaults::sketch::hll_precision,
                   uint64_t seed = defaults::sketch::seed)
    -> caf::expected<hyperloglog>;

  /// Adds a value.
  void add(const cell& x);

  /// Adds a precomputed 64-bit digest.
  void add_digest(uint64_t digest);

  /// Returns the cardinality estimate.
  auto estimate() const -> double;

  auto precision() const -> uint8_t {
    return precision_;
  }

  auto seed() const -> uint64_t {
    return seed_;
  }

  auto registers() const -> const std::vector<uint8_t>& {
    return registers_;
  }

  /// Returns the relative standard error for the configured precision.
  auto relative_error() const -> double;

  auto compatible_with(const hyperloglog& other) const -> caf::error;

  /// Merges two estimators by taking the element-wise register maximum.
  /// @pre `compatible_with(other)` holds no error.
  auto merge(const hyperloglog& other) const -> hyperloglog;

  /// Returns the rounded estimate as an integer metric.
  auto to_metric() const -> metric_value;

  auto is_empty() const -> bool;

  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::state::State>;

  static auto unpack(const fbs::state::State& table)
    -> caf::expected<hyperloglog>;

  friend auto operator==(const hyperloglog&, const hyperloglog&) -> bool
    = default;

private:
  hyperloglog(uint8_t precision, uint64_t seed);

  uint8_t precision_;
  uint64_t seed_;
  std::vector<uint8_t> registers_;
};

} // namespace tally
