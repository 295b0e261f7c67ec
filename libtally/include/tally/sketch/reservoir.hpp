//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/defaults.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>
#include <vector>

namespace tally {

/// A fixed-size uniform random sample of a stream (Algorithm R).
template <class T>
class reservoir_sampler {
public:
  explicit reservoir_sampler(size_t capacity,
                             uint64_t seed = defaults::sketch::seed)
    : capacity_{capacity}, rng_{seed} {
    items_.reserve(capacity);
  }

  void add(T x) {
    ++seen_;
    if (items_.size() < capacity_) {
      items_.push_back(std::move(x));
      return;
    }
    // Replace a random slot with probability capacity / seen.
    auto slot = std::uniform_int_distribution<uint64_t>{0, seen_ - 1}(rng_);
    if (slot < capacity_) {
      items_[slot] = std::move(x);
    }
  }

  /// Returns the number of items offered to the sampler.
  auto seen() const -> uint64_t {
    return seen_;
  }

  auto capacity() const -> size_t {
    return capacity_;
  }

  auto sample() const -> std::span<const T> {
    return items_;
  }

private:
  size_t capacity_;
  uint64_t seen_ = 0;
  std::vector<T> items_;
  std::mt19937_64 rng_;
};

} // namespace tally
