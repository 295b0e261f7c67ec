//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/sketch/kll.hpp"

#include "tally/detail/assert.hpp"
#include "tally/fbs/state.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace tally {

kll_sketch::kll_sketch()
  : kll_sketch{defaults::sketch::kll_k, defaults::sketch::seed} {
  // nop
}

kll_sketch::kll_sketch(uint32_t k, uint64_t seed)
  : k_{k}, seed_{seed}, levels_(1), rng_{seed} {
  update_capacity();
}

auto kll_sketch::make(uint32_t k, uint64_t seed) -> caf::expected<kll_sketch> {
  if (k < min_k or k > max_k) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("KLL size parameter must be in [{}, "
                                       "{}], got {}",
                                       min_k, max_k, k));
  }
  return kll_sketch{k, seed};
}

void kll_sketch::add(double x) {
  if (std::isnan(x)) {
    return;
  }
  ++n_;
  min_ = std::min(min_, x);
  max_ = std::max(max_, x);
  levels_[0].push_back(x);
  ++size_;
  if (size_ > max_size_) {
    compress();
  }
}

auto kll_sketch::quantile(double phi) const -> double {
  TALLY_ASSERT(n_ > 0);
  if (phi <= 0.0) {
    return min_;
  }
  if (phi >= 1.0) {
    return max_;
  }
  auto weighted = std::vector<std::pair<double, uint64_t>>{};
  weighted.reserve(size_);
  for (size_t level = 0; level < levels_.size(); ++level) {
    for (auto x : levels_[level]) {
      weighted.emplace_back(x, uint64_t{1} << level);
    }
  }
  std::sort(weighted.begin(), weighted.end());
  auto target = static_cast<uint64_t>(std::ceil(phi * static_cast<double>(n_)));
  target = std::max(target, uint64_t{1});
  auto cumulative = uint64_t{0};
  for (const auto& [x, weight] : weighted) {
    cumulative += weight;
    if (cumulative >= target) {
      return std::clamp(x, min_, max_);
    }
  }
  return max_;
}

auto kll_sketch::rank(double x) const -> double {
  if (n_ == 0) {
    return 0.0;
  }
  auto weight = uint64_t{0};
  for (size_t level = 0; level < levels_.size(); ++level) {
    for (auto y : levels_[level]) {
      if (y <= x) {
        weight += uint64_t{1} << level;
      }
    }
  }
  return static_cast<double>(weight) / static_cast<double>(n_);
}

auto kll_sketch::normalized_rank_error() const -> double {
  return 2.296 / std::pow(static_cast<double>(k_), 0.9723);
}

auto kll_sketch::compatible_with(const kll_sketch& other) const
  -> caf::error {
  if (k_ != other.k_ or seed_ != other.seed_) {
    return caf::make_error(ec::state_incompatibility,
                           fmt::format("cannot merge KLL sketch (k={}, "
                                       "seed={}) with KLL sketch (k={}, "
                                       "seed={})",
                                       k_, seed_, other.k_, other.seed_));
  }
  return {};
}

auto kll_sketch::merge(const kll_sketch& other) const -> kll_sketch {
  TALLY_ASSERT(k_ == other.k_ and seed_ == other.seed_);
  auto result = *this;
  if (result.levels_.size() < other.levels_.size()) {
    result.levels_.resize(other.levels_.size());
  }
  for (size_t level = 0; level < other.levels_.size(); ++level) {
    auto& dst = result.levels_[level];
    dst.insert(dst.end(), other.levels_[level].begin(),
               other.levels_[level].end());
  }
  result.n_ += other.n_;
  result.min_ = std::min(min_, other.min_);
  result.max_ = std::max(max_, other.max_);
  result.size_ += other.size_;
  // Deriving the random source from the merged count makes the outcome
  // independent of the operand order.
  result.rng_.seed(seed_ ^ result.n_);
  result.update_capacity();
  result.compress();
  return result;
}

auto kll_sketch::to_metric() const -> metric_value {
  return metric_value{any_state{*this}.to_sketch_handle()};
}

auto kll_sketch::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  auto levels = std::vector<flatbuffers::Offset<fbs::state::KllLevel>>{};
  levels.reserve(levels_.size());
  for (const auto& level : levels_) {
    auto items = level;
    std::sort(items.begin(), items.end());
    levels.push_back(
      fbs::state::CreateKllLevel(builder, builder.CreateVector(items)));
  }
  auto table
    = fbs::state::CreateKll(builder, k_, seed_, n_, min_, max_,
                            builder.CreateVector(levels));
  return fbs::state::CreateState(builder, fbs::state::Any::Kll, table.Union());
}

auto kll_sketch::unpack(const fbs::state::State& table)
  -> caf::expected<kll_sketch> {
  const auto* x = table.state_as_Kll();
  if (not x) {
    return caf::make_error(ec::serialization_error,
                           "state table does not hold a KLL sketch");
  }
  auto result = make(x->k(), x->seed());
  if (not result) {
    return caf::make_error(ec::serialization_error,
                           fmt::format("invalid KLL sketch: {}",
                                       render(result.error())));
  }
  result->n_ = x->count();
  result->min_ = x->min();
  result->max_ = x->max();
  result->levels_.clear();
  result->size_ = 0;
  auto weight = uint64_t{0};
  if (const auto* levels = x->levels()) {
    for (const auto* level : *levels) {
      auto& items = result->levels_.emplace_back();
      if (const auto* xs = level->items()) {
        items.assign(xs->begin(), xs->end());
      }
      weight += items.size() << (result->levels_.size() - 1);
      result->size_ += items.size();
    }
  }
  if (result->levels_.empty()) {
    result->levels_.emplace_back();
  }
  if (weight != result->n_) {
    return caf::make_error(ec::serialization_error,
                           fmt::format("KLL sketch retains a weight of {} but "
                                       "counts {} values",
                                       weight, result->n_));
  }
  result->rng_.seed(result->seed_ ^ result->n_);
  result->update_capacity();
  return result;
}

auto operator==(const kll_sketch& x, const kll_sketch& y) -> bool {
  if (x.k_ != y.k_ or x.seed_ != y.seed_ or x.n_ != y.n_
      or x.levels_.size() != y.levels_.size()) {
    return false;
  }
  if (x.n_ > 0 and (x.min_ != y.min_ or x.max_ != y.max_)) {
    return false;
  }
  for (size_t level = 0; level < x.levels_.size(); ++level) {
    auto lhs = x.levels_[level];
    auto rhs = y.levels_[level];
    std::sort(lhs.begin(), lhs.end());
    std::sort(rhs.begin(), rhs.end());
    if (lhs != rhs) {
      return false;
    }
  }
  return true;
}

auto kll_sketch::capacity(size_t level) const -> size_t {
  auto depth = levels_.size() - level - 1;
  auto cap = std::ceil(static_cast<double>(k_)
                       * std::pow(2.0 / 3.0, static_cast<double>(depth)));
  return std::max(size_t{8}, static_cast<size_t>(cap));
}

void kll_sketch::update_capacity() {
  max_size_ = 0;
  for (size_t level = 0; level < levels_.size(); ++level) {
    max_size_ += capacity(level);
  }
}

void kll_sketch::compress() {
  while (size_ > max_size_) {
    for (size_t level = 0; level < levels_.size(); ++level) {
      if (levels_[level].size() >= capacity(level)) {
        compact(level);
        break;
      }
    }
  }
}

void kll_sketch::compact(size_t level) {
  if (level + 1 == levels_.size()) {
    levels_.emplace_back();
    update_capacity();
  }
  auto& items = levels_[level];
  auto& next = levels_[level + 1];
  std::sort(items.begin(), items.end());
  // With an odd number of items, the smallest stays behind.
  auto leftover = items.size() % 2;
  auto offset = static_cast<size_t>(rng_() & 1);
  for (auto i = leftover + offset; i < items.size(); i += 2) {
    next.push_back(items[i]);
  }
  auto promoted = (items.size() - leftover) / 2;
  size_ -= items.size() - leftover - promoted;
  items.resize(leftover);
}

} // namespace tally
