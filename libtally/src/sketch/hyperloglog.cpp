//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/sketch/hyperloglog.hpp"

#include "tally/detail/assert.hpp"
#include "tally/fbs/state.hpp"
#include "tally/hash/xxhash.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <bit>
#include <cmath>

namespace tally {

namespace {

auto alpha(size_t m) -> double {
  switch (m) {
    case 16:
      return 0.673;
    case 32:
      return 0.697;
    case 64:
      return 0.709;
    default:
      return 0.7213 / (1.0 + 1.079 / static_cast<double>(m));
  }
}

} // namespace

hyperloglog::hyperloglog()
  : hyperloglog{defaults::sketch::hll_precision, defaults::sketch::seed} {
  // nop
}

hyperloglog::hyperloglog(uint8_t precision, uint64_t seed)
  : precision_{precision},
    seed_{seed},
    registers_(size_t{1} << precision, uint8_t{0}) {
  // nop
}

auto hyperloglog::make(uint8_t precision, uint64_t seed)
  -> caf::expected<hyperloglog> {
  if (precision < min_precision or precision > max_precision) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("HyperLogLog precision must be in "
                                       "[{}, {}], got {}",
                                       min_precision, max_precision,
                                       precision));
  }
  return hyperloglog{precision, seed};
}

void hyperloglog::add(const cell& x) {
  add_digest(digest(x, seed_));
}

void hyperloglog::add_digest(uint64_t digest) {
  auto index = digest >> (64 - precision_);
  auto rest = digest << precision_;
  // An all-zero remainder yields the largest possible rank.
  auto max_rank = 64 - precision_ + 1;
  auto rank = rest == 0 ? max_rank : std::countl_zero(rest) + 1;
  auto& reg = registers_[index];
  reg = std::max(reg, static_cast<uint8_t>(rank));
}

auto hyperloglog::estimate() const -> double {
  auto m = static_cast<double>(registers_.size());
  auto sum = 0.0;
  auto zeros = size_t{0};
  for (auto reg : registers_) {
    sum += std::ldexp(1.0, -static_cast<int>(reg));
    if (reg == 0) {
      ++zeros;
    }
  }
  auto raw = alpha(registers_.size()) * m * m / sum;
  if (raw <= 2.5 * m and zeros > 0) {
    return m * std::log(m / static_cast<double>(zeros));
  }
  constexpr auto two_64 = 18446744073709551616.0;
  if (raw > two_64 / 30.0) {
    return -two_64 * std::log1p(-raw / two_64);
  }
  return raw;
}

auto hyperloglog::relative_error() const -> double {
  return 1.04 / std::sqrt(static_cast<double>(registers_.size()));
}

auto hyperloglog::compatible_with(const hyperloglog& other) const
  -> caf::error {
  if (precision_ != other.precision_ or seed_ != other.seed_) {
    return caf::make_error(ec::state_incompatibility,
                           fmt::format("cannot merge HyperLogLog (p={}, "
                                       "seed={}) with HyperLogLog (p={}, "
                                       "seed={})",
                                       precision_, seed_, other.precision_,
                                       other.seed_));
  }
  return {};
}

auto hyperloglog::merge(const hyperloglog& other) const -> hyperloglog {
  TALLY_ASSERT(precision_ == other.precision_ and seed_ == other.seed_);
  auto result = *this;
  for (size_t i = 0; i < registers_.size(); ++i) {
    result.registers_[i] = std::max(registers_[i], other.registers_[i]);
  }
  return result;
}

auto hyperloglog::to_metric() const -> metric_value {
  return metric_value{static_cast<int64_t>(std::llround(estimate()))};
}

auto hyperloglog::is_empty() const -> bool {
  return std::all_of(registers_.begin(), registers_.end(), [](auto reg) {
    return reg == 0;
  });
}

auto hyperloglog::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  auto table = fbs::state::CreateHyperLogLog(builder, precision_, seed_,
                                             builder.CreateVector(registers_));
  return fbs::state::CreateState(builder, fbs::state::Any::HyperLogLog,
                                 table.Union());
}

auto hyperloglog::unpack(const fbs::state::State& table)
  -> caf::expected<hyperloglog> {
  const auto* x = table.state_as_HyperLogLog();
  if (not x) {
    return caf::make_error(ec::serialization_error,
                           "state table does not hold a HyperLogLog");
  }
  auto result = make(x->precision(), x->seed());
  if (not result) {
    return caf::make_error(ec::serialization_error,
                           fmt::format("invalid HyperLogLog: {}",
                                       render(result.error())));
  }
  const auto* registers = x->registers();
  if (not registers or registers->size() != result->registers_.size()) {
    return caf::make_error(ec::serialization_error,
                           fmt::format("HyperLogLog with p={} must have {} "
                                       "registers",
                                       x->precision(),
                                       result->registers_.size()));
  }
  std::copy(registers->begin(), registers->end(), result->registers_.begin());
  return result;
}

} // namespace tally
