//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/arrow_utils.hpp"
#include "tally/detail/overload.hpp"

#define XXH_INLINE_ALL
#include <xxhash.h>

#include <bit>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>

namespace tally {

/// The 64-bit XXH3 hash function with a seed.
class xxh3_64 {
public:
  using result_type = uint64_t;

  explicit xxh3_64(result_type seed = 0) noexcept : seed_{seed} {
    // nop
  }

  auto operator()(std::span<const std::byte> bytes) const noexcept
    -> result_type {
    return XXH3_64bits_withSeed(bytes.data(), bytes.size(), seed_);
  }

  auto seed() const noexcept -> result_type {
    return seed_;
  }

private:
  result_type seed_;
};

/// Computes the digest of a single cell. Integral and floating-point cells
/// with the same numeric value hash differently; analyzers only ever hash
/// cells of one column.
inline auto digest(const cell& x, uint64_t seed) noexcept -> uint64_t {
  auto h = xxh3_64{seed};
  return std::visit(detail::overload{
                      [&](int64_t y) {
                        return h(std::as_bytes(std::span{&y, 1}));
                      },
                      [&](double y) {
                        // Treat negative zero and zero as the same value.
                        if (y == 0.0) {
                          y = 0.0;
                        }
                        return h(std::as_bytes(std::span{&y, 1}));
                      },
                      [&](bool y) {
                        auto byte = static_cast<uint8_t>(y);
                        return h(std::as_bytes(std::span{&byte, 1}));
                      },
                      [&](std::string_view y) {
                        return h(std::as_bytes(std::span{y.data(), y.size()}));
                      },
                    },
                    x);
}

/// Hashes an integer, e.g., a synthetic key.
inline auto digest(uint64_t x, uint64_t seed) noexcept -> uint64_t {
  return xxh3_64{seed}(std::as_bytes(std::span{&x, 1}));
}

} // namespace tally
