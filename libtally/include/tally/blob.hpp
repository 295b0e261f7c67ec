//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace tally {

/// An owned sequence of bytes, e.g., a serialized analyzer state.
class blob : public std::vector<std::byte> {
public:
  using super = std::vector<std::byte>;
  using super::super;

  blob() = default;

  explicit blob(std::span<const std::byte> span)
    : super(span.begin(), span.end()) {
  }

  explicit blob(std::span<const uint8_t> span)
    : super(reinterpret_cast<const std::byte*>(span.data()),
            reinterpret_cast<const std::byte*>(span.data()) + span.size()) {
  }

  auto as_uint8() const -> std::span<const uint8_t> {
    return {reinterpret_cast<const uint8_t*>(data()), size()};
  }
};

} // namespace tally
