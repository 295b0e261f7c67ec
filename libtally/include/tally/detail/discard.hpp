//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace tally::detail {

template <class... Ts>
constexpr void discard(Ts&&...) noexcept {
  // nop
}

} // namespace tally::detail

#define TALLY_DISCARD_ARGS(...) ::tally::detail::discard(__VA_ARGS__)
