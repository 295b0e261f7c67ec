//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/blob.hpp"

#include <caf/expected.hpp>
#include <flatbuffers/flatbuffers.h>
#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tally {

namespace fbs::metric {

struct Metric;

} // namespace fbs::metric

/// An ordered list of named sub-values, e.g., the quantiles of a column.
struct distribution {
  std::vector<std::pair<std::string, double>> entries;

  /// Looks up an entry by name.
  auto find(std::string_view name) const -> std::optional<double>;

  friend auto operator==(const distribution&, const distribution&) -> bool
    = default;
};

/// A serialized analyzer state that can be restored into a live state, e.g.,
/// to merge a persisted HyperLogLog with a fresh one.
struct sketch_handle {
  /// The state kind, as returned by `to_string(state_kind)`.
  std::string kind;
  blob bytes;

  friend auto operator==(const sketch_handle&, const sketch_handle&) -> bool
    = default;
};

/// The immutable result of finalizing an analyzer state.
class metric_value {
public:
  using variant_type = std::variant<int64_t, double, distribution, sketch_handle>;

  metric_value() = default;

  template <std::integral T>
  explicit metric_value(T x) : value_{static_cast<int64_t>(x)} {
    // nop
  }

  template <std::floating_point T>
  explicit metric_value(T x) : value_{static_cast<double>(x)} {
    // nop
  }

  explicit metric_value(distribution x) : value_{std::move(x)} {
    // nop
  }

  explicit metric_value(sketch_handle x) : value_{std::move(x)} {
    // nop
  }

  auto get() const -> const variant_type& {
    return value_;
  }

  auto as_integer() const -> const int64_t* {
    return std::get_if<int64_t>(&value_);
  }

  auto as_double() const -> const double* {
    return std::get_if<double>(&value_);
  }

  auto as_distribution() const -> const distribution* {
    return std::get_if<distribution>(&value_);
  }

  auto as_sketch() const -> const sketch_handle* {
    return std::get_if<sketch_handle>(&value_);
  }

  /// Returns the value as a scalar for scalar metrics.
  auto to_double() const -> std::optional<double>;

  /// Writes the value into a FlatBuffers builder.
  auto pack(flatbuffers::FlatBufferBuilder& builder) const
    -> flatbuffers::Offset<fbs::metric::Metric>;

  /// Reads a value from its FlatBuffers representation.
  static auto unpack(const fbs::metric::Metric& table)
    -> caf::expected<metric_value>;

  /// Serializes the value into a standalone buffer.
  auto serialize() const -> blob;

  /// Deserializes a value from a buffer created by `serialize`.
  static auto deserialize(std::span<const std::byte> bytes)
    -> caf::expected<metric_value>;

  friend auto operator==(const metric_value&, const metric_value&) -> bool
    = default;

private:
  variant_type value_ = int64_t{0};
};

} // namespace tally

template <>
struct fmt::formatter<tally::metric_value> {
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }

  auto format(const tally::metric_value& x, format_context& ctx) const
    -> format_context::iterator;
};
