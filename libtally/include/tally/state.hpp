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
#include "tally/detail/inspection_common.hpp"
#include "tally/error.hpp"
#include "tally/metric_value.hpp"

#include <caf/expected.hpp>
#include <flatbuffers/flatbuffers.h>

#include <concepts>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace tally {

namespace fbs::state {

struct State;

} // namespace fbs::state

/// The concrete shape of an analyzer state.
enum class state_kind : uint8_t {
  size,
  sum,
  mean,
  standard_deviation,
  min_max,
  completeness,
  distinct,
  hyperloglog,
  kll,
  frequencies,
  histogram,
  data_type,
};

/// @relates state_kind
auto to_string(state_kind x) -> std::string_view;

/// @relates state_kind
auto parse_state_kind(std::string_view str) -> std::optional<state_kind>;

template <class Inspector>
auto inspect(Inspector& f, state_kind& x) {
  return detail::inspect_enum(f, x);
}

/// The capability of an intermediate, mergeable summary of data.
///
/// `merge` must be associative and commutative, and a default-constructed (or
/// freshly configured) state must be its identity. `to_metric` finalizes the
/// state and never touches the query engine.
template <class T>
concept analyzer_state
  = std::copyable<T>
    and requires(const T& x, flatbuffers::FlatBufferBuilder& builder,
                 const fbs::state::State& table) {
          { T::kind } -> std::convertible_to<state_kind>;
          { x.merge(x) } -> std::same_as<T>;
          { x.to_metric() } -> std::same_as<metric_value>;
          { x.is_empty() } -> std::same_as<bool>;
          { x.pack(builder) } -> std::same_as<flatbuffers::Offset<fbs::state::State>>;
          { T::unpack(table) } -> std::same_as<caf::expected<T>>;
          { x == x } -> std::convertible_to<bool>;
        };

/// A state whose merge additionally depends on configuration, e.g., the
/// precision of a HyperLogLog.
template <class T>
concept configured_state = analyzer_state<T> and requires(const T& x) {
  { x.compatible_with(x) } -> std::same_as<caf::error>;
};

/// A type-erased, immutable analyzer state.
class any_state {
public:
  template <analyzer_state State>
  explicit(false) any_state(State state)
    : self_{std::make_shared<const model<State>>(std::move(state))} {
    // nop
  }

  auto kind() const -> state_kind {
    return self_->kind();
  }

  /// Merges two states of the same kind.
  /// @returns `ec::state_incompatibility` if the configurations differ.
  /// @pre `kind() == other.kind()`; violating this panics.
  auto merge(const any_state& other) const -> caf::expected<any_state>;

  auto to_metric() const -> metric_value {
    return self_->to_metric();
  }

  auto is_empty() const -> bool {
    return self_->is_empty();
  }

  /// Returns the concrete state if it has the type *State*.
  template <analyzer_state State>
  auto as() const -> const State* {
    if (self_->kind() != State::kind) {
      return nullptr;
    }
    return &static_cast<const model<State>&>(*self_).state;
  }

  /// Serializes the state into a standalone FlatBuffers `State` table.
  auto serialize() const -> blob;

  /// Restores a state serialized with `serialize`.
  static auto deserialize(std::span<const std::byte> bytes)
    -> caf::expected<any_state>;

  /// Wraps the serialized state into a metric.
  auto to_sketch_handle() const -> sketch_handle;

  friend auto operator==(const any_state& x, const any_state& y) -> bool {
    return x.self_->equals(*y.self_);
  }

private:
  struct concept_ {
    virtual ~concept_() noexcept = default;
    virtual auto kind() const -> state_kind = 0;
    virtual auto merge(const concept_& other) const
      -> caf::expected<any_state>
      = 0;
    virtual auto to_metric() const -> metric_value = 0;
    virtual auto is_empty() const -> bool = 0;
    virtual auto pack(flatbuffers::FlatBufferBuilder& builder) const
      -> flatbuffers::Offset<fbs::state::State>
      = 0;
    virtual auto equals(const concept_& other) const -> bool = 0;
  };

  template <analyzer_state State>
  struct model final : concept_ {
    explicit model(State state) : state{std::move(state)} {
      // nop
    }

    auto kind() const -> state_kind override {
      return State::kind;
    }

    auto merge(const concept_& other) const
      -> caf::expected<any_state> override {
      const auto& rhs = static_cast<const model&>(other).state;
      if constexpr (configured_state<State>) {
        if (auto err = state.compatible_with(rhs)) {
          return err;
        }
      }
      return any_state{state.merge(rhs)};
    }

    auto to_metric() const -> metric_value override {
      return state.to_metric();
    }

    auto is_empty() const -> bool override {
      return state.is_empty();
    }

    auto pack(flatbuffers::FlatBufferBuilder& builder) const
      -> flatbuffers::Offset<fbs::state::State> override {
      return state.pack(builder);
    }

    auto equals(const concept_& other) const -> bool override {
      return other.kind() == State::kind
             and static_cast<const model&>(other).state == state;
    }

    State state;
  };

  std::shared_ptr<const concept_> self_;
};

} // namespace tally

template <>
struct fmt::formatter<tally::state_kind> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(tally::state_kind x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(tally::to_string(x), ctx);
  }
};
