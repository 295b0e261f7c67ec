//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/state.hpp"

#include "tally/fbs/state.hpp"
#include "tally/flatbuffer.hpp"
#include "tally/panic.hpp"
#include "tally/sketch/hyperloglog.hpp"
#include "tally/sketch/kll.hpp"
#include "tally/states.hpp"

#include <array>

namespace tally {

namespace {

constexpr auto state_kind_names = std::array<std::string_view, 12>{
  "size",
  "sum",
  "mean",
  "standard_deviation",
  "min_max",
  "completeness",
  "distinct",
  "hyperloglog",
  "kll",
  "frequencies",
  "histogram",
  "data_type",
};

template <analyzer_state State>
auto restore(const fbs::state::State& table) -> caf::expected<any_state> {
  auto result = State::unpack(table);
  if (not result) {
    return std::move(result.error());
  }
  return any_state{std::move(*result)};
}

} // namespace

auto to_string(state_kind x) -> std::string_view {
  auto index = static_cast<size_t>(x);
  TALLY_ASSERT(index < state_kind_names.size());
  return state_kind_names[index];
}

auto parse_state_kind(std::string_view str) -> std::optional<state_kind> {
  for (size_t i = 0; i < state_kind_names.size(); ++i) {
    if (state_kind_names[i] == str) {
      return static_cast<state_kind>(i);
    }
  }
  return std::nullopt;
}

auto any_state::merge(const any_state& other) const
  -> caf::expected<any_state> {
  if (kind() != other.kind()) {
    panic("cannot merge a {} state with a {} state", kind(), other.kind());
  }
  return self_->merge(*other.self_);
}

auto any_state::serialize() const -> blob {
  auto builder = flatbuffers::FlatBufferBuilder{};
  builder.Finish(self_->pack(builder));
  return release(builder);
}

auto any_state::deserialize(std::span<const std::byte> bytes)
  -> caf::expected<any_state> {
  auto root = verified_root<fbs::state::State>(bytes);
  if (not root) {
    return std::move(root.error());
  }
  const auto& table = **root;
  using fbs::state::Any;
  switch (table.state_type()) {
    case Any::NONE:
      break;
    case Any::Size:
      return restore<size_state>(table);
    case Any::Sum:
      return restore<sum_state>(table);
    case Any::Mean:
      return restore<mean_state>(table);
    case Any::StandardDeviation:
      return restore<stddev_state>(table);
    case Any::MinMax:
      return restore<min_max_state>(table);
    case Any::Completeness:
      return restore<completeness_state>(table);
    case Any::Distinct:
      return restore<distinct_state>(table);
    case Any::HyperLogLog:
      return restore<hyperloglog>(table);
    case Any::Kll:
      return restore<kll_sketch>(table);
    case Any::Frequencies:
      return restore<frequency_state>(table);
    case Any::Histogram:
      return restore<histogram_state>(table);
    case Any::DataType:
      return restore<data_type_state>(table);
  }
  return caf::make_error(ec::serialization_error,
                         "serialized state has no known alternative");
}

auto any_state::to_sketch_handle() const -> sketch_handle {
  return {std::string{to_string(kind())}, serialize()};
}

} // namespace tally
