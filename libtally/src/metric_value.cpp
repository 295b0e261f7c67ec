//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/metric_value.hpp"

#include "tally/detail/overload.hpp"
#include "tally/error.hpp"
#include "tally/fbs/metric.hpp"
#include "tally/flatbuffer.hpp"

namespace tally {

auto distribution::find(std::string_view name) const -> std::optional<double> {
  for (const auto& [key, value] : entries) {
    if (key == name) {
      return value;
    }
  }
  return std::nullopt;
}

auto metric_value::to_double() const -> std::optional<double> {
  if (const auto* x = as_integer()) {
    return static_cast<double>(*x);
  }
  if (const auto* x = as_double()) {
    return *x;
  }
  return std::nullopt;
}

auto metric_value::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::metric::Metric> {
  namespace fb = fbs::metric;
  return std::visit(
    detail::overload{
      [&](int64_t x) {
        auto value = fb::CreateInteger(builder, x);
        return fb::CreateMetric(builder, fb::Value::Integer, value.Union());
      },
      [&](double x) {
        auto value = fb::CreateDouble(builder, x);
        return fb::CreateMetric(builder, fb::Value::Double, value.Union());
      },
      [&](const distribution& x) {
        auto entries = std::vector<flatbuffers::Offset<fb::Entry>>{};
        entries.reserve(x.entries.size());
        for (const auto& [name, value] : x.entries) {
          entries.push_back(
            fb::CreateEntry(builder, builder.CreateString(name), value));
        }
        auto value
          = fb::CreateDistribution(builder, builder.CreateVector(entries));
        return fb::CreateMetric(builder, fb::Value::Distribution,
                                value.Union());
      },
      [&](const sketch_handle& x) {
        auto kind = builder.CreateString(x.kind);
        auto payload = builder.CreateVector(x.bytes.as_uint8().data(),
                                            x.bytes.size());
        auto value = fb::CreateSketch(builder, kind, payload);
        return fb::CreateMetric(builder, fb::Value::Sketch, value.Union());
      },
    },
    value_);
}

auto metric_value::unpack(const fbs::metric::Metric& table)
  -> caf::expected<metric_value> {
  namespace fb = fbs::metric;
  switch (table.value_type()) {
    case fb::Value::NONE:
      break;
    case fb::Value::Integer:
      return metric_value{table.value_as_Integer()->value()};
    case fb::Value::Double:
      return metric_value{table.value_as_Double()->value()};
    case fb::Value::Distribution: {
      auto result = distribution{};
      if (const auto* entries = table.value_as_Distribution()->entries()) {
        for (const auto* entry : *entries) {
          result.entries.emplace_back(entry->name()->str(), entry->value());
        }
      }
      return metric_value{std::move(result)};
    }
    case fb::Value::Sketch: {
      const auto* sketch = table.value_as_Sketch();
      auto result = sketch_handle{sketch->kind()->str(), {}};
      if (const auto* payload = sketch->payload()) {
        result.bytes
          = blob{std::span<const uint8_t>{payload->data(), payload->size()}};
      }
      return metric_value{std::move(result)};
    }
  }
  return caf::make_error(ec::serialization_error,
                         "metric value has no known alternative");
}

auto metric_value::serialize() const -> blob {
  auto builder = flatbuffers::FlatBufferBuilder{};
  auto root = pack(builder);
  fbs::metric::FinishMetricBuffer(builder, root);
  return release(builder);
}

auto metric_value::deserialize(std::span<const std::byte> bytes)
  -> caf::expected<metric_value> {
  auto root = verified_root<fbs::metric::Metric>(
    bytes, fbs::metric::MetricIdentifier());
  if (not root) {
    return std::move(root.error());
  }
  return unpack(**root);
}

} // namespace tally

auto fmt::formatter<tally::metric_value>::format(const tally::metric_value& x,
                                                 format_context& ctx) const
  -> format_context::iterator {
  return std::visit(
    tally::detail::overload{
      [&](int64_t y) {
        return fmt::format_to(ctx.out(), "{}", y);
      },
      [&](double y) {
        return fmt::format_to(ctx.out(), "{}", y);
      },
      [&](const tally::distribution& y) {
        auto out = fmt::format_to(ctx.out(), "{{");
        auto first = true;
        for (const auto& [name, value] : y.entries) {
          out = fmt::format_to(out, "{}{}: {}", first ? "" : ", ", name, value);
          first = false;
        }
        return fmt::format_to(out, "}}");
      },
      [&](const tally::sketch_handle& y) {
        return fmt::format_to(ctx.out(), "<{} sketch, {} bytes>", y.kind,
                              y.bytes.size());
      },
    },
    x.get());
}
