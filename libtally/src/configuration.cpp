//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/configuration.hpp"

#include "tally/error.hpp"
#include "tally/io/read.hpp"
#include "tally/logger.hpp"

#include <caf/config_value.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <chrono>
#include <stdexcept>
#include <string>
#include <system_error>

namespace tally {

namespace {

/// Infers the type of an unquoted scalar.
auto parse_scalar(const std::string& str) -> caf::config_value {
  if (str == "true") {
    return caf::config_value{true};
  }
  if (str == "false") {
    return caf::config_value{false};
  }
  const auto* begin = str.data();
  const auto* end = str.data() + str.size();
  auto integer = caf::config_value::integer{};
  if (auto [ptr, ec] = std::from_chars(begin, end, integer);
      ec == std::errc{} and ptr == end) {
    return caf::config_value{integer};
  }
  auto real = caf::config_value::real{};
  if (auto [ptr, ec] = std::from_chars(begin, end, real);
      ec == std::errc{} and ptr == end) {
    return caf::config_value{real};
  }
  return caf::config_value{str};
}

auto parse(const YAML::Node& node) -> caf::config_value {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return caf::config_value{};
    case YAML::NodeType::Scalar: {
      auto str = node.as<std::string>();
      // Quoted scalars carry the non-specific tag "!" and stay strings.
      if (node.Tag() == "!") {
        return caf::config_value{std::move(str)};
      }
      return parse_scalar(str);
    }
    case YAML::NodeType::Sequence: {
      auto xs = caf::config_value::list{};
      xs.reserve(node.size());
      for (const auto& element : node) {
        xs.push_back(parse(element));
      }
      return caf::config_value{std::move(xs)};
    }
    case YAML::NodeType::Map: {
      auto xs = caf::settings{};
      for (const auto& pair : node) {
        auto value = parse(pair.second);
        // A config_value has no notion of null, so we drop such entries.
        if (caf::holds_alternative<caf::none_t>(value)) {
          continue;
        }
        xs.insert_or_assign(pair.first.as<std::string>(), std::move(value));
      }
      return caf::config_value{std::move(xs)};
    }
  }
  TALLY_UNREACHABLE();
}

auto invalid(std::string_view key, const caf::config_value& value,
             std::string_view expected) -> caf::error {
  return caf::make_error(ec::invalid_configuration,
                         fmt::format("option {} must be {}, got {}", key,
                                     expected, caf::to_string(value)));
}

/// Reads an option, falling back to a default if it is missing.
template <class T>
auto read(const caf::settings& settings, std::string_view key, T fallback,
          std::string_view expected) -> caf::expected<T> {
  const auto* value = caf::get_if(&settings, key);
  if (not value) {
    return fallback;
  }
  auto result = caf::get_as<T>(*value);
  if (not result) {
    return invalid(key, *value, expected);
  }
  return std::move(*result);
}

auto check_fraction(std::string_view key, double x) -> caf::error {
  if (not(x > 0.0 and x <= 1.0)) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("option {} must be in (0, 1], got {}",
                                       key, x));
  }
  return {};
}

} // namespace

auto from_yaml(std::string_view str) -> caf::expected<caf::settings> {
  try {
    auto node = YAML::Load(std::string{str});
    auto value = parse(node);
    if (caf::holds_alternative<caf::none_t>(value)) {
      return caf::settings{};
    }
    if (not caf::holds_alternative<caf::settings>(value)) {
      return caf::make_error(ec::format_error,
                             "configuration is not a map of key-value pairs");
    }
    return caf::get<caf::settings>(value);
  } catch (const YAML::Exception& e) {
    return caf::make_error(ec::format_error,
                           fmt::format("failed to parse YAML at line {} "
                                       "column {}: {}",
                                       e.mark.line + 1, e.mark.column + 1,
                                       e.msg));
  } catch (const std::logic_error& e) {
    return caf::make_error(ec::logic_error, e.what());
  }
}

auto load_config(const std::filesystem::path& file)
  -> caf::expected<caf::settings> {
  auto contents = io::read(file);
  if (not contents) {
    return add_context(contents.error(), "failed to read config file {}",
                       file.string());
  }
  auto str = std::string_view{reinterpret_cast<const char*>(contents->data()),
                              contents->size()};
  auto settings = from_yaml(str);
  if (not settings) {
    return add_context(settings.error(), "failed to load config file {}",
                       file.string());
  }
  return settings;
}

auto load_config_files(std::span<const std::filesystem::path> files)
  -> caf::expected<caf::settings> {
  auto result = caf::settings{};
  for (const auto& file : files) {
    auto err = std::error_code{};
    if (not std::filesystem::exists(file, err)) {
      TALLY_DEBUG("skipping missing config file {}", file.string());
      continue;
    }
    auto settings = load_config(file);
    if (not settings) {
      return std::move(settings.error());
    }
    merge_settings(*settings, result);
    TALLY_VERBOSE("loaded config file {}", file.string());
  }
  return result;
}

void merge_settings(const caf::settings& src, caf::settings& dst) {
  for (const auto& [key, value] : src) {
    if (caf::holds_alternative<caf::settings>(value)) {
      merge_settings(caf::get<caf::settings>(value), dst[key].as_dictionary());
    } else {
      dst.insert_or_assign(key, value);
    }
  }
}

auto make_runner_options(const caf::settings& settings)
  -> caf::expected<runner_options> {
  auto result = runner_options{};
  auto continue_on_error
    = read(settings, "tally.runner.continue-on-error",
           result.continue_on_error, "a boolean");
  if (not continue_on_error) {
    return std::move(continue_on_error.error());
  }
  result.continue_on_error = *continue_on_error;
  return result;
}

auto make_profiler_options(const caf::settings& settings)
  -> caf::expected<profiler_options> {
  auto result = profiler_options{};
  auto assign = [&](auto& field, std::string_view key,
                    std::string_view expected) -> caf::error {
    auto value = read(settings, key, field, expected);
    if (not value) {
      return std::move(value.error());
    }
    field = *value;
    return {};
  };
  auto counts = "a non-negative integer";
  if (auto err = assign(result.sample_size, "tally.profiler.sample-size",
                        counts)) {
    return err;
  }
  if (auto err = assign(result.confidence_threshold,
                        "tally.profiler.confidence-threshold", "a number")) {
    return err;
  }
  if (auto err = check_fraction("tally.profiler.confidence-threshold",
                                result.confidence_threshold)) {
    return err;
  }
  if (auto err = assign(result.exact_distinct_threshold,
                        "tally.profiler.exact-distinct-threshold", counts)) {
    return err;
  }
  if (auto err = assign(result.categorical_ceiling,
                        "tally.profiler.categorical-ceiling", counts)) {
    return err;
  }
  if (auto err = assign(result.top_n, "tally.profiler.top-n", counts)) {
    return err;
  }
  if (auto err = assign(result.pattern_sample_size,
                        "tally.profiler.pattern-sample-size", counts)) {
    return err;
  }
  if (auto err = assign(result.hll_precision, "tally.profiler.hll-precision",
                        "an integer in [4, 18]")) {
    return err;
  }
  if (auto err = assign(result.kll_k, "tally.profiler.kll-k",
                        "an integer in [8, 65535]")) {
    return err;
  }
  if (auto err = assign(result.seed, "tally.profiler.seed", counts)) {
    return err;
  }
  return result;
}

auto make_incremental_options(const caf::settings& settings)
  -> caf::expected<incremental_options> {
  auto result = incremental_options{};
  if (const auto* value
      = caf::get_if(&settings, "tally.incremental.on-duplicate")) {
    const auto* str = caf::get_if<std::string>(value);
    auto policy = str ? parse_duplicate_policy(*str) : std::nullopt;
    if (not policy) {
      return invalid("tally.incremental.on-duplicate", *value,
                     "reject or skip");
    }
    result.on_duplicate = *policy;
  }
  auto record_deltas = read(settings, "tally.incremental.record-deltas",
                            result.record_deltas, "a boolean");
  if (not record_deltas) {
    return std::move(record_deltas.error());
  }
  result.record_deltas = *record_deltas;
  auto max_concurrency = read(settings, "tally.incremental.max-concurrency",
                              result.max_concurrency, "a positive integer");
  if (not max_concurrency) {
    return std::move(max_concurrency.error());
  }
  if (*max_concurrency == 0) {
    return caf::make_error(ec::invalid_configuration,
                           "option tally.incremental.max-concurrency must be "
                           "a positive integer, got 0");
  }
  result.max_concurrency = *max_concurrency;
  auto fail_fast = read(settings, "tally.incremental.fail-fast",
                        result.fail_fast, "a boolean");
  if (not fail_fast) {
    return std::move(fail_fast.error());
  }
  result.fail_fast = *fail_fast;
  return result;
}

auto make_detection_options(const caf::settings& settings)
  -> caf::expected<detection_options> {
  auto result = detection_options{};
  auto min_confidence = read(settings, "tally.anomaly.min-confidence",
                             result.min_confidence, "a number");
  if (not min_confidence) {
    return std::move(min_confidence.error());
  }
  if (*min_confidence < 0.0 or *min_confidence > 1.0) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("option tally.anomaly.min-confidence "
                                       "must be in [0, 1], got {}",
                                       *min_confidence));
  }
  result.min_confidence = *min_confidence;
  auto default_days = std::chrono::duration_cast<std::chrono::days>(
                        result.history_window)
                        .count();
  auto days = read(settings, "tally.anomaly.history-window-days",
                   static_cast<int64_t>(default_days), "a positive integer");
  if (not days) {
    return std::move(days.error());
  }
  if (*days <= 0) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("option tally.anomaly.history-window-"
                                       "days must be a positive integer, got "
                                       "{}",
                                       *days));
  }
  result.history_window = std::chrono::days{*days};
  auto store = read(settings, "tally.anomaly.store-current-metrics",
                    result.store_current_metrics, "a boolean");
  if (not store) {
    return std::move(store.error());
  }
  result.store_current_metrics = *store;
  return result;
}

} // namespace tally
