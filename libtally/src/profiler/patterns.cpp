//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/profiler/patterns.hpp"

#include <fmt/format.h>

#include <array>
#include <utility>

namespace tally {

namespace {

using definition = std::pair<std::string_view, std::string_view>;

constexpr auto string_pattern_definitions = std::array<definition, 7>{{
  {"email", R"([A-Za-z0-9._%+\-]+@[A-Za-z0-9.\-]+\.[A-Za-z]{2,})"},
  {"url", R"((?i)(https?|ftp)://[^\s/$.?#][^\s]*)"},
  {"uuid", R"([0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-)"
           R"([0-9a-fA-F]{12})"},
  {"ipv4", R"(((25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)\.){3})"
           R"((25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d))"},
  {"phone", R"(\+?\d{1,3}?[\s.\-]?\(?\d{2,4}\)?[\s.\-]?\d{3,4}[\s.\-]?\d{3,4})"},
  {"iso_date", R"(\d{4}-\d{2}-\d{2})"},
  {"us_date", R"(\d{1,2}/\d{1,2}/\d{4})"},
}};

constexpr auto date_format_definitions = std::array<definition, 4>{{
  {"iso_datetime", R"(\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}(:\d{2}(\.\d+)?)?)"
                   R"((Z|[+\-]\d{2}:?\d{2})?)"},
  {"iso_date", R"(\d{4}-\d{2}-\d{2})"},
  {"us_date", R"(\d{1,2}/\d{1,2}/\d{4})"},
  {"eu_date", R"(\d{1,2}\.\d{1,2}\.\d{4})"},
}};

template <size_t N>
auto compile(const std::array<definition, N>& definitions)
  -> caf::expected<std::vector<named_pattern>> {
  auto result = std::vector<named_pattern>{};
  result.reserve(N);
  for (const auto& [name, regex] : definitions) {
    auto compiled = pattern::make(std::string{regex});
    if (not compiled) {
      return std::move(compiled.error());
    }
    result.push_back({std::string{name}, std::move(*compiled)});
  }
  return result;
}

/// Splits `a<sep>b<sep>c` into three parts.
auto split3(std::string_view value, char separator)
  -> std::optional<std::array<std::string_view, 3>> {
  auto first = value.find(separator);
  if (first == std::string_view::npos) {
    return std::nullopt;
  }
  auto second = value.find(separator, first + 1);
  if (second == std::string_view::npos) {
    return std::nullopt;
  }
  return std::array<std::string_view, 3>{
    value.substr(0, first),
    value.substr(first + 1, second - first - 1),
    value.substr(second + 1),
  };
}

auto pad(std::string_view digits) -> std::string {
  if (digits.size() == 1) {
    return fmt::format("0{}", digits);
  }
  return std::string{digits};
}

} // namespace

auto string_patterns() -> caf::expected<std::vector<named_pattern>> {
  return compile(string_pattern_definitions);
}

auto date_formats() -> caf::expected<std::vector<named_pattern>> {
  return compile(date_format_definitions);
}

auto normalize_date(std::string_view format, std::string_view value)
  -> std::optional<std::string> {
  if (format == "iso_date") {
    return std::string{value};
  }
  if (format == "iso_datetime") {
    // Unify the date-time separator.
    auto result = std::string{value};
    if (result.size() > 10 and result[10] == ' ') {
      result[10] = 'T';
    }
    return result;
  }
  if (format == "us_date") {
    auto parts = split3(value, '/');
    if (not parts) {
      return std::nullopt;
    }
    return fmt::format("{}-{}-{}", (*parts)[2], pad((*parts)[0]),
                       pad((*parts)[1]));
  }
  if (format == "eu_date") {
    auto parts = split3(value, '.');
    if (not parts) {
      return std::nullopt;
    }
    return fmt::format("{}-{}-{}", (*parts)[2], pad((*parts)[1]),
                       pad((*parts)[0]));
  }
  return std::nullopt;
}

} // namespace tally
