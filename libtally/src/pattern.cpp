//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/pattern.hpp"

#include "tally/error.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

namespace tally {

struct regex_impl : re2::RE2 {
  using RE2::RE2;
};

auto pattern::make(std::string str, pattern_options options)
  -> caf::expected<pattern> {
  auto opts = re2::RE2::Options(re2::RE2::CannedOptions::Quiet);
  opts.set_case_sensitive(not options.case_insensitive);
  auto result = pattern{};
  result.str_ = std::move(str);
  result.options_ = options;
  auto regex = std::make_shared<regex_impl>(result.str_, opts);
  if (not regex->ok()) {
    return caf::make_error(ec::format_error,
                           fmt::format("failed to create regex from `{}`: {}",
                                       result.str_, regex->error()));
  }
  result.regex_ = std::move(regex);
  return result;
}

auto pattern::match(std::string_view str) const -> bool {
  if (not regex_) {
    return false;
  }
  return re2::RE2::FullMatch(str, *regex_);
}

auto pattern::search(std::string_view str) const -> bool {
  if (not regex_) {
    return false;
  }
  return re2::RE2::PartialMatch(str, *regex_);
}

auto pattern::string() const -> const std::string& {
  return str_;
}

auto pattern::options() const -> const pattern_options& {
  return options_;
}

} // namespace tally
