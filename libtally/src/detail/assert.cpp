//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/detail/assert.hpp"

#include "tally/config.hpp"
#include "tally/logger.hpp"
#include "tally/panic.hpp"

namespace tally::detail {

void panic_impl(std::string message, std::source_location source) {
  TALLY_ERROR("panic: {}", message);
  TALLY_ERROR("version: {}", TALLY_VERSION);
  TALLY_ERROR("source: {}:{}", source.file_name(), source.line());
  panic_at<1>(source, "{}", std::move(message));
}

[[noreturn]] void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source) {
  auto message = fmt::format("assertion `{}` failed", expr);
  if (not explanation.empty()) {
    message += ": ";
    message += explanation;
  }
  panic_impl(std::move(message), source);
}

} // namespace tally::detail
