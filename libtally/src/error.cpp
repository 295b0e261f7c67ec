//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/error.hpp"

#include "tally/detail/assert.hpp"

#include <caf/deep_to_string.hpp>
#include <caf/message.hpp>
#include <caf/pec.hpp>
#include <caf/sec.hpp>

#include <iterator>
#include <sstream>
#include <string>

namespace tally {
namespace {

const char* descriptions[] = {
  "no_error",
  "unspecified",
  "data_access_error",
  "state_incompatibility",
  "insufficient_history",
  "partial_profile",
  "store_error",
  "duplicate_metric_key",
  "already_processed",
  "cancelled",
  "type_clash",
  "format_error",
  "lookup_error",
  "logic_error",
  "filesystem_error",
  "invalid_argument",
  "invalid_result",
  "invalid_configuration",
  "serialization_error",
};

static_assert(ec{std::size(descriptions)} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

void render_default_ctx(std::ostringstream& oss, const caf::message& ctx) {
  size_t size = ctx.size();
  if (size > 0) {
    oss << ":";
    for (size_t i = 0; i < size; ++i) {
      oss << ' ';
      if (ctx.match_element<std::string>(i)) {
        oss << ctx.get_as<std::string>(i);
      } else {
        oss << caf::deep_to_string(ctx);
      }
    }
  }
}

} // namespace

auto to_string(ec x) -> const char* {
  auto index = static_cast<size_t>(x);
  TALLY_ASSERT(index < std::size(descriptions));
  return descriptions[index];
}

auto render(const caf::error& err) -> std::string {
  if (not err) {
    return "";
  }
  std::ostringstream oss;
  oss << "!! ";
  switch (err.category()) {
    default:
      oss << "Unknown";
      render_default_ctx(oss, err.context());
      break;
    case caf::type_id_v<tally::ec>: {
      const auto code = static_cast<tally::ec>(err.code());
      oss << to_string(code);
      render_default_ctx(oss, err.context());
      break;
    }
    case caf::type_id_v<caf::pec>:
      oss << to_string(static_cast<caf::pec>(err.code()));
      render_default_ctx(oss, err.context());
      break;
    case caf::type_id_v<caf::sec>:
      oss << to_string(static_cast<caf::sec>(err.code()));
      render_default_ctx(oss, err.context());
      break;
  }
  return std::move(oss).str();
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (not error) {
    return error;
  }
  if (not error.context()) {
    return caf::error{
      error.code(),
      error.category(),
      caf::make_message(std::move(str)),
    };
  }
  return caf::error{
    error.code(),
    error.category(),
    caf::message::concat(caf::make_message(std::move(str)), error.context()),
  };
}

} // namespace tally
