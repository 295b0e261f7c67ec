//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/error.hpp"

#include "tally/test/test.hpp"

#include <string>

using namespace tally;

TEST("error code names") {
  CHECK_EQUAL(std::string{to_string(ec::store_error)}, "store_error");
  CHECK_EQUAL(std::string{to_string(ec::insufficient_history)},
              "insufficient_history");
  CHECK_EQUAL(std::string{to_string(ec::serialization_error)},
              "serialization_error");
}

TEST("rendering errors") {
  CHECK_EQUAL(render(caf::error{}), "");
  auto err = caf::make_error(ec::lookup_error, "no such metric");
  CHECK_EQUAL(render(err), "!! lookup_error: no such metric");
  CHECK_EQUAL(fmt::format("{}", err), "!! lookup_error: no such metric");
}

TEST("adding context to errors") {
  auto err = caf::make_error(ec::store_error, "disk full");
  auto with_context = add_context(err, "failed to persist series {}", "orders");
  CHECK(with_context == ec::store_error);
  CHECK_EQUAL(render(with_context),
              "!! store_error: failed to persist series orders disk full");
  MESSAGE("context on a non-error is a no-op");
  CHECK(not add_context(caf::error{}, "ignored"));
}
