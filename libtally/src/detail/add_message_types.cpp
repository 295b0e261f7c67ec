//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/error.hpp"
#include "tally/fwd.hpp"

#include <caf/init_global_meta_objects.hpp>

#include <mutex>

namespace tally::detail {

void add_message_types() {
  // The meta object tables are process-wide.
  static std::once_flag flag;
  std::call_once(flag, [] {
    caf::core::init_global_meta_objects();
    caf::init_global_meta_objects<caf::id_block::tally_types>();
  });
}

} // namespace tally::detail
