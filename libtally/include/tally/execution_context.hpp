//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/query_engine.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

namespace tally {

/// Everything an analyzer needs to read its input: the engine, the table, and
/// the signals that end a run early.
class execution_context {
public:
  execution_context(const query_engine& engine, std::string table,
                    std::stop_token stop = {},
                    std::optional<time> deadline = std::nullopt)
    : engine_{&engine},
      table_{std::move(table)},
      stop_{std::move(stop)},
      deadline_{deadline} {
    // nop
  }

  auto engine() const -> const query_engine& {
    return *engine_;
  }

  auto table() const -> const std::string& {
    return table_;
  }

  auto stop_token() const -> const std::stop_token& {
    return stop_;
  }

  auto deadline() const -> const std::optional<time>& {
    return deadline_;
  }

  /// Returns whether a stop was requested or the deadline passed.
  auto cancelled() const -> bool {
    if (stop_.stop_requested()) {
      return true;
    }
    return deadline_ and std::chrono::system_clock::now() >= *deadline_;
  }

  /// Returns a copy that reads from another table.
  auto with_table(std::string table) const -> execution_context {
    auto result = *this;
    result.table_ = std::move(table);
    return result;
  }

private:
  const query_engine* engine_;
  std::string table_;
  std::stop_token stop_;
  std::optional<time> deadline_;
};

} // namespace tally
