//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/fwd.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace tally::detail {

/// Creates the process-wide logger from the given settings.
/// @returns `false` if the settings are invalid or a logger is already up.
bool setup_spdlog(const caf::settings& cfg_file);

void shutdown_spdlog();

/// Returns the process-wide logger. Until `setup_spdlog` runs, this is a
/// logger that discards everything.
std::shared_ptr<spdlog::logger>& logger();

} // namespace tally::detail
