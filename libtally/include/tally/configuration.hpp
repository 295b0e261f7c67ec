//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/analysis_runner.hpp"
#include "tally/anomaly/anomaly_detector.hpp"
#include "tally/incremental/incremental_runner.hpp"
#include "tally/profiler/column_profiler.hpp"

#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <filesystem>
#include <span>
#include <string_view>

namespace tally {

/// Parses a YAML document into settings. Maps become nested dictionaries and
/// unquoted scalars are read as booleans, integers or reals where possible.
auto from_yaml(std::string_view str) -> caf::expected<caf::settings>;

/// Loads a YAML configuration file.
auto load_config(const std::filesystem::path& file)
  -> caf::expected<caf::settings>;

/// Loads and merges configuration files. Later files take precedence, and
/// files that do not exist are skipped.
auto load_config_files(std::span<const std::filesystem::path> files)
  -> caf::expected<caf::settings>;

/// Merges *src* into *dst*, recursing into dictionaries.
void merge_settings(const caf::settings& src, caf::settings& dst);

// -- typed options ------------------------------------------------------------
// The following functions read the options below `tally.` and return
// `ec::invalid_configuration` for values of the wrong type or range.

auto make_runner_options(const caf::settings& settings)
  -> caf::expected<runner_options>;

auto make_profiler_options(const caf::settings& settings)
  -> caf::expected<profiler_options>;

auto make_incremental_options(const caf::settings& settings)
  -> caf::expected<incremental_options>;

auto make_detection_options(const caf::settings& settings)
  -> caf::expected<detection_options>;

} // namespace tally
