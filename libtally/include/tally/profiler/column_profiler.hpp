//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/defaults.hpp"
#include "tally/execution_context.hpp"
#include "tally/profiler/column_profile.hpp"
#include "tally/profiler/patterns.hpp"
#include "tally/profiler/type_inference.hpp"

#include <caf/expected.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace tally {

struct profiler_options {
  /// Number of values sampled for type inference.
  size_t sample_size = defaults::profiler::sample_size;
  double confidence_threshold = defaults::profiler::confidence_threshold;
  uint64_t exact_distinct_threshold
    = defaults::profiler::exact_distinct_threshold;
  uint64_t categorical_ceiling = defaults::profiler::categorical_ceiling;
  size_t top_n = defaults::profiler::top_n;
  size_t pattern_sample_size = defaults::profiler::pattern_sample_size;
  uint8_t hll_precision = defaults::sketch::hll_precision;
  uint32_t kll_k = defaults::sketch::kll_k;
  uint64_t seed = defaults::sketch::seed;
};

/// A progress notification of the column profiler.
struct profile_progress {
  uint8_t pass = 0;
  uint8_t total = 0;
  std::string column;
  std::string message;
};

/// Profiles columns in three passes.
///
/// 1. A full scan feeds a reservoir sample and a HyperLogLog, from which the
///    semantic type and the distinct-count policy follow.
/// 2. A single aggregate request yields row, null and distinct counts.
/// 3. A type-specific pass computes a numeric distribution, a categorical
///    histogram, a string summary or a temporal summary.
///
/// All randomness is seeded, so profiling the same data twice yields equal
/// profiles.
class column_profiler {
public:
  using progress_callback = std::function<void(const profile_progress&)>;

  static constexpr uint8_t total_passes = 3;

  /// Creates a profiler.
  /// @returns `ec::invalid_configuration` for invalid options.
  static auto make(profiler_options options = {})
    -> caf::expected<column_profiler>;

  void on_progress(progress_callback callback) {
    progress_ = std::move(callback);
  }

  auto options() const -> const profiler_options& {
    return options_;
  }

  /// Profiles a single column.
  /// @returns `ec::partial_profile` if the type-specific pass failed.
  auto profile_column(const execution_context& ctx,
                      const std::string& column) const
    -> caf::expected<column_profile>;

  /// Profiles every column of the context's table. Failures are recorded per
  /// column and do not affect other columns.
  auto profile_table(const execution_context& ctx) const
    -> caf::expected<table_profile>;

private:
  column_profiler() = default;

  /// Runs all passes. A failure of the type-specific pass is stored in
  /// *partial* while the profile of the first two passes is returned.
  auto profile(const execution_context& ctx, const std::string& column,
               caf::error& partial) const -> caf::expected<column_profile>;

  void report(uint8_t pass, const std::string& column,
              std::string message) const;

  profiler_options options_;
  type_inference inference_;
  std::vector<named_pattern> patterns_;
  std::vector<named_pattern> date_formats_;
  progress_callback progress_;
};

} // namespace tally
