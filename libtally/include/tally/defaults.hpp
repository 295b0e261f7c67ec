//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tally::defaults {

// -- constants for the logger -------------------------------------------------

namespace logger {

/// Verbosity of the console sink.
inline constexpr std::string_view console_verbosity = "info";

/// Verbosity of the file sink.
inline constexpr std::string_view file_verbosity = "quiet";

/// Path of the log file.
inline constexpr std::string_view log_file = "tally.log";

/// Pattern of console log lines.
inline constexpr std::string_view console_format = "%^[%T.%e] %v%$";

/// Pattern of file log lines.
inline constexpr std::string_view file_format = "[%Y-%m-%dT%T.%e%z] [%l] %v";

/// Queue size of the asynchronous logger.
inline constexpr size_t queue_size = 8'192;

/// Number of threads of the asynchronous logger.
inline constexpr size_t logger_threads = 1;

} // namespace logger

// -- constants for sketches ---------------------------------------------------

namespace sketch {

/// Precision of HyperLogLog estimators, i.e., log2 of the register count.
inline constexpr uint8_t hll_precision = 14;

/// Size parameter of KLL sketches.
inline constexpr uint32_t kll_k = 200;

/// Seed for hashing and random number generation.
inline constexpr uint64_t seed = 0;

} // namespace sketch

// -- constants for analyzers --------------------------------------------------

namespace analyzers {

/// Number of buckets of a numeric histogram.
inline constexpr size_t histogram_buckets = 10;

/// Largest number of buckets of a numeric histogram.
inline constexpr size_t max_histogram_buckets = 1'000;

} // namespace analyzers

// -- constants for the analysis runner ----------------------------------------

namespace runner {

inline constexpr bool continue_on_error = true;

} // namespace runner

// -- constants for the column profiler ----------------------------------------

namespace profiler {

/// Number of values sampled for type inference.
inline constexpr size_t sample_size = 10'000;

/// Share of sampled values a type needs to be accepted.
inline constexpr double confidence_threshold = 0.7;

/// Largest distinct-count estimate for which distinct values are counted
/// exactly.
inline constexpr uint64_t exact_distinct_threshold = 100'000;

/// Largest number of distinct values of a categorical column.
inline constexpr uint64_t categorical_ceiling = 100;

/// Number of buckets in a categorical histogram.
inline constexpr size_t top_n = 20;

/// Number of values sampled for pattern detection.
inline constexpr size_t pattern_sample_size = 1'000;

} // namespace profiler

// -- constants for the incremental runner -------------------------------------

namespace incremental {

/// Number of partitions computed concurrently.
inline constexpr size_t max_concurrency = 4;

inline constexpr bool record_deltas = false;

inline constexpr bool fail_fast = false;

} // namespace incremental

// -- constants for anomaly detection ------------------------------------------

namespace anomaly {

/// Findings below this confidence are discarded.
inline constexpr double min_confidence = 0.5;

/// How far back history is read.
inline constexpr std::chrono::hours history_window = std::chrono::hours{24 * 30};

inline constexpr bool store_current_metrics = true;

/// Threshold of the z-score strategy in standard deviations.
inline constexpr double z_score_threshold = 3.0;

/// Minimum number of historical points for the z-score strategy.
inline constexpr size_t z_score_min_history = 10;

/// Bounds of the in-memory metrics repository.
inline constexpr size_t max_points_per_metric = 10'000;
inline constexpr size_t max_metrics = 1'000;
inline constexpr std::chrono::hours max_age = std::chrono::hours{24 * 30};

} // namespace anomaly

} // namespace tally::defaults
