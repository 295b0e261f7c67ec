//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/config.hpp"
#include "tally/detail/discard.hpp"
#include "tally/error.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>
#include <caf/fwd.hpp>

#include <string>

// TALLY_INFO -> spdlog::info
// TALLY_VERBOSE -> spdlog::debug
// TALLY_DEBUG -> spdlog::trace
// TALLY_TRACE -> spdlog::trace

#if TALLY_LOG_LEVEL == TALLY_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif TALLY_LOG_LEVEL == TALLY_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif TALLY_LOG_LEVEL == TALLY_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif TALLY_LOG_LEVEL == TALLY_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif TALLY_LOG_LEVEL == TALLY_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif TALLY_LOG_LEVEL == TALLY_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif TALLY_LOG_LEVEL == TALLY_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif TALLY_LOG_LEVEL == TALLY_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep that below the log level mapping
#include "tally/detail/logger.hpp"

#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_TRACE

#  define TALLY_TRACE(...)                                                     \
    SPDLOG_LOGGER_TRACE(::tally::detail::logger(), __VA_ARGS__)

#else // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_TRACE

#  define TALLY_TRACE(...) TALLY_DISCARD_ARGS(__VA_ARGS__)

#endif // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_TRACE

#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_DEBUG

#  define TALLY_DEBUG(...)                                                     \
    SPDLOG_LOGGER_TRACE(::tally::detail::logger(), __VA_ARGS__)

#else // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_DEBUG

#  define TALLY_DEBUG(...) TALLY_DISCARD_ARGS(__VA_ARGS__)

#endif // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_DEBUG

#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_VERBOSE

#  define TALLY_VERBOSE(...)                                                   \
    SPDLOG_LOGGER_DEBUG(::tally::detail::logger(), __VA_ARGS__)

#else // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_VERBOSE

#  define TALLY_VERBOSE(...) TALLY_DISCARD_ARGS(__VA_ARGS__)

#endif // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_VERBOSE

#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_INFO

#  define TALLY_INFO(...)                                                      \
    SPDLOG_LOGGER_INFO(::tally::detail::logger(), __VA_ARGS__)

#else // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_INFO

#  define TALLY_INFO(...) TALLY_DISCARD_ARGS(__VA_ARGS__)

#endif // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_INFO

#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_WARNING

#  define TALLY_WARN(...)                                                      \
    SPDLOG_LOGGER_WARN(::tally::detail::logger(), __VA_ARGS__)

#else // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_WARNING

#  define TALLY_WARN(...) TALLY_DISCARD_ARGS(__VA_ARGS__)

#endif // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_WARNING

#if TALLY_LOG_LEVEL >= TALLY_LOG_LEVEL_ERROR

#  define TALLY_ERROR(...)                                                     \
    SPDLOG_LOGGER_ERROR(::tally::detail::logger(), __VA_ARGS__)

#else // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_ERROR

#  define TALLY_ERROR(...) TALLY_DISCARD_ARGS(__VA_ARGS__)

#endif // TALLY_LOG_LEVEL < TALLY_LOG_LEVEL_ERROR

namespace tally {

/// Converts a verbosity to its integer counterpart. For unknown values,
/// the `default_value` parameter will be returned.
/// Used to make log level strings from config, like 'debug', to a log level int.
int loglevel_to_int(std::string c, int default_value = TALLY_LOG_LEVEL_QUIET);

/// Installs the process-wide logger as configured by the `tally.*` logging
/// options and returns a guard that shuts it down again.
[[nodiscard]] caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg_file);

} // namespace tally
