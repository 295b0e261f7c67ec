//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/logger.hpp"

#include "tally/config.hpp"
#include "tally/defaults.hpp"
#include "tally/detail/assert.hpp"

#include <caf/settings.hpp>
#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <vector>

namespace tally {

caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg_file) {
  if (!tally::detail::setup_spdlog(cfg_file))
    return caf::make_error(ec::invalid_configuration,
                           "failed to set up logging");
  return {caf::detail::make_scope_guard(
    std::addressof(tally::detail::shutdown_spdlog))};
}

/// Convert a log level to an int.
/// @note x is passed by value because it is modified.
int loglevel_to_int(std::string x, int default_value) {
  for (auto& ch : x)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (x == "quiet")
    return TALLY_LOG_LEVEL_QUIET;
  if (x == "error")
    return TALLY_LOG_LEVEL_ERROR;
  if (x == "warning")
    return TALLY_LOG_LEVEL_WARNING;
  if (x == "info")
    return TALLY_LOG_LEVEL_INFO;
  if (x == "verbose")
    return TALLY_LOG_LEVEL_VERBOSE;
  if (x == "debug")
    return TALLY_LOG_LEVEL_DEBUG;
  if (x == "trace")
    return TALLY_LOG_LEVEL_TRACE;
  return default_value;
}

namespace {

/// Converts a tally log level to spdlog level
spdlog::level::level_enum tally_loglevel_to_spd(const int value) {
  spdlog::level::level_enum level = spdlog::level::off;
  switch (value) {
    case TALLY_LOG_LEVEL_QUIET:
      break;
    case TALLY_LOG_LEVEL_CRITICAL:
      level = spdlog::level::critical;
      break;
    case TALLY_LOG_LEVEL_ERROR:
      level = spdlog::level::err;
      break;
    case TALLY_LOG_LEVEL_WARNING:
      level = spdlog::level::warn;
      break;
    case TALLY_LOG_LEVEL_INFO:
      level = spdlog::level::info;
      break;
    case TALLY_LOG_LEVEL_VERBOSE:
      level = spdlog::level::debug;
      break;
    case TALLY_LOG_LEVEL_DEBUG:
      level = spdlog::level::trace;
      break;
    case TALLY_LOG_LEVEL_TRACE:
      level = spdlog::level::trace;
      break;
    default:
      TALLY_ASSERT(false, "unhandled log level");
  }
  return level;
}

/// Reads a verbosity option and validates it.
/// @returns an empty string if the option holds an invalid value.
std::string get_verbosity(const caf::settings& cfg, std::string_view key,
                          std::string_view fallback) {
  auto result = std::string{fallback};
  if (auto value = caf::get_if<std::string>(&cfg, key)) {
    if (loglevel_to_int(*value, -1) < 0) {
      fmt::print(stderr, "failed to start logger; {} '{}' is invalid\n", key,
                 *value);
      return {};
    }
    result = *value;
  }
  return result;
}

} // namespace

namespace detail {

bool setup_spdlog(const caf::settings& cfg_file) try {
  if (tally::detail::logger()->name() != "/dev/null") {
    TALLY_ERROR("Log already up");
    return false;
  }
  auto console_verbosity
    = get_verbosity(cfg_file, "tally.console-verbosity",
                    tally::defaults::logger::console_verbosity);
  auto file_verbosity = get_verbosity(cfg_file, "tally.file-verbosity",
                                      tally::defaults::logger::file_verbosity);
  if (console_verbosity.empty() or file_verbosity.empty())
    return false;
  auto tally_file_verbosity = loglevel_to_int(file_verbosity);
  auto tally_console_verbosity = loglevel_to_int(console_verbosity);
  auto tally_verbosity = std::max(tally_file_verbosity, tally_console_verbosity);
  // Helper to set the color mode
  spdlog::color_mode log_color = [&]() -> spdlog::color_mode {
    auto config_value = caf::get_or(cfg_file, "tally.console", "automatic");
    if (config_value == "automatic")
      return spdlog::color_mode::automatic;
    if (config_value == "always")
      return spdlog::color_mode::always;
    return spdlog::color_mode::never;
  }();
  auto queue_size = caf::get_or(cfg_file, "tally.log-queue-size",
                                defaults::logger::queue_size);
  spdlog::init_thread_pool(queue_size, defaults::logger::logger_threads);
  std::vector<spdlog::sink_ptr> sinks;
  // Add console sink.
  auto console_sink
    = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(log_color);
  auto console_format
    = caf::get_or(cfg_file, "tally.console-format",
                  std::string{defaults::logger::console_format});
  console_sink->set_pattern(console_format);
  console_sink->set_level(tally_loglevel_to_spd(tally_console_verbosity));
  sinks.push_back(console_sink);
  // Add file sink.
  if (tally_file_verbosity != TALLY_LOG_LEVEL_QUIET) {
    auto log_file = caf::get_or(cfg_file, "tally.log-file",
                                std::string{defaults::logger::log_file});
    auto file_sink
      = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    file_sink->set_level(tally_loglevel_to_spd(tally_file_verbosity));
    auto file_format = caf::get_or(cfg_file, "tally.file-format",
                                   std::string{defaults::logger::file_format});
    file_sink->set_pattern(file_format);
    sinks.push_back(file_sink);
  }
  // Replace the /dev/null logger that was created during init.
  logger() = std::make_shared<spdlog::async_logger>(
    "tally", sinks.begin(), sinks.end(), spdlog::thread_pool(),
    spdlog::async_overflow_policy::block);
  logger()->set_level(tally_loglevel_to_spd(tally_verbosity));
  spdlog::register_logger(logger());
  return true;
} catch (const spdlog::spdlog_ex& err) {
  std::cerr << err.what() << "\n";
  return false;
}

void shutdown_spdlog() {
  TALLY_DEBUG("shut down logging");
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& logger() {
  static std::shared_ptr<spdlog::logger> tally_logger
    = spdlog::async_factory::template create<spdlog::sinks::null_sink_mt>(
      "/dev/null");
  return tally_logger;
}

} // namespace detail
} // namespace tally
