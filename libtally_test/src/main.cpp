//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/fwd.hpp"
#include "tally/error.hpp"
#include "tally/logger.hpp"
#include "tally/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace caf::test {

int main(int, char**);

} // namespace caf::test

namespace tally::test {

extern std::set<std::string> config;

} // namespace tally::test

namespace {

// Retrieves arguments after the '--' delimiter.
std::vector<std::string> get_test_args(int argc, const char* const* argv) {
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  auto args_start = std::find(start, end, delimiter);
  if (args_start == end) {
    return {};
  }
  return {args_start + 1, end};
}

} // namespace

int main(int argc, char** argv) {
  std::string tally_loglevel = "quiet";
  auto test_args = get_test_args(argc, argv);
  if (not test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(tally_loglevel, "tally-verbosity",
                          "console verbosity for libtally")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return EXIT_FAILURE;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return EXIT_SUCCESS;
    }
    tally::test::config = {
      std::make_move_iterator(std::begin(test_args)),
      std::make_move_iterator(std::end(test_args)),
    };
  }
  tally::detail::add_message_types();
  caf::settings log_settings;
  put(log_settings, "tally.console-verbosity", tally_loglevel);
  put(log_settings, "tally.console-format", "%^[%s:%#] %v%$");
  auto log_context = tally::create_log_context(log_settings);
  if (not log_context) {
    std::cerr << "failed to set up logging: "
              << tally::render(log_context.error()) << std::endl;
    return EXIT_FAILURE;
  }
  // Run the unit tests.
  auto result = caf::test::main(argc, argv);
  return result;
}
