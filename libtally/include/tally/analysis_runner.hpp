//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/analyzer.hpp"
#include "tally/analyzer_context.hpp"
#include "tally/defaults.hpp"

#include <caf/expected.hpp>

#include <functional>
#include <vector>

namespace tally {

struct runner_options {
  /// Keep running the remaining analyzers after one failed.
  bool continue_on_error = defaults::runner::continue_on_error;
};

/// Runs a set of analyzers against one table, one after another.
class analysis_runner {
public:
  using progress_callback = std::function<void(double)>;

  explicit analysis_runner(runner_options options = {})
    : options_{options} {
    // nop
  }

  /// Adds an analyzer.
  /// @returns `ec::duplicate_metric_key` if another analyzer produces the
  /// same metric key.
  template <analyzer Analyzer>
  auto add(Analyzer x) -> caf::error {
    return add(erase(std::move(x)));
  }

  auto add(erased_analyzer x) -> caf::error;

  /// Installs a callback that receives the fraction of finished analyzers
  /// after each analyzer.
  void on_progress(progress_callback callback) {
    progress_ = std::move(callback);
  }

  auto size() const -> size_t {
    return analyzers_.size();
  }

  /// Runs all analyzers.
  /// @returns The collected metrics and errors, or the first error if
  /// `continue_on_error` is disabled.
  auto run(const execution_context& ctx) const
    -> caf::expected<analyzer_context>;

private:
  void report_progress(size_t finished) const;

  runner_options options_;
  std::vector<erased_analyzer> analyzers_;
  progress_callback progress_;
};

} // namespace tally
