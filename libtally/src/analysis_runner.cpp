//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/analysis_runner.hpp"

#include "tally/error.hpp"
#include "tally/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <exception>

namespace tally {

auto analysis_runner::add(erased_analyzer x) -> caf::error {
  auto duplicate
    = std::any_of(analyzers_.begin(), analyzers_.end(), [&](const auto& y) {
        return y.key == x.key;
      });
  if (duplicate) {
    return caf::make_error(ec::duplicate_metric_key,
                           fmt::format("analyzer {} produces the metric {} "
                                       "which is already taken",
                                       x.name, x.key));
  }
  analyzers_.push_back(std::move(x));
  return {};
}

auto analysis_runner::run(const execution_context& ctx) const
  -> caf::expected<analyzer_context> {
  auto result = analyzer_context{run_metadata{
    .table = ctx.table(),
    .start = std::chrono::system_clock::now(),
  }};
  TALLY_VERBOSE("running {} analyzers on table {}", analyzers_.size(),
                ctx.table());
  for (size_t i = 0; i < analyzers_.size(); ++i) {
    const auto& analyzer = analyzers_[i];
    if (ctx.cancelled()) {
      TALLY_INFO("cancelled analysis of table {} with {} of {} analyzers "
                 "remaining",
                 ctx.table(), analyzers_.size() - i, analyzers_.size());
      for (auto j = i; j < analyzers_.size(); ++j) {
        result.add_cancelled(analyzers_[j].key);
      }
      break;
    }
    auto metric = analyzer.run(ctx);
    if (metric) {
      TALLY_DEBUG("computed {} = {}", analyzer.key, *metric);
      result.add_metric(analyzer.key, std::move(*metric));
    } else {
      if (not options_.continue_on_error) {
        return add_context(metric.error(), "analyzer {} failed on {}",
                           analyzer.name, analyzer.key);
      }
      TALLY_WARN("analyzer {} failed to compute {}: {}", analyzer.name,
                 analyzer.key, metric.error());
      result.add_error({analyzer.name, analyzer.key, std::move(metric.error())});
    }
    report_progress(i + 1);
  }
  result.finish(std::chrono::system_clock::now());
  return result;
}

void analysis_runner::report_progress(size_t finished) const {
  if (not progress_) {
    return;
  }
  auto fraction
    = static_cast<double>(finished) / static_cast<double>(analyzers_.size());
  try {
    progress_(fraction);
  } catch (const std::exception& err) {
    TALLY_WARN("progress callback failed: {}", err.what());
  } catch (...) {
    TALLY_WARN("progress callback failed with an unknown exception");
  }
}

} // namespace tally
