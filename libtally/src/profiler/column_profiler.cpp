//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/profiler/column_profiler.hpp"

#include "tally/arrow_utils.hpp"
#include "tally/error.hpp"
#include "tally/logger.hpp"
#include "tally/sketch/hyperloglog.hpp"
#include "tally/sketch/kll.hpp"
#include "tally/sketch/reservoir.hpp"
#include "tally/states.hpp"

#include <arrow/type.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <tsl/robin_map.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>

namespace tally {

namespace {

/// The outcome of the first pass.
struct sample_pass {
  column_kind kind = column_kind::string;
  inferred_type type;
  hyperloglog hll;
  std::vector<std::string> sample;
  uint64_t non_null = 0;
  bool exact = true;
};

constexpr auto quantile_names = std::array<std::pair<std::string_view, double>, 8>{{
  {"p01", 0.01},
  {"p05", 0.05},
  {"p25", 0.25},
  {"p50", 0.50},
  {"p75", 0.75},
  {"p90", 0.90},
  {"p95", 0.95},
  {"p99", 0.99},
}};

auto scan(const execution_context& ctx, const std::string& column)
  -> caf::expected<std::shared_ptr<arrow::ChunkedArray>> {
  return ctx.engine().scan(ctx.table(), column);
}

auto parse_number(std::string_view str) -> std::optional<double> {
  if (str.starts_with('+')) {
    str.remove_prefix(1);
  }
  auto result = 0.0;
  const auto* end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(str.data(), end, result);
  if (ec != std::errc{} or ptr != end) {
    return std::nullopt;
  }
  return result;
}

auto floor_div(int64_t x, int64_t y) -> int64_t {
  auto q = x / y;
  if ((x % y != 0) and ((x < 0) != (y < 0))) {
    --q;
  }
  return q;
}

auto render_date(int64_t days) -> std::string {
  auto ymd = std::chrono::year_month_day{
    std::chrono::sys_days{std::chrono::days{days}}};
  return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()),
                     static_cast<unsigned>(ymd.day()));
}

/// Renders a temporal Arrow value in ISO 8601.
auto render_temporal(int64_t value, const arrow::DataType& type)
  -> std::string {
  switch (type.id()) {
    case arrow::Type::DATE32:
      return render_date(value);
    case arrow::Type::DATE64:
      return render_date(floor_div(value, 86'400'000));
    case arrow::Type::TIMESTAMP: {
      auto divisor = int64_t{1};
      switch (static_cast<const arrow::TimestampType&>(type).unit()) {
        case arrow::TimeUnit::SECOND:
          break;
        case arrow::TimeUnit::MILLI:
          divisor = 1'000;
          break;
        case arrow::TimeUnit::MICRO:
          divisor = 1'000'000;
          break;
        case arrow::TimeUnit::NANO:
          divisor = 1'000'000'000;
          break;
      }
      auto seconds = floor_div(value, divisor);
      auto days = floor_div(seconds, 86'400);
      auto second_of_day = seconds - days * 86'400;
      return fmt::format("{}T{:02}:{:02}:{:02}", render_date(days),
                         second_of_day / 3'600, second_of_day / 60 % 60,
                         second_of_day % 60);
    }
    default:
      return fmt::to_string(value);
  }
}

// -- pass 1 -------------------------------------------------------------------

auto sample_column(const execution_context& ctx, const std::string& column,
                   const profiler_options& options,
                   const type_inference& inference)
  -> caf::expected<sample_pass> {
  auto array = scan(ctx, column);
  if (not array) {
    return std::move(array.error());
  }
  auto kind = classify(*(*array)->type());
  if (not kind) {
    return caf::make_error(ec::data_access_error,
                           fmt::format("column {} has unsupported type {}",
                                       column, (*array)->type()->ToString()));
  }
  auto hll = hyperloglog::make(options.hll_precision, options.seed);
  if (not hll) {
    return std::move(hll.error());
  }
  auto result = sample_pass{};
  result.kind = *kind;
  result.hll = std::move(*hll);
  auto sampler = reservoir_sampler<std::string>{options.sample_size,
                                                options.seed};
  auto err = for_each_cell(**array, [&](const std::optional<cell>& x) {
    if (not x) {
      return;
    }
    ++result.non_null;
    result.hll.add(*x);
    if (const auto* str = std::get_if<std::string_view>(&*x)) {
      sampler.add(std::string{*str});
    }
  });
  if (err) {
    return err;
  }
  auto sample = sampler.sample();
  result.sample.assign(sample.begin(), sample.end());
  if (result.non_null == 0) {
    result.type = {semantic_type::unknown, 0.0};
  } else if (*kind == column_kind::string) {
    result.type = inference.infer(result.sample, options.confidence_threshold);
  } else {
    result.type = {semantic_type_of(*kind), 1.0};
  }
  auto estimate = result.hll.estimate();
  result.exact
    = estimate <= static_cast<double>(options.exact_distinct_threshold);
  TALLY_DEBUG("sampled {} of {} values of column {}, estimated {} distinct "
              "values",
              result.sample.size(), result.non_null, column, estimate);
  return result;
}

// -- pass 2 -------------------------------------------------------------------

auto count_column(const execution_context& ctx, const std::string& column,
                  const sample_pass& first, const profiler_options& options,
                  column_profile& profile) -> caf::error {
  auto request = aggregate_request{
    .column = column,
    .count_distinct = first.exact,
    .min_max = first.kind != column_kind::string,
    .seed = options.seed,
  };
  auto result = ctx.engine().aggregate(ctx.table(), request);
  if (not result) {
    return std::move(result.error());
  }
  profile.row_count = result->row_count;
  profile.null_count = result->null_count;
  profile.null_ratio = result->row_count == 0
                         ? 0.0
                         : static_cast<double>(result->null_count)
                             / static_cast<double>(result->row_count);
  if (first.exact) {
    if (not result->distinct_count) {
      return caf::make_error(ec::data_access_error,
                             fmt::format("query engine did not count distinct "
                                         "values of column {}",
                                         column));
    }
    profile.distinct_count = *result->distinct_count;
    profile.distinct_is_exact = true;
  } else {
    profile.distinct_count
      = static_cast<uint64_t>(std::llround(first.hll.estimate()));
    profile.distinct_is_exact = false;
  }
  auto textual = profile.type == semantic_type::string
                 or profile.type == semantic_type::boolean;
  if (textual and profile.distinct_count <= options.categorical_ceiling) {
    profile.type = semantic_type::categorical;
  }
  return {};
}

// -- pass 3 -------------------------------------------------------------------

auto summarize_numbers(const execution_context& ctx, const std::string& column,
                       column_kind kind, const profiler_options& options)
  -> caf::expected<numeric_summary> {
  auto array = scan(ctx, column);
  if (not array) {
    return std::move(array.error());
  }
  auto sketch = kll_sketch::make(options.kll_k, options.seed);
  if (not sketch) {
    return std::move(sketch.error());
  }
  auto moments = stddev_state{};
  auto err = for_each_cell(**array, [&](const std::optional<cell>& x) {
    if (not x) {
      return;
    }
    auto value = std::optional<double>{};
    if (kind == column_kind::string) {
      value = parse_number(std::get<std::string_view>(*x));
    } else {
      value = as_double(*x);
    }
    if (value and not std::isnan(*value)) {
      sketch->add(*value);
      moments.add(*value);
    }
  });
  if (err) {
    return err;
  }
  if (sketch->is_empty()) {
    return caf::make_error(ec::invalid_result,
                           fmt::format("column {} has no numeric values",
                                       column));
  }
  auto result = numeric_summary{};
  result.mean = moments.mean;
  result.stddev = std::sqrt(moments.variance());
  result.min = sketch->min();
  result.max = sketch->max();
  for (const auto& [name, phi] : quantile_names) {
    result.quantiles.entries.emplace_back(std::string{name},
                                          sketch->quantile(phi));
  }
  auto q1 = sketch->quantile(0.25);
  auto q3 = sketch->quantile(0.75);
  auto iqr = q3 - q1;
  result.lower_fence = q1 - 1.5 * iqr;
  result.upper_fence = q3 + 1.5 * iqr;
  result.has_low_outliers = result.min < result.lower_fence;
  result.has_high_outliers = result.max > result.upper_fence;
  return result;
}

auto summarize_categories(const execution_context& ctx,
                          const std::string& column,
                          const profiler_options& options)
  -> caf::expected<categorical_summary> {
  auto array = scan(ctx, column);
  if (not array) {
    return std::move(array.error());
  }
  auto counts = tsl::robin_map<std::string, uint64_t>{};
  auto total = uint64_t{0};
  auto err = for_each_cell(**array, [&](const std::optional<cell>& x) {
    if (x) {
      ++counts[to_string(*x)];
      ++total;
    }
  });
  if (err) {
    return err;
  }
  auto sorted = std::vector<std::pair<std::string, uint64_t>>{counts.begin(),
                                                              counts.end()};
  std::sort(sorted.begin(), sorted.end(), [](const auto& x, const auto& y) {
    if (x.second != y.second) {
      return x.second > y.second;
    }
    return x.first < y.first;
  });
  auto result = categorical_summary{};
  for (const auto& [value, count] : sorted) {
    auto p = static_cast<double>(count) / static_cast<double>(total);
    result.entropy -= p * std::log2(p);
  }
  auto kept = std::min(sorted.size(), options.top_n);
  for (size_t i = 0; i < sorted.size(); ++i) {
    auto& [value, count] = sorted[i];
    if (i < kept) {
      result.buckets.push_back({
        std::move(value),
        count,
        static_cast<double>(count) / static_cast<double>(total),
      });
    } else {
      result.dropped_count += count;
    }
  }
  result.is_complete = kept == sorted.size();
  return result;
}

auto summarize_strings(const execution_context& ctx, const std::string& column,
                       const std::vector<std::string>& sample,
                       const std::vector<named_pattern>& patterns,
                       const profiler_options& options)
  -> caf::expected<string_summary> {
  auto result = string_summary{};
  auto size = std::min(sample.size(), options.pattern_sample_size);
  result.sample_size = size;
  for (const auto& [name, regex] : patterns) {
    auto count = static_cast<uint64_t>(
      std::count_if(sample.begin(), sample.begin() + size,
                    [&](const std::string& x) {
                      return regex.match(x);
                    }));
    result.patterns.push_back({
      name,
      count,
      size == 0 ? 0.0 : static_cast<double>(count) / static_cast<double>(size),
    });
  }
  auto array = scan(ctx, column);
  if (not array) {
    return std::move(array.error());
  }
  auto lengths = uint64_t{0};
  auto count = uint64_t{0};
  result.min_length = std::numeric_limits<uint64_t>::max();
  auto err = for_each_cell(**array, [&](const std::optional<cell>& x) {
    if (not x) {
      return;
    }
    auto length = to_string(*x).size();
    result.min_length = std::min<uint64_t>(result.min_length, length);
    result.max_length = std::max<uint64_t>(result.max_length, length);
    lengths += length;
    ++count;
  });
  if (err) {
    return err;
  }
  if (count == 0) {
    result.min_length = 0;
  } else {
    result.mean_length
      = static_cast<double>(lengths) / static_cast<double>(count);
  }
  return result;
}

auto summarize_dates(const execution_context& ctx, const std::string& column,
                     column_kind kind,
                     const std::vector<named_pattern>& formats)
  -> caf::expected<temporal_summary> {
  auto array = scan(ctx, column);
  if (not array) {
    return std::move(array.error());
  }
  auto result = temporal_summary{};
  if (kind == column_kind::temporal) {
    auto extremes = std::optional<std::pair<int64_t, int64_t>>{};
    auto err = for_each_cell(**array, [&](const std::optional<cell>& x) {
      if (not x) {
        return;
      }
      auto value = std::get<int64_t>(*x);
      if (not extremes) {
        extremes.emplace(value, value);
      } else {
        extremes->first = std::min(extremes->first, value);
        extremes->second = std::max(extremes->second, value);
      }
    });
    if (err) {
      return err;
    }
    if (not extremes) {
      return caf::make_error(ec::invalid_result,
                             fmt::format("column {} has no values", column));
    }
    const auto& type = *(*array)->type();
    result.earliest = render_temporal(extremes->first, type);
    result.latest = render_temporal(extremes->second, type);
    result.formats.push_back(type.ToString());
    result.format_consistency = 1.0;
    return result;
  }
  auto counts = std::vector<uint64_t>(formats.size(), 0);
  auto total = uint64_t{0};
  auto earliest = std::optional<std::string>{};
  auto latest = std::optional<std::string>{};
  auto err = for_each_cell(**array, [&](const std::optional<cell>& x) {
    if (not x) {
      return;
    }
    ++total;
    auto value = to_string(*x);
    for (size_t i = 0; i < formats.size(); ++i) {
      if (not formats[i].regex.match(value)) {
        continue;
      }
      ++counts[i];
      if (auto normalized = normalize_date(formats[i].name, value)) {
        if (not earliest or *normalized < *earliest) {
          earliest = *normalized;
        }
        if (not latest or *normalized > *latest) {
          latest = std::move(*normalized);
        }
      }
      break;
    }
  });
  if (err) {
    return err;
  }
  if (not earliest) {
    return caf::make_error(ec::invalid_result,
                           fmt::format("column {} has no recognizable dates",
                                       column));
  }
  result.earliest = std::move(*earliest);
  result.latest = std::move(*latest);
  auto order = std::vector<size_t>{};
  for (size_t i = 0; i < formats.size(); ++i) {
    if (counts[i] > 0) {
      order.push_back(i);
    }
  }
  std::stable_sort(order.begin(), order.end(), [&](size_t x, size_t y) {
    return counts[x] > counts[y];
  });
  for (auto i : order) {
    result.formats.push_back(formats[i].name);
  }
  result.format_consistency
    = static_cast<double>(counts[order.front()]) / static_cast<double>(total);
  return result;
}

} // namespace

auto column_profiler::make(profiler_options options)
  -> caf::expected<column_profiler> {
  auto invalid = [](std::string message) {
    return caf::make_error(ec::invalid_configuration, std::move(message));
  };
  if (options.sample_size == 0) {
    return invalid("profiler sample size must be positive");
  }
  if (not(options.confidence_threshold > 0.0
          and options.confidence_threshold <= 1.0)) {
    return invalid(fmt::format("profiler confidence threshold must be in "
                               "(0, 1], got {}",
                               options.confidence_threshold));
  }
  if (options.top_n == 0) {
    return invalid("profiler histogram size must be positive");
  }
  if (auto hll = hyperloglog::make(options.hll_precision, options.seed); not hll) {
    return invalid(render(hll.error()));
  }
  if (auto kll = kll_sketch::make(options.kll_k, options.seed); not kll) {
    return invalid(render(kll.error()));
  }
  auto result = column_profiler{};
  result.options_ = options;
  auto inference = type_inference::make();
  if (not inference) {
    return std::move(inference.error());
  }
  result.inference_ = std::move(*inference);
  auto patterns = string_patterns();
  if (not patterns) {
    return std::move(patterns.error());
  }
  result.patterns_ = std::move(*patterns);
  auto formats = date_formats();
  if (not formats) {
    return std::move(formats.error());
  }
  result.date_formats_ = std::move(*formats);
  return result;
}

auto column_profiler::profile_column(const execution_context& ctx,
                                     const std::string& column) const
  -> caf::expected<column_profile> {
  auto partial = caf::error{};
  auto result = profile(ctx, column, partial);
  if (not result) {
    return std::move(result.error());
  }
  if (partial) {
    return partial;
  }
  return result;
}

auto column_profiler::profile_table(const execution_context& ctx) const
  -> caf::expected<table_profile> {
  auto schema = ctx.engine().schema(ctx.table());
  if (not schema) {
    return std::move(schema.error());
  }
  auto result = table_profile{};
  result.table = ctx.table();
  const auto& fields = (*schema)->fields();
  for (size_t i = 0; i < fields.size(); ++i) {
    const auto& column = fields[i]->name();
    if (ctx.cancelled()) {
      result.errors.push_back(
        {column, caf::make_error(ec::cancelled,
                                 fmt::format("profiling of column {} was "
                                             "cancelled",
                                             column))});
      continue;
    }
    auto partial = caf::error{};
    auto profile = this->profile(ctx, column, partial);
    if (not profile) {
      TALLY_WARN("failed to profile column {} of table {}: {}", column,
                 ctx.table(), profile.error());
      result.errors.push_back({column, std::move(profile.error())});
      continue;
    }
    if (partial) {
      TALLY_WARN("partially profiled column {} of table {}: {}", column,
                 ctx.table(), partial);
      result.errors.push_back({column, std::move(partial)});
    }
    result.columns.push_back(std::move(*profile));
  }
  return result;
}

auto column_profiler::profile(const execution_context& ctx,
                              const std::string& column,
                              caf::error& partial) const
  -> caf::expected<column_profile> {
  auto result = column_profile{};
  result.column = column;
  // Pass 1: sampling, type inference and distinct-count policy.
  auto first = sample_column(ctx, column, options_, inference_);
  if (not first) {
    return add_context(first.error(), "pass 1 failed for column {}", column);
  }
  result.type = first->type.type;
  result.confidence = first->type.confidence;
  result.passes.push_back(1);
  report(1, column,
         fmt::format("inferred type {} with confidence {:.2f}", result.type,
                     result.confidence));
  // Pass 2: counts.
  if (auto err = count_column(ctx, column, *first, options_, result)) {
    return add_context(err, "pass 2 failed for column {}", column);
  }
  result.passes.push_back(2);
  report(2, column,
         fmt::format("counted {} rows with {} nulls and {} distinct values",
                     result.row_count, result.null_count,
                     result.distinct_count));
  // Pass 3: type-specific summaries.
  auto err = caf::error{};
  auto summaries = std::vector<std::string_view>{};
  switch (result.type) {
    case semantic_type::integer:
    case semantic_type::decimal: {
      auto numbers = summarize_numbers(ctx, column, first->kind, options_);
      if (numbers) {
        result.numeric = std::move(*numbers);
      } else {
        err = std::move(numbers.error());
      }
      summaries.push_back("numeric");
      break;
    }
    case semantic_type::categorical:
      break;
    case semantic_type::string: {
      auto strings = summarize_strings(ctx, column, first->sample, patterns_,
                                       options_);
      if (strings) {
        result.strings = std::move(*strings);
      } else {
        err = std::move(strings.error());
      }
      summaries.push_back("string");
      break;
    }
    case semantic_type::date: {
      auto dates = summarize_dates(ctx, column, first->kind, date_formats_);
      if (dates) {
        result.temporal = std::move(*dates);
      } else {
        err = std::move(dates.error());
      }
      summaries.push_back("temporal");
      break;
    }
    case semantic_type::boolean:
    case semantic_type::mixed:
    case semantic_type::unknown:
      break;
  }
  // Every column with few distinct values gets a histogram, whatever its type.
  auto low_cardinality = result.type != semantic_type::unknown
                         and result.distinct_count > 0
                         and result.distinct_count
                               <= options_.categorical_ceiling;
  if (not err and low_cardinality) {
    auto categories = summarize_categories(ctx, column, options_);
    if (categories) {
      result.categorical = std::move(*categories);
    } else {
      err = std::move(categories.error());
    }
    summaries.push_back("categorical");
  }
  if (summaries.empty()) {
    return result;
  }
  if (err) {
    partial = caf::make_error(ec::partial_profile,
                              fmt::format("pass 3 failed for column {}: {}",
                                          column, err));
    return result;
  }
  result.passes.push_back(3);
  report(3, column,
         fmt::format("computed {} summary", fmt::join(summaries, " and ")));
  return result;
}

void column_profiler::report(uint8_t pass, const std::string& column,
                             std::string message) const {
  TALLY_DEBUG("pass {}/{} for column {}: {}", pass, total_passes, column,
              message);
  if (not progress_) {
    return;
  }
  try {
    progress_(profile_progress{pass, total_passes, column, std::move(message)});
  } catch (const std::exception& err) {
    TALLY_WARN("profiler progress callback failed: {}", err.what());
  } catch (...) {
    TALLY_WARN("profiler progress callback failed with an unknown exception");
  }
}

} // namespace tally
