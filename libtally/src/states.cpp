//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/states.hpp"

#include "tally/detail/assert.hpp"
#include "tally/error.hpp"
#include "tally/fbs/state.hpp"
#include "tally/hash/xxhash.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tally {

namespace {

auto missing(const char* name) -> caf::error {
  return caf::make_error(ec::serialization_error,
                         fmt::format("state table does not hold a {}", name));
}

} // namespace

// -- size_state ---------------------------------------------------------------

auto size_state::merge(const size_state& other) const -> size_state {
  return {count + other.count};
}

auto size_state::to_metric() const -> metric_value {
  return metric_value{count};
}

auto size_state::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  auto table = fbs::state::CreateSize(builder, count);
  return fbs::state::CreateState(builder, fbs::state::Any::Size,
                                 table.Union());
}

auto size_state::unpack(const fbs::state::State& table)
  -> caf::expected<size_state> {
  const auto* x = table.state_as_Size();
  if (not x) {
    return missing("size state");
  }
  return size_state{x->count()};
}

// -- sum_state ----------------------------------------------------------------

auto sum_state::merge(const sum_state& other) const -> sum_state {
  return {sum + other.sum, count + other.count};
}

auto sum_state::to_metric() const -> metric_value {
  return metric_value{sum};
}

auto sum_state::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  auto table = fbs::state::CreateSum(builder, sum, count);
  return fbs::state::CreateState(builder, fbs::state::Any::Sum, table.Union());
}

auto sum_state::unpack(const fbs::state::State& table)
  -> caf::expected<sum_state> {
  const auto* x = table.state_as_Sum();
  if (not x) {
    return missing("sum state");
  }
  return sum_state{x->sum(), x->count()};
}

// -- mean_state ---------------------------------------------------------------

auto mean_state::merge(const mean_state& other) const -> mean_state {
  return {sum + other.sum, count + other.count};
}

auto mean_state::to_metric() const -> metric_value {
  if (count == 0) {
    return metric_value{std::numeric_limits<double>::quiet_NaN()};
  }
  return metric_value{mean()};
}

auto mean_state::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  auto table = fbs::state::CreateMean(builder, sum, count);
  return fbs::state::CreateState(builder, fbs::state::Any::Mean,
                                 table.Union());
}

auto mean_state::unpack(const fbs::state::State& table)
  -> caf::expected<mean_state> {
  const auto* x = table.state_as_Mean();
  if (not x) {
    return missing("mean state");
  }
  return mean_state{x->sum(), x->count()};
}

// -- stddev_state -------------------------------------------------------------

void stddev_state::add(double x) {
  ++count;
  auto delta = x - mean;
  mean += delta / static_cast<double>(count);
  m2 += delta * (x - mean);
}

auto stddev_state::merge(const stddev_state& other) const -> stddev_state {
  if (other.count == 0) {
    return *this;
  }
  if (count == 0) {
    return other;
  }
  auto n_a = static_cast<double>(count);
  auto n_b = static_cast<double>(other.count);
  auto n = n_a + n_b;
  auto delta = other.mean - mean;
  auto result = stddev_state{};
  result.count = count + other.count;
  result.mean = (n_a * mean + n_b * other.mean) / n;
  result.m2 = m2 + other.m2 + delta * delta * n_a * n_b / n;
  return result;
}

auto stddev_state::to_metric() const -> metric_value {
  if (count == 0) {
    return metric_value{std::numeric_limits<double>::quiet_NaN()};
  }
  return metric_value{std::sqrt(variance())};
}

auto stddev_state::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  auto table = fbs::state::CreateStandardDeviation(builder, count, mean, m2);
  return fbs::state::CreateState(builder, fbs::state::Any::StandardDeviation,
                                 table.Union());
}

auto stddev_state::unpack(const fbs::state::State& table)
  -> caf::expected<stddev_state> {
  const auto* x = table.state_as_StandardDeviation();
  if (not x) {
    return missing("standard deviation state");
  }
  return stddev_state{x->count(), x->mean(), x->m2()};
}

// -- min_max_state ------------------------------------------------------------

void min_max_state::add(double x) {
  ++count;
  min = std::min(min, x);
  max = std::max(max, x);
}

auto min_max_state::merge(const min_max_state& other) const -> min_max_state {
  return {
    count + other.count,
    std::min(min, other.min),
    std::max(max, other.max),
  };
}

auto min_max_state::to_metric() const -> metric_value {
  return metric_value{distribution{{{"min", min}, {"max", max}}}};
}

auto min_max_state::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  auto table = fbs::state::CreateMinMax(builder, count, min, max);
  return fbs::state::CreateState(builder, fbs::state::Any::MinMax,
                                 table.Union());
}

auto min_max_state::unpack(const fbs::state::State& table)
  -> caf::expected<min_max_state> {
  const auto* x = table.state_as_MinMax();
  if (not x) {
    return missing("min-max state");
  }
  return min_max_state{x->count(), x->min(), x->max()};
}

// -- completeness_state -------------------------------------------------------

auto completeness_state::merge(const completeness_state& other) const
  -> completeness_state {
  return {total + other.total, non_null + other.non_null};
}

auto completeness_state::to_metric() const -> metric_value {
  if (total == 0) {
    return metric_value{std::numeric_limits<double>::quiet_NaN()};
  }
  return metric_value{static_cast<double>(non_null)
                      / static_cast<double>(total)};
}

auto completeness_state::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  auto table = fbs::state::CreateCompleteness(builder, total, non_null);
  return fbs::state::CreateState(builder, fbs::state::Any::Completeness,
                                 table.Union());
}

auto completeness_state::unpack(const fbs::state::State& table)
  -> caf::expected<completeness_state> {
  const auto* x = table.state_as_Completeness();
  if (not x) {
    return missing("completeness state");
  }
  return completeness_state{x->total(), x->non_null()};
}

// -- distinct_state -----------------------------------------------------------

void distinct_state::add(const cell& x) {
  ++count_;
  digests_.insert(digest(x, seed_));
}

auto distinct_state::compatible_with(const distinct_state& other) const
  -> caf::error {
  if (seed_ != other.seed_) {
    return caf::make_error(ec::state_incompatibility,
                           fmt::format("cannot merge distinct states with "
                                       "seeds {} and {}",
                                       seed_, other.seed_));
  }
  return {};
}

auto distinct_state::merge(const distinct_state& other) const
  -> distinct_state {
  TALLY_ASSERT(seed_ == other.seed_);
  auto result = *this;
  result.count_ += other.count_;
  result.digests_.insert(other.digests_.begin(), other.digests_.end());
  return result;
}

auto distinct_state::to_metric() const -> metric_value {
  return metric_value{distinct()};
}

auto distinct_state::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  // Sorting makes the serialized form independent of the insertion order.
  auto digests = std::vector<uint64_t>(digests_.begin(), digests_.end());
  std::sort(digests.begin(), digests.end());
  auto table = fbs::state::CreateDistinct(builder, seed_, count_,
                                          builder.CreateVector(digests));
  return fbs::state::CreateState(builder, fbs::state::Any::Distinct,
                                 table.Union());
}

auto distinct_state::unpack(const fbs::state::State& table)
  -> caf::expected<distinct_state> {
  const auto* x = table.state_as_Distinct();
  if (not x) {
    return missing("distinct state");
  }
  auto result = distinct_state{x->seed()};
  result.count_ = x->count();
  if (const auto* digests = x->digests()) {
    result.digests_.reserve(digests->size());
    for (auto digest : *digests) {
      result.digests_.insert(digest);
    }
  }
  return result;
}

// -- frequency_state ----------------------------------------------------------

void frequency_state::add(std::string value, uint64_t count) {
  if (count == 0) {
    return;
  }
  total_ += count;
  counts_[std::move(value)] += count;
}

auto frequency_state::entropy() const -> double {
  if (total_ == 0) {
    return 0.0;
  }
  auto n = static_cast<double>(total_);
  auto result = 0.0;
  for (const auto& [_, count] : counts_) {
    auto p = static_cast<double>(count) / n;
    result -= p * std::log2(p);
  }
  return result;
}

auto frequency_state::normalized_entropy() const -> double {
  if (counts_.size() < 2) {
    return 0.0;
  }
  return entropy() / std::log2(static_cast<double>(counts_.size()));
}

auto frequency_state::gini_impurity() const -> double {
  if (total_ == 0) {
    return 0.0;
  }
  auto n = static_cast<double>(total_);
  auto squares = 0.0;
  for (const auto& [_, count] : counts_) {
    auto p = static_cast<double>(count) / n;
    squares += p * p;
  }
  return 1.0 - squares;
}

auto frequency_state::merge(const frequency_state& other) const
  -> frequency_state {
  auto result = *this;
  for (const auto& [value, count] : other.counts_) {
    result.add(value, count);
  }
  return result;
}

auto frequency_state::to_metric() const -> metric_value {
  if (total_ == 0) {
    return metric_value{std::numeric_limits<double>::quiet_NaN()};
  }
  return metric_value{entropy()};
}

auto frequency_state::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  auto sorted = std::vector<std::pair<std::string_view, uint64_t>>(
    counts_.begin(), counts_.end());
  std::sort(sorted.begin(), sorted.end());
  auto entries = std::vector<flatbuffers::Offset<fbs::state::FrequencyEntry>>{};
  entries.reserve(sorted.size());
  for (const auto& [value, count] : sorted) {
    entries.push_back(fbs::state::CreateFrequencyEntry(
      builder, builder.CreateString(value.data(), value.size()), count));
  }
  auto table = fbs::state::CreateFrequencies(builder, total_,
                                             builder.CreateVector(entries));
  return fbs::state::CreateState(builder, fbs::state::Any::Frequencies,
                                 table.Union());
}

auto frequency_state::unpack(const fbs::state::State& table)
  -> caf::expected<frequency_state> {
  const auto* x = table.state_as_Frequencies();
  if (not x) {
    return missing("frequency state");
  }
  auto result = frequency_state{};
  if (const auto* entries = x->entries()) {
    result.counts_.reserve(entries->size());
    for (const auto* entry : *entries) {
      result.add(entry->value()->str(), entry->count());
    }
  }
  if (result.total_ != x->total()) {
    return caf::make_error(ec::serialization_error,
                           fmt::format("frequency state counts {} values but "
                                       "claims {}",
                                       result.total_, x->total()));
  }
  return result;
}

// -- histogram_state ----------------------------------------------------------

histogram_state::histogram_state(double lower, double upper, size_t buckets)
  : lower_{lower}, upper_{upper}, counts_(buckets, uint64_t{0}) {
  // nop
}

auto histogram_state::make(double lower, double upper, size_t buckets)
  -> caf::expected<histogram_state> {
  if (not std::isfinite(lower) or not std::isfinite(upper) or lower >= upper) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("histogram range [{}, {}] must be "
                                       "finite and non-empty",
                                       lower, upper));
  }
  if (buckets == 0 or buckets > defaults::analyzers::max_histogram_buckets) {
    return caf::make_error(ec::invalid_argument,
                           fmt::format("histogram bucket count must be in "
                                       "[1, {}], got {}",
                                       defaults::analyzers::max_histogram_buckets,
                                       buckets));
  }
  return histogram_state{lower, upper, buckets};
}

void histogram_state::add(double x) {
  if (std::isnan(x)) {
    return;
  }
  if (x < lower_) {
    ++underflow_;
    return;
  }
  if (x > upper_) {
    ++overflow_;
    return;
  }
  auto width = (upper_ - lower_) / static_cast<double>(counts_.size());
  auto index = static_cast<size_t>(std::floor((x - lower_) / width));
  ++counts_[std::min(index, counts_.size() - 1)];
}

auto histogram_state::count() const -> uint64_t {
  auto result = underflow_ + overflow_;
  for (auto x : counts_) {
    result += x;
  }
  return result;
}

auto histogram_state::compatible_with(const histogram_state& other) const
  -> caf::error {
  if (lower_ != other.lower_ or upper_ != other.upper_
      or counts_.size() != other.counts_.size()) {
    return caf::make_error(ec::state_incompatibility,
                           fmt::format("cannot merge histograms over [{}, {}] "
                                       "with {} buckets and [{}, {}] with {} "
                                       "buckets",
                                       lower_, upper_, counts_.size(),
                                       other.lower_, other.upper_,
                                       other.counts_.size()));
  }
  return {};
}

auto histogram_state::merge(const histogram_state& other) const
  -> histogram_state {
  TALLY_ASSERT(lower_ == other.lower_ and upper_ == other.upper_
               and counts_.size() == other.counts_.size());
  auto result = *this;
  for (size_t i = 0; i < counts_.size(); ++i) {
    result.counts_[i] += other.counts_[i];
  }
  result.underflow_ += other.underflow_;
  result.overflow_ += other.overflow_;
  return result;
}

auto histogram_state::to_metric() const -> metric_value {
  auto result = distribution{};
  auto n = counts_.size();
  auto width = (upper_ - lower_) / static_cast<double>(n);
  for (size_t i = 0; i < n; ++i) {
    auto lo = lower_ + width * static_cast<double>(i);
    auto name = i + 1 == n
                  ? fmt::format("[{}, {}]", lo, upper_)
                  : fmt::format("[{}, {})", lo,
                                lower_ + width * static_cast<double>(i + 1));
    result.entries.emplace_back(std::move(name),
                                static_cast<double>(counts_[i]));
  }
  result.entries.emplace_back("underflow", static_cast<double>(underflow_));
  result.entries.emplace_back("overflow", static_cast<double>(overflow_));
  return metric_value{std::move(result)};
}

auto histogram_state::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  auto table
    = fbs::state::CreateHistogram(builder, lower_, upper_,
                                  builder.CreateVector(counts_), underflow_,
                                  overflow_);
  return fbs::state::CreateState(builder, fbs::state::Any::Histogram,
                                 table.Union());
}

auto histogram_state::unpack(const fbs::state::State& table)
  -> caf::expected<histogram_state> {
  const auto* x = table.state_as_Histogram();
  if (not x) {
    return missing("histogram state");
  }
  const auto* counts = x->counts();
  auto result = make(x->lower(), x->upper(), counts ? counts->size() : 0);
  if (not result) {
    return caf::make_error(ec::serialization_error,
                           fmt::format("invalid histogram: {}",
                                       render(result.error())));
  }
  std::copy(counts->begin(), counts->end(), result->counts_.begin());
  result->underflow_ = x->underflow();
  result->overflow_ = x->overflow();
  return result;
}

// -- data_type_state ----------------------------------------------------------

namespace {

auto type_index(semantic_type type) -> size_t {
  auto i = std::find(data_type_state::types.begin(),
                     data_type_state::types.end(), type);
  TALLY_ASSERT(i != data_type_state::types.end());
  return static_cast<size_t>(i - data_type_state::types.begin());
}

} // namespace

void data_type_state::add(semantic_type type, uint64_t n) {
  counts[type_index(type)] += n;
}

auto data_type_state::count(semantic_type type) const -> uint64_t {
  return counts[type_index(type)];
}

auto data_type_state::total() const -> uint64_t {
  auto result = uint64_t{0};
  for (auto x : counts) {
    result += x;
  }
  return result;
}

auto data_type_state::consistency() const -> double {
  TALLY_ASSERT(not is_empty());
  auto top = *std::max_element(counts.begin(), counts.end());
  return static_cast<double>(top) / static_cast<double>(total());
}

auto data_type_state::merge(const data_type_state& other) const
  -> data_type_state {
  auto result = *this;
  for (size_t i = 0; i < counts.size(); ++i) {
    result.counts[i] += other.counts[i];
  }
  return result;
}

auto data_type_state::to_metric() const -> metric_value {
  auto result = distribution{};
  for (size_t i = 0; i < types.size(); ++i) {
    result.entries.emplace_back(std::string{to_string(types[i])},
                                static_cast<double>(counts[i]));
  }
  result.entries.emplace_back("consistency",
                              is_empty()
                                ? std::numeric_limits<double>::quiet_NaN()
                                : consistency());
  return metric_value{std::move(result)};
}

auto data_type_state::pack(flatbuffers::FlatBufferBuilder& builder) const
  -> flatbuffers::Offset<fbs::state::State> {
  auto table = fbs::state::CreateDataType(
    builder, builder.CreateVector(counts.data(), counts.size()));
  return fbs::state::CreateState(builder, fbs::state::Any::DataType,
                                 table.Union());
}

auto data_type_state::unpack(const fbs::state::State& table)
  -> caf::expected<data_type_state> {
  const auto* x = table.state_as_DataType();
  if (not x) {
    return missing("data type state");
  }
  const auto* counts = x->counts();
  if (not counts or counts->size() != types.size()) {
    return caf::make_error(ec::serialization_error,
                           fmt::format("data type state must have {} counts",
                                       types.size()));
  }
  auto result = data_type_state{};
  std::copy(counts->begin(), counts->end(), result.counts.begin());
  return result;
}

} // namespace tally
