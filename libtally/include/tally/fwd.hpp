//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/config.hpp"

#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <chrono>
#include <cstdint>

#define TALLY_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(tally_types, type)

namespace tally {

// -- enums --------------------------------------------------------------------

enum class ec : uint8_t;
enum class state_kind : uint8_t;
enum class semantic_type : uint8_t;
enum class severity : uint8_t;
enum class run_status : uint8_t;
enum class duplicate_policy : uint8_t;

// -- classes ------------------------------------------------------------------

class analysis_runner;
class analyzer_context;
class any_state;
class anomaly_detector;
class arrow_query_engine;
class blob;
class column_profiler;
class detection_strategy;
class execution_context;
class file_state_store;
class hyperloglog;
class incremental_runner;
class kll_sketch;
class memory_metrics_repository;
class memory_state_store;
class metric_value;
class metrics_repository;
class query_engine;
class state_store;

// -- structs ------------------------------------------------------------------

struct aggregate_request;
struct aggregate_result;
struct anomaly;
struct column_profile;
struct completeness_state;
struct distribution;
struct distinct_state;
struct mean_state;
struct metric_point;
struct min_max_state;
struct persisted_state;
struct sketch_handle;
struct size_state;
struct stddev_state;
struct sum_state;
struct table_profile;

// -- aliases ------------------------------------------------------------------

using time = std::chrono::system_clock::time_point;
using duration = std::chrono::system_clock::duration;

namespace detail {

void add_message_types();

} // namespace detail

} // namespace tally

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_tally_type_id = 800;

CAF_BEGIN_TYPE_ID_BLOCK(tally_types, first_tally_type_id)

  TALLY_ADD_TYPE_ID((tally::ec))

CAF_END_TYPE_ID_BLOCK(tally_types)
