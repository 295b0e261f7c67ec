//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/incremental/state_store.hpp"

#include "tally/error.hpp"
#include "tally/io/save.hpp"
#include "tally/test/test.hpp"

#include <fmt/format.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>

using namespace tally;

namespace {

auto make_entry(std::string kind, uint64_t partitions,
                std::initializer_list<std::byte> payload) -> persisted_state {
  auto result = persisted_state{};
  result.kind = std::move(kind);
  result.partitions = partitions;
  result.payload = blob(payload);
  return result;
}

auto example_states() -> state_map {
  auto result = state_map{};
  result.emplace("size", make_entry("size", 2, {std::byte{1}, std::byte{2}}));
  result.emplace("@processed", make_entry("partition_set", 2, {}));
  return result;
}

/// Runs the same checks against every store implementation.
void check_store(state_store& store) {
  MESSAGE("loading a missing key yields nothing");
  auto missing = unbox(store.load_state("orders"));
  CHECK(not missing);
  MESSAGE("saved states load back");
  REQUIRE_SUCCESS(store.save_state("orders", example_states()));
  auto loaded = unbox(store.load_state("orders"));
  REQUIRE(loaded);
  CHECK(*loaded == example_states());
  MESSAGE("saving replaces previous states");
  auto replacement = state_map{};
  replacement.emplace("mean.price", make_entry("mean", 1, {std::byte{3}}));
  REQUIRE_SUCCESS(store.save_state("orders", replacement));
  CHECK(unbox(store.load_state("orders")) == replacement);
  MESSAGE("keys are listed in ascending order");
  REQUIRE_SUCCESS(store.save_state("b", {}));
  REQUIRE_SUCCESS(store.save_state("orders/2024-01-01", example_states()));
  REQUIRE_SUCCESS(store.save_state("a", {}));
  CHECK_EQUAL(unbox(store.list_partitions()),
              (std::vector<std::string>{"a", "b", "orders",
                                        "orders/2024-01-01"}));
  MESSAGE("deleting removes a key and tolerates missing keys");
  REQUIRE_SUCCESS(store.delete_state("b"));
  CHECK_SUCCESS(store.delete_state("b"));
  CHECK(not unbox(store.load_state("b")));
  CHECK_EQUAL(unbox(store.list_partitions()).size(), 3u);
  MESSAGE("locks are exclusive per key");
  auto guard = store.lock("orders");
  CHECK(guard.owns_lock());
  auto other = store.lock("a");
  CHECK(other.owns_lock());
  CHECK_EQUAL(store.lock_count(), 2u);
}

struct fixture {
  fixture()
    : directory{std::filesystem::temp_directory_path()
                / "tally-state-store-test"} {
    std::filesystem::remove_all(directory);
  }

  ~fixture() {
    auto err = std::error_code{};
    std::filesystem::remove_all(directory, err);
  }

  std::filesystem::path directory;
};

} // namespace

TEST("state map encoding") {
  auto states = example_states();
  auto decoded = unbox(decode(encode(states)));
  CHECK(decoded == states);
  CHECK(unbox(decode(encode(state_map{}))).empty());
  auto garbage = blob(32, std::byte{0x7f});
  auto result = decode(garbage);
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::serialization_error);
}

TEST("memory state store") {
  auto store = memory_state_store{};
  check_store(store);
}

TEST("released locks are forgotten") {
  auto store = memory_state_store{};
  for (auto i = 0; i < 100; ++i) {
    auto guard = store.lock(fmt::format("partition-{}", i));
    CHECK(guard.owns_lock());
  }
  CHECK_EQUAL(store.lock_count(), 0u);
  auto guard = store.lock("orders");
  auto moved = std::move(guard);
  CHECK(not guard.owns_lock());
  CHECK(moved.owns_lock());
  CHECK_EQUAL(store.lock_count(), 1u);
  moved.unlock();
  CHECK(not moved.owns_lock());
  CHECK_EQUAL(store.lock_count(), 0u);
  MESSAGE("a waiting writer acquires the key after the holder releases it");
  auto holder = store.lock("orders");
  auto acquired = std::atomic<bool>{false};
  auto waiter = std::thread{[&] {
    auto lock = store.lock("orders");
    acquired = true;
  }};
  CHECK(not acquired);
  holder.unlock();
  waiter.join();
  CHECK(acquired);
  CHECK_EQUAL(store.lock_count(), 0u);
}

WITH_FIXTURE(fixture) {

TEST("file state store") {
  auto store = file_state_store{directory / "states"};
  MESSAGE("listing a store without a directory yields nothing");
  CHECK(unbox(store.list_partitions()).empty());
  check_store(store);
}

TEST("file state store key encoding") {
  auto store = file_state_store{directory};
  CHECK_EQUAL(store.path_of("orders/2024-01-01").filename().string(),
              "orders%2F2024-01-01.state");
  CHECK_EQUAL(store.path_of("mean.price").filename().string(),
              "mean%2Eprice.state");
  REQUIRE_SUCCESS(store.save_state("a b/c", example_states()));
  CHECK(std::filesystem::exists(store.path_of("a b/c")));
  CHECK_EQUAL(unbox(store.list_partitions()),
              (std::vector<std::string>{"a b/c"}));
}

TEST("file state store ignores foreign files") {
  auto store = file_state_store{directory};
  REQUIRE_SUCCESS(store.save_state("orders", example_states()));
  auto bytes = blob{std::byte{0}};
  REQUIRE_SUCCESS(io::save(directory / "notes.txt", bytes));
  REQUIRE_SUCCESS(io::save(directory / "bad%Z.state", bytes));
  CHECK_EQUAL(unbox(store.list_partitions()),
              (std::vector<std::string>{"orders"}));
}

TEST("file state store with corrupt files") {
  auto store = file_state_store{directory};
  auto garbage = blob(64, std::byte{0x2a});
  REQUIRE_SUCCESS(io::save(store.path_of("orders"), garbage));
  auto result = store.load_state("orders");
  REQUIRE(not result);
  CHECK_EQUAL(result.error(), ec::store_error);
}

} // WITH_FIXTURE(fixture)
