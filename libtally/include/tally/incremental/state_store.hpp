//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "tally/fwd.hpp"

#include "tally/blob.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tally {

/// A serialized entry of a state map.
struct persisted_state {
  /// The state kind as returned by `to_string(state_kind)`, or another kind
  /// for entries that are not analyzer states.
  std::string kind;
  /// The number of partitions merged into the state.
  uint64_t partitions = 0;
  blob payload;

  friend auto operator==(const persisted_state&, const persisted_state&)
    -> bool
    = default;
};

/// Persisted entries by key.
using state_map = std::map<std::string, persisted_state>;

/// Encodes a state map as a FlatBuffers `StateMap`.
auto encode(const state_map& states) -> blob;

/// Decodes a buffer created by `encode`.
/// @returns `ec::serialization_error` for malformed input.
auto decode(std::span<const std::byte> bytes) -> caf::expected<state_map>;

class state_store;

/// The exclusive lock of one key of a state store. Releases the key on
/// destruction.
class key_lock {
public:
  key_lock() = default;

  key_lock(key_lock&& other) noexcept;

  auto operator=(key_lock&& other) noexcept -> key_lock&;

  ~key_lock() noexcept;

  auto owns_lock() const -> bool {
    return store_ != nullptr;
  }

  /// Releases the key early.
  void unlock() noexcept;

private:
  friend class state_store;

  key_lock(state_store* store, std::string key);

  state_store* store_ = nullptr;
  std::string key_;
};

/// A key-value store for state maps.
///
/// Stores provide exclusive per-key locks. A writer that holds the lock of a
/// key can read, modify and write the state map of that key without
/// interference from other writers.
class state_store {
public:
  virtual ~state_store() noexcept = default;

  /// Replaces the state map of a key.
  virtual auto save_state(const std::string& key, const state_map& states)
    -> caf::error
    = 0;

  /// Loads the state map of a key.
  /// @returns `std::nullopt` if the key does not exist.
  virtual auto load_state(const std::string& key) const
    -> caf::expected<std::optional<state_map>>
    = 0;

  /// Lists all keys in ascending order.
  virtual auto list_partitions() const
    -> caf::expected<std::vector<std::string>>
    = 0;

  /// Deletes the state map of a key. Deleting a missing key is not an error.
  virtual auto delete_state(const std::string& key) -> caf::error = 0;

  /// Acquires the exclusive lock of a key.
  [[nodiscard]] auto lock(const std::string& key) -> key_lock;

  /// Returns the number of keys that are locked or awaited.
  auto lock_count() const -> size_t;

private:
  friend class key_lock;

  struct lock_entry {
    std::mutex mutex;
    /// The number of holders and waiters.
    size_t users = 0;
  };

  void unlock(const std::string& key) noexcept;

  mutable std::mutex locks_mutex_;
  std::map<std::string, lock_entry> locks_;
};

/// A state store that keeps state maps in memory.
class memory_state_store : public state_store {
public:
  auto save_state(const std::string& key, const state_map& states)
    -> caf::error override;

  auto load_state(const std::string& key) const
    -> caf::expected<std::optional<state_map>> override;

  auto list_partitions() const
    -> caf::expected<std::vector<std::string>> override;

  auto delete_state(const std::string& key) -> caf::error override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, state_map> states_;
};

/// A state store that writes one FlatBuffers file per key into a directory.
/// Writes go to a temporary file that replaces the previous file atomically.
class file_state_store : public state_store {
public:
  explicit file_state_store(std::filesystem::path root);

  auto root() const -> const std::filesystem::path& {
    return root_;
  }

  auto save_state(const std::string& key, const state_map& states)
    -> caf::error override;

  auto load_state(const std::string& key) const
    -> caf::expected<std::optional<state_map>> override;

  auto list_partitions() const
    -> caf::expected<std::vector<std::string>> override;

  auto delete_state(const std::string& key) -> caf::error override;

  /// Returns the file that holds the state map of a key.
  auto path_of(const std::string& key) const -> std::filesystem::path;

private:
  std::filesystem::path root_;
};

} // namespace tally
