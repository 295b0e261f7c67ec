//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2025 The Tally Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "tally/incremental/state_store.hpp"

#include "tally/detail/assert.hpp"
#include "tally/error.hpp"
#include "tally/fbs/state.hpp"
#include "tally/flatbuffer.hpp"
#include "tally/io/read.hpp"
#include "tally/io/save.hpp"
#include "tally/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace tally {

namespace {

constexpr auto state_file_extension = std::string_view{".state"};

/// Escapes every character of a key that is not alphanumeric, `-` or `_`.
auto encode_key(std::string_view key) -> std::string {
  auto result = std::string{};
  result.reserve(key.size());
  for (auto c : key) {
    if (std::isalnum(static_cast<unsigned char>(c)) or c == '-' or c == '_') {
      result += c;
    } else {
      result += fmt::format("%{:02X}", static_cast<unsigned char>(c));
    }
  }
  return result;
}

auto decode_key(std::string_view str) -> std::optional<std::string> {
  auto result = std::string{};
  result.reserve(str.size());
  for (size_t i = 0; i < str.size(); ++i) {
    if (str[i] != '%') {
      result += str[i];
      continue;
    }
    if (i + 2 >= str.size()) {
      return std::nullopt;
    }
    auto hex = std::string{str.substr(i + 1, 2)};
    auto* end = static_cast<char*>(nullptr);
    auto value = std::strtoul(hex.c_str(), &end, 16);
    if (end != hex.c_str() + 2) {
      return std::nullopt;
    }
    result += static_cast<char>(value);
    i += 2;
  }
  return result;
}

auto store_error(const caf::error& err, std::string_view action,
                 std::string_view key) -> caf::error {
  return caf::make_error(ec::store_error,
                         fmt::format("failed to {} state of {}: {}", action,
                                     key, err));
}

} // namespace

auto encode(const state_map& states) -> blob {
  auto builder = flatbuffers::FlatBufferBuilder{};
  auto entries = std::vector<flatbuffers::Offset<fbs::state::Entry>>{};
  entries.reserve(states.size());
  for (const auto& [key, state] : states) {
    auto payload = state.payload.as_uint8();
    entries.push_back(fbs::state::CreateEntry(
      builder, builder.CreateString(key), builder.CreateString(state.kind),
      state.partitions, builder.CreateVector(payload.data(), payload.size())));
  }
  auto root
    = fbs::state::CreateStateMap(builder, builder.CreateVector(entries));
  fbs::state::FinishStateMapBuffer(builder, root);
  return release(builder);
}

auto decode(std::span<const std::byte> bytes) -> caf::expected<state_map> {
  auto root = verified_root<fbs::state::StateMap>(
    bytes, fbs::state::StateMapIdentifier());
  if (not root) {
    return std::move(root.error());
  }
  auto result = state_map{};
  if (const auto* entries = (*root)->entries()) {
    for (const auto* entry : *entries) {
      auto state = persisted_state{};
      state.kind = entry->kind()->str();
      state.partitions = entry->partitions();
      if (const auto* payload = entry->payload()) {
        state.payload
          = blob{std::span<const uint8_t>{payload->data(), payload->size()}};
      }
      result.insert_or_assign(entry->key()->str(), std::move(state));
    }
  }
  return result;
}

// -- state_store --------------------------------------------------------------

auto state_store::lock(const std::string& key) -> key_lock {
  auto* entry = static_cast<lock_entry*>(nullptr);
  {
    auto guard = std::lock_guard{locks_mutex_};
    // Map nodes are stable, and the entry lives as long as it has users.
    entry = &locks_[key];
    ++entry->users;
  }
  entry->mutex.lock();
  return key_lock{this, key};
}

auto state_store::lock_count() const -> size_t {
  auto guard = std::lock_guard{locks_mutex_};
  return locks_.size();
}

void state_store::unlock(const std::string& key) noexcept {
  auto guard = std::lock_guard{locks_mutex_};
  auto it = locks_.find(key);
  TALLY_ASSERT(it != locks_.end());
  it->second.mutex.unlock();
  if (--it->second.users == 0) {
    locks_.erase(it);
  }
}

// -- key_lock -----------------------------------------------------------------

key_lock::key_lock(state_store* store, std::string key)
  : store_{store}, key_{std::move(key)} {
  // nop
}

key_lock::key_lock(key_lock&& other) noexcept
  : store_{std::exchange(other.store_, nullptr)},
    key_{std::move(other.key_)} {
  // nop
}

auto key_lock::operator=(key_lock&& other) noexcept -> key_lock& {
  if (this != &other) {
    unlock();
    store_ = std::exchange(other.store_, nullptr);
    key_ = std::move(other.key_);
  }
  return *this;
}

key_lock::~key_lock() noexcept {
  unlock();
}

void key_lock::unlock() noexcept {
  if (store_ != nullptr) {
    std::exchange(store_, nullptr)->unlock(key_);
  }
}

// -- memory_state_store -------------------------------------------------------

auto memory_state_store::save_state(const std::string& key,
                                    const state_map& states) -> caf::error {
  auto guard = std::lock_guard{mutex_};
  states_.insert_or_assign(key, states);
  return {};
}

auto memory_state_store::load_state(const std::string& key) const
  -> caf::expected<std::optional<state_map>> {
  auto guard = std::lock_guard{mutex_};
  auto it = states_.find(key);
  if (it == states_.end()) {
    return std::optional<state_map>{};
  }
  return std::optional<state_map>{it->second};
}

auto memory_state_store::list_partitions() const
  -> caf::expected<std::vector<std::string>> {
  auto guard = std::lock_guard{mutex_};
  auto result = std::vector<std::string>{};
  result.reserve(states_.size());
  for (const auto& [key, _] : states_) {
    result.push_back(key);
  }
  return result;
}

auto memory_state_store::delete_state(const std::string& key) -> caf::error {
  auto guard = std::lock_guard{mutex_};
  states_.erase(key);
  return {};
}

// -- file_state_store ---------------------------------------------------------

file_state_store::file_state_store(std::filesystem::path root)
  : root_{std::move(root)} {
  // nop
}

auto file_state_store::path_of(const std::string& key) const
  -> std::filesystem::path {
  return root_ / fmt::format("{}{}", encode_key(key), state_file_extension);
}

auto file_state_store::save_state(const std::string& key,
                                  const state_map& states) -> caf::error {
  auto bytes = encode(states);
  if (auto err = io::save(path_of(key), bytes)) {
    return store_error(err, "save", key);
  }
  TALLY_DEBUG("saved {} entries for {} to {}", states.size(), key,
              path_of(key).string());
  return {};
}

auto file_state_store::load_state(const std::string& key) const
  -> caf::expected<std::optional<state_map>> {
  auto path = path_of(key);
  auto err = std::error_code{};
  if (not std::filesystem::exists(path, err)) {
    if (err) {
      return store_error(caf::make_error(ec::filesystem_error, err.message()),
                         "load", key);
    }
    return std::optional<state_map>{};
  }
  auto bytes = io::read(path);
  if (not bytes) {
    return store_error(bytes.error(), "load", key);
  }
  auto result = decode(*bytes);
  if (not result) {
    return store_error(result.error(), "load", key);
  }
  return std::optional<state_map>{std::move(*result)};
}

auto file_state_store::list_partitions() const
  -> caf::expected<std::vector<std::string>> {
  auto result = std::vector<std::string>{};
  auto err = std::error_code{};
  if (not std::filesystem::exists(root_, err)) {
    return result;
  }
  for (auto it = std::filesystem::directory_iterator{root_, err};
       it != std::filesystem::directory_iterator{}; it.increment(err)) {
    if (err) {
      break;
    }
    const auto& path = it->path();
    if (path.extension().string() != state_file_extension) {
      continue;
    }
    if (auto key = decode_key(path.stem().string())) {
      result.push_back(std::move(*key));
    } else {
      TALLY_WARN("ignoring state file with malformed name {}", path.string());
    }
  }
  if (err) {
    return caf::make_error(ec::store_error,
                           fmt::format("failed to list {}: {}", root_.string(),
                                       err.message()));
  }
  std::sort(result.begin(), result.end());
  return result;
}

auto file_state_store::delete_state(const std::string& key) -> caf::error {
  auto err = std::error_code{};
  std::filesystem::remove(path_of(key), err);
  if (err) {
    return caf::make_error(ec::store_error,
                           fmt::format("failed to delete state of {}: {}", key,
                                       err.message()));
  }
  return {};
}

} // namespace tally
