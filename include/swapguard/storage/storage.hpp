#pragma once
#include <swapguard/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace swapguard::storage {

using key_value_entry_t =
    std::pair<swapguard::schema::bytes_t, swapguard::schema::bytes_t>;

/// One write of an atomic batch. A missing value deletes the key.
using staged_write_t = std::pair<swapguard::schema::bytes_t,
                                 std::optional<swapguard::schema::bytes_t>>;

/// Last committed audit checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t sequence{};
  swapguard::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const swapguard::schema::bytes_view_t& key) const;

  /// Return raw bytes at key, or std::nullopt when missing.
  std::optional<swapguard::schema::bytes_t> get_raw(
      const swapguard::schema::bytes_view_t& key) const;

  /// Apply every write in one atomic batch.
  void write_batch(const std::vector<staged_write_t>& writes) const;

  /// Load the most recent committed checkpoint (sequence + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const swapguard::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace swapguard::storage
