#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <swapguard/common/critical.hpp>
#include <swapguard/schema/encoding/scale/encoder.hpp>
#include <swapguard/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>
#include <tuple>

namespace swapguard::storage {

namespace detail {

using encoder_t = swapguard::schema::encoding::encoder<
    swapguard::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED"};

inline swapguard::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const swapguard::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const swapguard::schema::bytes_view_t& key) const;

  std::optional<swapguard::schema::bytes_t> get_raw(
      const swapguard::schema::bytes_view_t& key) const;
  void write_batch(const std::vector<staged_write_t>& writes) const;
  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const swapguard::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

/// Encode a checkpoint as the value stored under the committed-state key.
inline staged_write_t make_committed_state_write(const committed_state& state) {
  auto encoder = detail::encoder_t{};
  return staged_write_t{
      swapguard::schema::make_bytes(detail::kCommittedStateKey),
      encoder.encode(std::tuple{state.sequence, state.state_root})};
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const swapguard::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      swapguard::schema::bytes_view_t{raw->data(), raw->size()})};
}

inline std::optional<swapguard::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const swapguard::schema::bytes_view_t& key) const {
  if (!database) {
    swapguard::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    swapguard::common::critical("Failed to get value from RocksDB");
  }
  return swapguard::schema::bytes_t(std::begin(value), std::end(value));
}

inline void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<staged_write_t>& writes) const {
  if (!database) {
    swapguard::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice = detail::to_slice(
        swapguard::schema::bytes_view_t{key.data(), key.size()});
    auto status =
        value ? batch.Put(key_slice,
                          detail::to_slice(swapguard::schema::bytes_view_t{
                              value->data(), value->size()}))
              : batch.Delete(key_slice);
    if (!status.ok()) {
      swapguard::common::critical("failed staging key in write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    swapguard::common::critical("failed to commit write batch");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(swapguard::schema::make_bytes_view(
      detail::kCommittedStateKey));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, swapguard::schema::hash32_t>>(
          swapguard::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    swapguard::common::critical("failed to decode committed state");
  }
  return committed_state{.sequence = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const swapguard::schema::bytes_view_t& prefix) const {
  if (!database) {
    swapguard::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

}  // namespace swapguard::storage
