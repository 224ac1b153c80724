#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <ballot/common/critical.hpp>
#include <ballot/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace ballot::storage {

namespace detail {

inline ballot::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const ballot::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

/// RocksDB-backed governance store. Every write is synced, so a committed
/// vote, queue or execution survives a crash.

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const ballot::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const ballot::schema::bytes_view_t& key,
           const T& value) const;

  void write_batch(const std::vector<key_value_entry_t>& puts,
                   const std::vector<ballot::schema::bytes_t>& deletes) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const ballot::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const ballot::schema::bytes_view_t& key) const {
  if (!database) {
    ballot::common::critical("Governance store used before it was opened");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    ballot::common::critical("Governance store read failed: {}",
                             status.ToString());
  }
  return {encoder.template decode<T>(ballot::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const ballot::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    ballot::common::critical("Governance store used before it was opened");
  }
  auto encoded_value = encoder.encode(value);
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Put(
      write_options, detail::to_slice(key),
      detail::to_slice(ballot::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  if (!status.ok()) {
    ballot::common::critical("Governance store write failed: {}",
                             status.ToString());
  }
}

inline void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& puts,
    const std::vector<ballot::schema::bytes_t>& deletes) const {
  if (!database) {
    ballot::common::critical("Governance store used before it was opened");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : deletes) {
    auto delete_status = batch.Delete(detail::to_slice(key));
    if (!delete_status.ok()) {
      ballot::common::critical("Cannot stage delete: {}",
                               delete_status.ToString());
    }
  }
  for (const auto& [key, value] : puts) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      ballot::common::critical("Cannot stage put: {}", put_status.ToString());
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    ballot::common::critical(
        "Governance batch of {} puts and {} deletes failed: {}", puts.size(),
        deletes.size(), write_status.ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const ballot::schema::bytes_view_t& prefix) const {
  if (!database) {
    ballot::common::critical("Governance store used before it was opened");
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
  if (!iterator->status().ok()) {
    ballot::common::critical("Governance store scan failed: {}",
                             iterator->status().ToString());
  }
  return entries;
}

}  // namespace ballot::storage
