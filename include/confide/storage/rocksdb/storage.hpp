#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <confide/common/critical.hpp>
#include <confide/schema/encoding/scale/encoder.hpp>
#include <confide/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace confide::storage {

namespace detail {

inline confide::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const confide::schema::bytes_view_t& bytes) {
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
                       const confide::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const confide::schema::bytes_view_t& key,
           const T& value) const;

  void erase(const confide::schema::bytes_view_t& key) const;
  void commit(const std::vector<write_op_t>& operations) const;
  std::vector<std::optional<confide::schema::bytes_t>> snapshot_get(
      const std::vector<confide::schema::bytes_t>& keys) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const confide::schema::bytes_view_t& prefix) const;
  std::size_t erase_by_prefix(const confide::schema::bytes_view_t& prefix) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const confide::schema::bytes_view_t& key) const {
  if (!database) {
    confide::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      confide::common::critical("Failed to get value from RocksDB: {}",
                                status.ToString());
    }
  }
  return {encoder.template decode<T>(confide::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const confide::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    confide::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status =
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
                    detail::to_slice(encoded_value));
  if (!status.ok()) {
    confide::common::critical("Failed to put value into RocksDB: {}",
                              status.ToString());
  }
}

}  // namespace confide::storage
