#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <orca/common/critical.hpp>
#include <orca/storage/storage.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace orca::storage {

namespace detail {

inline orca::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const orca::schema::bytes_view_t& bytes) {
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
                       const orca::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const orca::schema::bytes_view_t& key,
           const T& value) const;

  void erase(const orca::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const orca::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const orca::schema::bytes_view_t& key) const {
  if (!database) {
    orca::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    orca::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(orca::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const orca::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    orca::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status =
      database->Put(write_options, detail::to_slice(key),
                    detail::to_slice(orca::schema::make_bytes_view(
                        encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    orca::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace orca::storage
