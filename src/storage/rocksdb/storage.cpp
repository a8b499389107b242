#include <orca/common/critical.hpp>
#include <orca/storage/rocksdb/storage.hpp>

namespace orca::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    orca::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened session store at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::erase(
    const orca::schema::bytes_view_t& key) const {
  if (!database) {
    orca::common::critical("RocksDB database is not initialized");
  }
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Delete(write_options, detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete value from RocksDB: {}",
                  status.ToString());
    orca::common::critical("Failed to delete value from RocksDB");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const orca::schema::bytes_view_t& prefix) const {
  if (!database) {
    orca::common::critical("RocksDB database is not initialized");
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
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    orca::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace orca::storage
