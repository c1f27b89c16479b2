#include <confide/common/critical.hpp>
#include <confide/storage/rocksdb/storage.hpp>

#include <rocksdb/snapshot.h>

#include <iterator>

namespace confide::storage {

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
    confide::common::critical("Failed to open RocksDB at {}: {}",
                              path, status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::erase(
    const confide::schema::bytes_view_t& key) const {
  if (!database) {
    confide::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    confide::common::critical("Failed to delete key from RocksDB: {}",
                              status.ToString());
  }
}

void storage<rocksdb_storage_tag>::commit(
    const std::vector<write_op_t>& operations) const {
  if (!database) {
    confide::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& operation : operations) {
    auto status = std::visit(
        overloaded{[&](const put_entry& entry) {
                     return batch.Put(detail::to_slice(entry.key),
                                      detail::to_slice(entry.value));
                   },
                   [&](const erase_entry& entry) {
                     return batch.Delete(detail::to_slice(entry.key));
                   }},
        operation);
    if (!status.ok()) {
      confide::common::critical("Failed staging write batch operation: {}",
                                status.ToString());
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    confide::common::critical("Failed to commit write batch: {}",
                              write_status.ToString());
  }
}

std::vector<std::optional<confide::schema::bytes_t>>
storage<rocksdb_storage_tag>::snapshot_get(
    const std::vector<confide::schema::bytes_t>& keys) const {
  if (!database) {
    confide::common::critical("RocksDB database is not initialized");
  }

  auto release = [this](const ROCKSDB_NAMESPACE::Snapshot* snapshot) {
    database->ReleaseSnapshot(snapshot);
  };
  auto snapshot =
      std::unique_ptr<const ROCKSDB_NAMESPACE::Snapshot, decltype(release)>{
          database->GetSnapshot(), release};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.snapshot = snapshot.get();

  auto values = std::vector<std::optional<confide::schema::bytes_t>>{};
  values.reserve(keys.size());
  for (const auto& key : keys) {
    auto raw = std::string{};
    auto status = database->Get(read_options, detail::to_slice(key), &raw);
    if (status.IsNotFound()) {
      values.emplace_back(std::nullopt);
      continue;
    }
    if (!status.ok()) {
      confide::common::critical("Failed snapshot read from RocksDB: {}",
                                status.ToString());
    }
    values.emplace_back(confide::schema::bytes_t(std::begin(raw), std::end(raw)));
  }
  return values;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const confide::schema::bytes_view_t& prefix) const {
  if (!database) {
    confide::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = confide::schema::make_string_view(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    confide::common::critical("Prefix scan failed: {}",
                              iterator->status().ToString());
  }
  return entries;
}

std::size_t storage<rocksdb_storage_tag>::erase_by_prefix(
    const confide::schema::bytes_view_t& prefix) const {
  auto entries = list_by_prefix(prefix);
  auto operations = std::vector<write_op_t>{};
  operations.reserve(entries.size());
  for (auto& [key, value] : entries) {
    operations.push_back(make_erase(std::move(key)));
  }
  if (!operations.empty()) {
    commit(operations);
  }
  return operations.size();
}

}  // namespace confide::storage
