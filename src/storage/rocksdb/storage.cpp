#include <notary/common/critical.hpp>
#include <notary/storage/rocksdb/storage.hpp>

namespace notary::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    notary::common::critical("Failed to open RocksDB");
  }
  spdlog::debug("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

bool storage<rocksdb_storage_tag>::erase(
    const notary::schema::bytes_view_t& key) const {
  if (!database) {
    notary::common::critical("RocksDB database is not initialized");
  }
  auto existing = std::string{};
  auto lookup = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &existing);
  if (lookup.IsNotFound()) {
    return false;
  }
  if (!lookup.ok()) {
    notary::common::critical("Failed to read key before delete");
  }
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete from RocksDB: {}", status.ToString());
    notary::common::critical("Failed to delete from RocksDB");
  }
  return true;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const notary::schema::bytes_view_t& prefix) const {
  if (!database) {
    notary::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
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
    notary::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace notary::storage
