#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <colloquy/common/critical.hpp>
#include <colloquy/storage/rocksdb/storage.hpp>
#include <string>

using namespace colloquy::schema;

namespace colloquy::storage {

namespace {

bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

ROCKSDB_NAMESPACE::Slice to_slice(const bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace

std::optional<bytes_t> storage<rocksdb_storage_tag>::get(
    const key::storage_key& key) const {
  if (!database) {
    colloquy::common::critical("RocksDB database is not initialized");
  }
  auto raw_key = key::make_key(key);
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              to_slice(make_bytes_view(raw_key)), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get '{}' from RocksDB: {}", key.destiny,
                  status.ToString());
    throw storage_error{"failed to read from RocksDB: " + status.ToString()};
  }
  return make_bytes(std::string_view{value});
}

void storage<rocksdb_storage_tag>::set(const key::storage_key& key,
                                       const bytes_view_t& value) const {
  if (!database) {
    colloquy::common::critical("RocksDB database is not initialized");
  }
  auto raw_key = key::make_key(key);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              to_slice(make_bytes_view(raw_key)),
                              to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put '{}' into RocksDB: {}", key.destiny,
                  status.ToString());
    throw storage_error{"failed to write to RocksDB: " + status.ToString()};
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const bytes_view_t& prefix) const {
  if (!database) {
    colloquy::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = make_string(prefix);

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
    entries.push_back(
        key_value_entry_t{to_bytes(iterator->key()), to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    throw storage_error{"failed to iterate RocksDB: " +
                        iterator->status().ToString()};
  }
  return entries;
}

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
    throw storage_error{"failed to open RocksDB: " + status.ToString()};
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace colloquy::storage
