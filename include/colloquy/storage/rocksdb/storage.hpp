#pragma once
#include <rocksdb/db.h>
#include <colloquy/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace colloquy::storage {

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<colloquy::schema::bytes_t> get(
      const colloquy::schema::key::storage_key& key) const;
  void set(const colloquy::schema::key::storage_key& key,
           const colloquy::schema::bytes_view_t& value) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const colloquy::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace colloquy::storage
