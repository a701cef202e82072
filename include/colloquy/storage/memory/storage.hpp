#pragma once
#include <colloquy/storage/storage.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>

namespace colloquy::storage {

namespace detail {

struct memory_table final {
  mutable std::mutex mutex;
  std::map<colloquy::schema::bytes_t, colloquy::schema::bytes_t> rows;
};

}  // namespace detail

struct memory_storage_tag {};

/// Process-local backend. Keys are flattened exactly like the RocksDB
/// backend so prefix listings behave the same.
template <>
struct storage<memory_storage_tag> final {
  std::unique_ptr<detail::memory_table> table;

  std::optional<colloquy::schema::bytes_t> get(
      const colloquy::schema::key::storage_key& key) const;
  void set(const colloquy::schema::key::storage_key& key,
           const colloquy::schema::bytes_view_t& value) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const colloquy::schema::bytes_view_t& prefix) const;
};

/// The path is ignored; every call returns a fresh, empty table.
template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

}  // namespace colloquy::storage
