#include <spdlog/spdlog.h>
#include <algorithm>
#include <colloquy/common/critical.hpp>
#include <colloquy/storage/memory/storage.hpp>

using namespace colloquy::schema;

namespace colloquy::storage {

std::optional<bytes_t> storage<memory_storage_tag>::get(
    const key::storage_key& key) const {
  if (!table) {
    colloquy::common::critical("memory table is not initialized");
  }
  auto raw_key = key::make_key(key);
  auto lock = std::scoped_lock{table->mutex};
  auto found = table->rows.find(raw_key);
  if (found == std::end(table->rows)) {
    return std::nullopt;
  }
  return found->second;
}

void storage<memory_storage_tag>::set(const key::storage_key& key,
                                      const bytes_view_t& value) const {
  if (!table) {
    colloquy::common::critical("memory table is not initialized");
  }
  auto raw_key = key::make_key(key);
  auto lock = std::scoped_lock{table->mutex};
  table->rows.insert_or_assign(std::move(raw_key), make_bytes(value));
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const bytes_view_t& prefix) const {
  if (!table) {
    colloquy::common::critical("memory table is not initialized");
  }
  auto entries = std::vector<key_value_entry_t>{};
  auto lock = std::scoped_lock{table->mutex};
  for (auto it = table->rows.lower_bound(make_bytes(prefix));
       it != std::end(table->rows); ++it) {
    const auto& row_key = it->first;
    if (row_key.size() < prefix.size() ||
        !std::equal(std::begin(prefix), std::end(prefix),
                    std::begin(row_key))) {
      break;
    }
    entries.push_back(key_value_entry_t{row_key, it->second});
  }
  return entries;
}

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  static_cast<void>(path);
  auto store = storage<memory_storage_tag>();
  store.table = std::make_unique<detail::memory_table>();
  spdlog::debug("Opened in-memory dialog storage");
  return store;
}

}  // namespace colloquy::storage
