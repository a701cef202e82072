#pragma once
#include <colloquy/schema/key/storage_key.hpp>
#include <colloquy/schema/primitives.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace colloquy::storage {

using key_value_entry_t =
    std::pair<colloquy::schema::bytes_t, colloquy::schema::bytes_t>;

/// Raised when the backend fails to read or write a record.
class storage_error final : public std::runtime_error {
 public:
  explicit storage_error(const std::string& message)
      : std::runtime_error(message) {}
};

/// Opaque key-value store keyed by storage_key.
///
/// Values are raw record bytes. An empty value is the tombstone convention for
/// "no record"; backends store it verbatim and never interpret it.
template <typename Library>
struct storage {
  /// Return the raw record at key, or std::nullopt when nothing was written.
  std::optional<colloquy::schema::bytes_t> get(
      const colloquy::schema::key::storage_key& key) const;

  /// Persist the raw record at key, replacing any previous value.
  void set(const colloquy::schema::key::storage_key& key,
           const colloquy::schema::bytes_view_t& value) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const colloquy::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace colloquy::storage
