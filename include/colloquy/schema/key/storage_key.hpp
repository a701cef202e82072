#pragma once
#include <colloquy/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

// Schema key type: storage key.
// Composite key scoping every dialog record to one conversation of one bot.
namespace colloquy::schema::key {

inline constexpr auto kKeyPrefix = std::string_view{"COLLOQUY|"};
inline constexpr auto kDestinyNamespace = std::string_view{"colloquy"};
inline constexpr auto kContextKind = std::string_view{"context"};
inline constexpr auto kStackKind = std::string_view{"stack"};

struct storage_key final {
  bot_id_t bot_id{};
  chat_id_t chat_id{};
  user_id_t user_id{};
  std::optional<thread_id_t> thread_id;
  // "<namespace>:<kind>:<entity id>"
  std::string destiny;

  bool operator==(const storage_key&) const = default;
};

/// Build the destiny discriminator for a record kind and entity id.
std::string make_destiny(const std::string_view& kind,
                         const std::string_view& id);

/// Bytes shared by every key of one conversation.
bytes_t make_prefix(bot_id_t bot_id,
                    chat_id_t chat_id,
                    user_id_t user_id,
                    const std::optional<thread_id_t>& thread_id);

/// Flatten a storage key into the byte key handed to a backend.
bytes_t make_key(const storage_key& key);

}  // namespace colloquy::schema::key
