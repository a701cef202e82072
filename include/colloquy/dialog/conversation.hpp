#pragma once

#include <colloquy/schema/chat_type.hpp>
#include <colloquy/schema/primitives.hpp>
#include <optional>
#include <string>

namespace colloquy::dialog {

/// Identifies the conversation whose dialogs are being persisted.
struct conversation_scope final {
  schema::user_id_t user_id{};
  schema::chat_id_t chat_id{};
  schema::chat_type_t chat_type{schema::chat_type_t::private_chat};
  /// Forum topic, when the chat has topics enabled.
  std::optional<schema::thread_id_t> thread_id;
};

struct bot_identity final {
  schema::bot_id_t id{};
  std::string username;
};

}  // namespace colloquy::dialog
