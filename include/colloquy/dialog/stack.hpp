#pragma once

#include <colloquy/dialog/access_settings.hpp>
#include <colloquy/dialog/context.hpp>
#include <colloquy/dialog/id.hpp>
#include <colloquy/dialog/state.hpp>
#include <colloquy/schema/primitives.hpp>
#include <colloquy/schema/stack_record.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace colloquy::dialog {

inline constexpr auto kDefaultStackId = std::string_view{""};
inline constexpr auto kStackLimit = std::size_t{100};

/// Navigation history of dialogs for one conversation.
struct dialog_stack_t final {
  std::string id{new_id()};
  std::vector<std::string> intents;
  std::optional<schema::message_id_t> last_message_id;
  bool last_reply_keyboard{};
  std::optional<std::string> last_media_id;
  std::optional<std::string> last_media_unique_id;
  std::optional<std::string> last_income_media_group_id;
  std::optional<access_settings_t> access_settings;

  /// Start a new intent on top of this stack.
  ///
  /// Throws dialog_stack_overflow when kStackLimit intents are already open.
  dialog_context_t push(const state_t& state,
                        std::optional<schema::bytes_t> start_data);

  /// Remove and return the top intent id. Throws std::out_of_range when empty.
  std::string pop();

  /// Throws std::out_of_range when empty.
  const std::string& last_intent_id() const;

  bool empty() const { return intents.empty(); }
  bool is_default() const { return id == kDefaultStackId; }

  bool operator==(const dialog_stack_t&) const = default;
};

schema::stack_record_t to_record(const dialog_stack_t& stack);

/// Throws invalid_member_status when the access settings carry an unknown
/// member status.
dialog_stack_t from_record(const schema::stack_record_t& record);

}  // namespace colloquy::dialog
