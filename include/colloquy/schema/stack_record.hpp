#pragma once
#include <colloquy/schema/access_settings_record.hpp>
#include <colloquy/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: stack record.
// Persisted form of a dialog stack: the ordered intent ids plus the rendering
// bookkeeping of the last message sent for this stack.
namespace colloquy::schema {

template <uint16_t Version>
struct stack_record;

template <>
struct stack_record<1> final {
  uint16_t version{1};
  std::string id;
  std::vector<std::string> intents;
  std::optional<message_id_t> last_message_id;
  bool last_reply_keyboard{};
  std::optional<std::string> last_media_id;
  std::optional<std::string> last_media_unique_id;
  std::optional<std::string> last_income_media_group_id;
  std::optional<access_settings_record_t> access_settings;
};

using stack_record_t = stack_record<1>;

}  // namespace colloquy::schema
