#include <spdlog/spdlog.h>
#include <colloquy/dialog/errors.hpp>
#include <colloquy/dialog/stack.hpp>
#include <colloquy/schema/encoding/encoder.hpp>
#include <stdexcept>
#include <utility>

using namespace colloquy::schema;

namespace colloquy::dialog {

dialog_context_t dialog_stack_t::push(const state_t& state,
                                      std::optional<bytes_t> start_data) {
  if (intents.size() >= kStackLimit) {
    throw dialog_stack_overflow{
        "Cannot open more dialogs in current stack. Max count is " +
        std::to_string(kStackLimit)};
  }
  auto context = dialog_context_t{.intent_id = new_id(),
                                  .stack_id = id,
                                  .state = &state,
                                  .start_data = std::move(start_data),
                                  .dialog_data = {},
                                  .widget_data = {}};
  intents.push_back(context.intent_id);
  spdlog::debug("Pushed intent '{}' ({}) onto stack '{}'", context.intent_id,
                state.state, id);
  return context;
}

std::string dialog_stack_t::pop() {
  if (intents.empty()) {
    throw std::out_of_range{"pop from empty dialog stack " + id};
  }
  auto intent_id = std::move(intents.back());
  intents.pop_back();
  return intent_id;
}

const std::string& dialog_stack_t::last_intent_id() const {
  if (intents.empty()) {
    throw std::out_of_range{"dialog stack " + id + " has no intents"};
  }
  return intents.back();
}

stack_record_t to_record(const dialog_stack_t& stack) {
  auto record = stack_record_t{};
  record.id = stack.id;
  record.intents = stack.intents;
  record.last_message_id = stack.last_message_id;
  record.last_reply_keyboard = stack.last_reply_keyboard;
  record.last_media_id = stack.last_media_id;
  record.last_media_unique_id = stack.last_media_unique_id;
  record.last_income_media_group_id = stack.last_income_media_group_id;
  record.access_settings = dump_access_settings(stack.access_settings);
  return record;
}

dialog_stack_t from_record(const stack_record_t& record) {
  if (record.version != 1) {
    throw encoding::decode_error{"unsupported stack record version " +
                                 std::to_string(record.version)};
  }
  return dialog_stack_t{
      .id = record.id,
      .intents = record.intents,
      .last_message_id = record.last_message_id,
      .last_reply_keyboard = record.last_reply_keyboard,
      .last_media_id = record.last_media_id,
      .last_media_unique_id = record.last_media_unique_id,
      .last_income_media_group_id = record.last_income_media_group_id,
      .access_settings = parse_access_settings(record.access_settings)};
}

}  // namespace colloquy::dialog
