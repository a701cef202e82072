#include <colloquy/common/critical.hpp>
#include <colloquy/dialog/context.hpp>
#include <colloquy/schema/encoding/encoder.hpp>
#include <string>

using namespace colloquy::schema;

namespace colloquy::dialog {

namespace {

std::vector<data_entry_t> to_entries(const data_t& data) {
  auto entries = std::vector<data_entry_t>{};
  entries.reserve(data.size());
  for (const auto& [key, value] : data) {
    entries.push_back(data_entry_t{.key = key, .value = value});
  }
  return entries;
}

data_t from_entries(const std::vector<data_entry_t>& entries) {
  auto data = data_t{};
  for (const auto& entry : entries) {
    data.insert_or_assign(entry.key, entry.value);
  }
  return data;
}

}  // namespace

context_record_t to_record(const dialog_context_t& context) {
  if (context.state == nullptr) {
    colloquy::common::critical("dialog context has no state");
  }
  auto record = context_record_t{};
  record.intent_id = context.intent_id;
  record.stack_id = context.stack_id;
  record.state = context.state->state;
  record.start_data = context.start_data;
  record.dialog_data = to_entries(context.dialog_data);
  record.widget_data = to_entries(context.widget_data);
  return record;
}

dialog_context_t from_record(const context_record_t& record,
                             const state_registry_t& registry) {
  if (record.version != 1) {
    throw encoding::decode_error{"unsupported context record version " +
                                 std::to_string(record.version)};
  }
  return dialog_context_t{.intent_id = record.intent_id,
                          .stack_id = record.stack_id,
                          .state = &resolve_state(registry, record.state),
                          .start_data = record.start_data,
                          .dialog_data = from_entries(record.dialog_data),
                          .widget_data = from_entries(record.widget_data)};
}

}  // namespace colloquy::dialog
