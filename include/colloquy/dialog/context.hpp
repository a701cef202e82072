#pragma once

#include <colloquy/dialog/state.hpp>
#include <colloquy/schema/context_record.hpp>
#include <colloquy/schema/primitives.hpp>
#include <map>
#include <optional>
#include <string>

namespace colloquy::dialog {

/// Dialog-owned key/value data. Values are serialized by the caller.
using data_t = std::map<std::string, schema::bytes_t>;

/// One active dialog instance.
struct dialog_context_t final {
  std::string intent_id;
  std::string stack_id;
  /// Points into the state registry; never owned.
  const state_t* state{nullptr};
  std::optional<schema::bytes_t> start_data;
  data_t dialog_data;
  data_t widget_data;

  const std::string& id() const { return intent_id; }

  bool operator==(const dialog_context_t&) const = default;
};

schema::context_record_t to_record(const dialog_context_t& context);

/// Throws unknown_state when the stored state is not registered.
dialog_context_t from_record(const schema::context_record_t& record,
                             const state_registry_t& registry);

}  // namespace colloquy::dialog
