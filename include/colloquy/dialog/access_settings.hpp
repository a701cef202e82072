#pragma once

#include <colloquy/schema/access_settings_record.hpp>
#include <colloquy/schema/chat_member_status.hpp>
#include <colloquy/schema/primitives.hpp>
#include <optional>
#include <vector>

namespace colloquy::dialog {

/// Who may interact with a dialog stack.
struct access_settings_t final {
  /// Empty means there is no explicit allow-list.
  std::vector<schema::user_id_t> user_ids;
  std::optional<schema::chat_member_status_t> member_status;
  /// Caller-defined payload, stored and returned without interpretation.
  std::optional<schema::bytes_t> custom;

  bool operator==(const access_settings_t&) const = default;
};

/// Absent raw record yields absent settings. Throws invalid_member_status for
/// an unknown member status literal.
std::optional<access_settings_t> parse_access_settings(
    const std::optional<schema::access_settings_record_t>& raw);

std::optional<schema::access_settings_record_t> dump_access_settings(
    const std::optional<access_settings_t>& access_settings);

}  // namespace colloquy::dialog
