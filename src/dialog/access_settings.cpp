#include <colloquy/dialog/access_settings.hpp>
#include <colloquy/dialog/errors.hpp>
#include <colloquy/schema/encoding/encoder.hpp>
#include <string>

namespace colloquy::dialog {

std::optional<access_settings_t> parse_access_settings(
    const std::optional<schema::access_settings_record_t>& raw) {
  if (!raw.has_value()) {
    return std::nullopt;
  }
  if (raw->version != 1) {
    throw schema::encoding::decode_error{
        "unsupported access settings record version " +
        std::to_string(raw->version)};
  }

  auto member_status = std::optional<schema::chat_member_status_t>{};
  if (raw->member_status.has_value() && !raw->member_status->empty()) {
    member_status = schema::try_from_string<schema::chat_member_status_t>(
        *raw->member_status);
    if (!member_status.has_value()) {
      throw invalid_member_status{"Unknown chat member status " +
                                  *raw->member_status};
    }
  }

  return access_settings_t{.user_ids = raw->user_ids,
                           .member_status = member_status,
                           .custom = raw->custom};
}

std::optional<schema::access_settings_record_t> dump_access_settings(
    const std::optional<access_settings_t>& access_settings) {
  if (!access_settings.has_value()) {
    return std::nullopt;
  }
  auto record = schema::access_settings_record_t{};
  record.user_ids = access_settings->user_ids;
  if (access_settings->member_status.has_value()) {
    record.member_status =
        std::string{schema::to_string(*access_settings->member_status)};
  }
  record.custom = access_settings->custom;
  return record;
}

}  // namespace colloquy::dialog
