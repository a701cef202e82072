#pragma once
#include <colloquy/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: access settings record.
// Persisted form of the access descriptor attached to a dialog stack. The
// member status is kept as its literal so unknown values are detected when the
// record is parsed back into the closed enum.
namespace colloquy::schema {

template <uint16_t Version>
struct access_settings_record;

template <>
struct access_settings_record<1> final {
  uint16_t version{1};
  std::vector<user_id_t> user_ids;
  // Serializer layer: the enum is kept as its literal here and nowhere else.
  std::optional<std::string> member_status;
  std::optional<bytes_t> custom;
};

using access_settings_record_t = access_settings_record<1>;

}  // namespace colloquy::schema
