#pragma once

#include <colloquy/schema/enum_string.hpp>

#include <cstdint>

// Schema type: chat member status.
// Membership level of a user inside a chat, as reported by the Bot API.
namespace colloquy::schema {

enum class chat_member_status_t : uint8_t {
  creator = 0,
  administrator = 1,
  member = 2,
  restricted = 3,
  left = 4,
  kicked = 5
};

template <>
struct enum_literals<chat_member_status_t> final {
  static constexpr auto values = enum_literals_t<chat_member_status_t, 6>{
      {{"creator", chat_member_status_t::creator},
       {"administrator", chat_member_status_t::administrator},
       {"member", chat_member_status_t::member},
       {"restricted", chat_member_status_t::restricted},
       {"left", chat_member_status_t::left},
       {"kicked", chat_member_status_t::kicked}}};
};

}  // namespace colloquy::schema
