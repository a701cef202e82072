#pragma once

#include <colloquy/schema/enum_string.hpp>

#include <cstdint>

// Schema type: chat type.
namespace colloquy::schema {

enum class chat_type_t : uint8_t {
  private_chat = 0,
  group = 1,
  supergroup = 2,
  channel = 3,
  sender = 4
};

template <>
struct enum_literals<chat_type_t> final {
  static constexpr auto values = enum_literals_t<chat_type_t, 5>{
      {{"private", chat_type_t::private_chat},
       {"group", chat_type_t::group},
       {"supergroup", chat_type_t::supergroup},
       {"channel", chat_type_t::channel},
       {"sender", chat_type_t::sender}}};
};

}  // namespace colloquy::schema
