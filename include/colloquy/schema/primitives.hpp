#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace colloquy::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;

// Telegram-style identifiers. All of them fit in a signed 64 bit integer.
using bot_id_t = int64_t;
using chat_id_t = int64_t;
using user_id_t = int64_t;
using thread_id_t = int64_t;
using message_id_t = int64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);

std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_view_t& bytes);

// Renderings used when records are printed for people, never when stored.
std::string to_hex(const bytes_view_t& bytes);
std::string to_base64(const bytes_view_t& bytes);

}  // namespace colloquy::schema
