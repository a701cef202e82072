#pragma once
#include <colloquy/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>

namespace colloquy::schema::key {

struct builder final {
  colloquy::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }

  // Presence byte followed by the value, so "absent" never collides with a
  // present zero.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(const std::optional<T>& value) {
    if (!value.has_value()) {
      return write(uint8_t{0});
    }
    write(uint8_t{1});
    return write(value.value());
  }
};

}  // namespace colloquy::schema::key
