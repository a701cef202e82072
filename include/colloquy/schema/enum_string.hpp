#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace colloquy::schema {

template <typename Enum, std::size_t N>
using enum_literals_t = std::array<std::pair<std::string_view, Enum>, N>;

// Specialized beside every enum that is persisted or parsed by its literal.
// A specialization exposes `static constexpr enum_literals_t<Enum, N> values`.
template <typename Enum>
struct enum_literals;

template <typename Enum>
concept literal_enum =
    std::is_enum_v<Enum> && requires { enum_literals<Enum>::values; };

template <literal_enum Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view literal) {
  const auto& values = enum_literals<Enum>::values;
  auto found = std::ranges::find(values, literal,
                                 &std::pair<std::string_view, Enum>::first);
  if (found == std::end(values)) {
    return std::nullopt;
  }
  return found->second;
}

/// Literal of value, or "unknown" for a value missing from the table.
template <literal_enum Enum>
constexpr std::string_view to_string(const Enum value) {
  const auto& values = enum_literals<Enum>::values;
  auto found = std::ranges::find(values, value,
                                 &std::pair<std::string_view, Enum>::second);
  if (found == std::end(values)) {
    return "unknown";
  }
  return found->first;
}

}  // namespace colloquy::schema
