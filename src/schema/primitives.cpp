#include <colloquy/schema/primitives.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>

namespace colloquy::schema {

namespace {

const char* as_chars(const bytes_view_t& bytes) {
  return reinterpret_cast<const char*>(bytes.data());
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return {std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return {std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return {bytes.data(), bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return {as_chars(bytes), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{make_string_view(bytes)};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kDigits = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kDigits[byte >> 4u]);
    out.push_back(kDigits[byte & 0x0Fu]);
  }
  return out;
}

// Standard alphabet with '=' padding.
std::string to_base64(const bytes_view_t& bytes) {
  static constexpr auto kAlphabet = std::string_view{
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (std::size_t offset = 0; offset < bytes.size(); offset += 3) {
    auto chunk = bytes.subspan(offset, std::min<std::size_t>(
                                           3, bytes.size() - offset));
    auto group = uint32_t{0};
    for (std::size_t i = 0; i < 3; ++i) {
      group = (group << 8u) | (i < chunk.size() ? chunk[i] : 0u);
    }
    for (std::size_t i = 0; i < 4; ++i) {
      if (i <= chunk.size()) {
        out.push_back(kAlphabet[(group >> (18u - (6u * i))) & 0x3Fu]);
      } else {
        out.push_back('=');
      }
    }
  }
  return out;
}

}  // namespace colloquy::schema
