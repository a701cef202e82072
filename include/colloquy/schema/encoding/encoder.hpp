#pragma once
#include <colloquy/schema/primitives.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace colloquy::schema::encoding {

/// Raised when stored bytes cannot be decoded into the requested record.
class decode_error final : public std::runtime_error {
 public:
  explicit decode_error(const std::string& message)
      : std::runtime_error(message) {}
};

// The wire codec is picked at build time through the Library tag, the same
// way storage backends are.
template <typename Library>
struct encoder {
  template <typename T>
  colloquy::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, colloquy::schema::bytes_t& out);

  /// Decode bytes into T; throws decode_error on malformed input.
  template <typename T>
  T decode(const colloquy::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const colloquy::schema::bytes_view_t& bytes);
};

}  // namespace colloquy::schema::encoding
