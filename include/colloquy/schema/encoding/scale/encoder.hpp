#pragma once
#include <colloquy/common/critical.hpp>
#include <colloquy/schema/access_settings_record.hpp>
#include <colloquy/schema/context_record.hpp>
#include <colloquy/schema/encoding/encoder.hpp>
#include <colloquy/schema/stack_record.hpp>
#include <iterator>
#include <scale/scale.hpp>
#include <string>

namespace colloquy::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  colloquy::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, colloquy::schema::bytes_t& out);

  template <typename T>
  T decode(const colloquy::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const colloquy::schema::bytes_view_t& bytes);
};

template <typename T>
colloquy::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    colloquy::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        colloquy::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const colloquy::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    throw decode_error{"failed to decode SCALE bytes: " +
                       decoded.error().message()};
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const colloquy::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace colloquy::schema::encoding
