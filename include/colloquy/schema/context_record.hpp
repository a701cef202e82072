#pragma once
#include <colloquy/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: context record.
// Persisted form of one dialog instance. The state is stored as its textual
// identifier ("<group>:<name>").
namespace colloquy::schema {

struct data_entry final {
  std::string key;
  bytes_t value;
};

using data_entry_t = data_entry;

template <uint16_t Version>
struct context_record;

template <>
struct context_record<1> final {
  uint16_t version{1};
  std::string intent_id;
  std::string stack_id;
  std::string state;
  std::optional<bytes_t> start_data;
  std::vector<data_entry_t> dialog_data;
  std::vector<data_entry_t> widget_data;
};

using context_record_t = context_record<1>;

}  // namespace colloquy::schema
