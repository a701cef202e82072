#pragma once

#include <cstdint>
#include <string>

namespace colloquy::dialog {

/// Render a number in base 62 (0-9a-zA-Z), least significant digit first.
std::string id_to_string(uint64_t value);

/// Short id for intents and stacks: unix seconds modulo 10^8 plus a random
/// multiple of 10^8, rendered with id_to_string.
std::string new_id();

}  // namespace colloquy::dialog
