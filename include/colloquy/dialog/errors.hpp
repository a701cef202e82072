#pragma once

#include <stdexcept>
#include <string>

namespace colloquy::dialog {

class dialog_error : public std::runtime_error {
 public:
  explicit dialog_error(const std::string& message)
      : std::runtime_error(message) {}
};

/// No context is stored for the requested intent id.
class unknown_intent final : public dialog_error {
 public:
  using dialog_error::dialog_error;
};

/// A persisted state identifier does not match the loaded state registry.
class unknown_state final : public dialog_error {
 public:
  using dialog_error::dialog_error;
};

/// A stack already holds the maximum number of intents.
class dialog_stack_overflow final : public dialog_error {
 public:
  using dialog_error::dialog_error;
};

/// A persisted member status literal is not a known chat member status.
class invalid_member_status final : public dialog_error {
 public:
  using dialog_error::dialog_error;
};

}  // namespace colloquy::dialog
