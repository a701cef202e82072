#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace colloquy::dialog {

inline constexpr auto kStateSeparator = ':';

/// One dialog state declared by a state group.
struct state_t final {
  std::string group;
  std::string name;
  /// Canonical identifier, "<group>:<name>". This is what gets persisted.
  std::string state;
};

struct state_group_t final {
  std::string name;
  std::vector<state_t> states;
};

/// Group name to group. Built once at startup and treated as read-only; the
/// addresses of the contained states are the canonical state instances.
using state_registry_t = std::map<std::string, state_group_t, std::less<>>;

state_group_t make_state_group(std::string name,
                               std::initializer_list<std::string_view> states);

/// Throws std::invalid_argument when two groups share a name.
state_registry_t make_registry(std::vector<state_group_t> groups);

/// Resolve a persisted state identifier to the registered state.
///
/// The group is the text before the first separator. Throws unknown_state
/// when the group is not registered or none of its states matches the full
/// identifier.
const state_t& resolve_state(const state_registry_t& registry,
                             std::string_view state);

}  // namespace colloquy::dialog
