#include <colloquy/dialog/errors.hpp>
#include <colloquy/dialog/state.hpp>
#include <stdexcept>
#include <utility>

namespace colloquy::dialog {

state_group_t make_state_group(std::string name,
                               std::initializer_list<std::string_view> states) {
  auto group = state_group_t{.name = std::move(name), .states = {}};
  group.states.reserve(states.size());
  for (const auto local : states) {
    auto text = group.name;
    text.push_back(kStateSeparator);
    text.append(local);
    group.states.push_back(state_t{.group = group.name,
                                   .name = std::string{local},
                                   .state = std::move(text)});
  }
  return group;
}

state_registry_t make_registry(std::vector<state_group_t> groups) {
  auto registry = state_registry_t{};
  for (auto& group : groups) {
    auto name = group.name;
    auto [_, inserted] = registry.emplace(name, std::move(group));
    if (!inserted) {
      throw std::invalid_argument{"duplicate state group " + name};
    }
  }
  return registry;
}

const state_t& resolve_state(const state_registry_t& registry,
                             const std::string_view state) {
  auto group = state.substr(0, state.find(kStateSeparator));
  auto found = registry.find(group);
  if (found == std::end(registry)) {
    throw unknown_state{"Unknown state group " + std::string{group}};
  }
  for (const auto& real_state : found->second.states) {
    if (real_state.state == state) {
      return real_state;
    }
  }
  throw unknown_state{"Unknown state " + std::string{state}};
}

}  // namespace colloquy::dialog
