#pragma once

#include <colloquy/dialog/state.hpp>
#include <colloquy/schema/primitives.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace colloquy::testing {

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline colloquy::schema::bytes_t make_blob(const std::string_view text) {
  return colloquy::schema::make_bytes(text);
}

/// Main: step1, step2, step3. Settings: language, timezone.
inline colloquy::dialog::state_registry_t make_test_registry() {
  return colloquy::dialog::make_registry(
      {colloquy::dialog::make_state_group("Main", {"step1", "step2", "step3"}),
       colloquy::dialog::make_state_group("Settings",
                                          {"language", "timezone"})});
}

}  // namespace colloquy::testing
