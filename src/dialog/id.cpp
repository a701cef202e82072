#include <chrono>
#include <colloquy/dialog/id.hpp>
#include <random>
#include <string_view>

namespace colloquy::dialog {

namespace {

constexpr auto kIdSymbols = std::string_view{
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"};
constexpr auto kTimeModulo = uint64_t{100'000'000};

uint64_t new_int_id() {
  thread_local auto engine = std::mt19937_64{std::random_device{}()};
  auto distribution = std::uniform_int_distribution<uint64_t>{0, 99};
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
  return (static_cast<uint64_t>(seconds) % kTimeModulo) +
         distribution(engine) * kTimeModulo;
}

}  // namespace

std::string id_to_string(uint64_t value) {
  if (value == 0) {
    return std::string{kIdSymbols[0]};
  }
  auto out = std::string{};
  while (value != 0) {
    out.push_back(kIdSymbols[value % kIdSymbols.size()]);
    value /= kIdSymbols.size();
  }
  return out;
}

std::string new_id() {
  return id_to_string(new_int_id());
}

}  // namespace colloquy::dialog
