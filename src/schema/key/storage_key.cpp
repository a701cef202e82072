#include <colloquy/schema/key/builder.hpp>
#include <colloquy/schema/key/storage_key.hpp>

using namespace colloquy::schema;

namespace colloquy::schema::key {

std::string make_destiny(const std::string_view& kind,
                         const std::string_view& id) {
  auto destiny = std::string{kDestinyNamespace};
  destiny.reserve(destiny.size() + kind.size() + id.size() + 2);
  destiny.push_back(':');
  destiny.append(kind);
  destiny.push_back(':');
  destiny.append(id);
  return destiny;
}

bytes_t make_prefix(const bot_id_t bot_id,
                    const chat_id_t chat_id,
                    const user_id_t user_id,
                    const std::optional<thread_id_t>& thread_id) {
  auto b = builder{};
  b.write(kKeyPrefix);
  b.write(bot_id);
  b.write("|");
  b.write(chat_id);
  b.write("|");
  b.write(user_id);
  b.write("|");
  b.write(thread_id);
  b.write("|");
  return b.data;
}

bytes_t make_key(const storage_key& key) {
  auto b = builder{
      .data = make_prefix(key.bot_id, key.chat_id, key.user_id, key.thread_id)};
  b.write(key.destiny);
  return b.data;
}

}  // namespace colloquy::schema::key
