#include <colloquy/dialog/storage_proxy.hpp>

using namespace colloquy::schema;

namespace colloquy::dialog {

namespace {

key::storage_key make_scoped_key(const conversation_scope& scope,
                                 const bot_identity& bot,
                                 const std::string_view kind,
                                 const std::string_view id) {
  return key::storage_key{.bot_id = bot.id,
                          .chat_id = scope.chat_id,
                          .user_id = scope.user_id,
                          .thread_id = scope.thread_id,
                          .destiny = key::make_destiny(kind, id)};
}

}  // namespace

key::storage_key make_context_key(const conversation_scope& scope,
                                  const bot_identity& bot,
                                  const std::string_view intent_id) {
  return make_scoped_key(scope, bot, key::kContextKind, intent_id);
}

key::storage_key make_stack_key(const conversation_scope& scope,
                                const bot_identity& bot,
                                const std::string_view stack_id) {
  return make_scoped_key(scope, bot, key::kStackKind, stack_id);
}

}  // namespace colloquy::dialog
