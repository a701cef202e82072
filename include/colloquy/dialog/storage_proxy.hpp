#pragma once

#include <spdlog/spdlog.h>
#include <colloquy/dialog/context.hpp>
#include <colloquy/dialog/conversation.hpp>
#include <colloquy/dialog/errors.hpp>
#include <colloquy/dialog/stack.hpp>
#include <colloquy/dialog/state.hpp>
#include <colloquy/schema/encoding/scale/encoder.hpp>
#include <colloquy/schema/key/storage_key.hpp>
#include <colloquy/storage/storage.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace colloquy::dialog {

schema::key::storage_key make_context_key(const conversation_scope& scope,
                                          const bot_identity& bot,
                                          std::string_view intent_id);

schema::key::storage_key make_stack_key(const conversation_scope& scope,
                                        const bot_identity& bot,
                                        std::string_view stack_id);

/// Gateway between typed dialog entities and a raw key-value store.
///
/// Every load is exactly one store read and every save/remove exactly one
/// store write. Nothing is cached and store failures propagate unchanged.
/// Removal writes an empty record rather than deleting the key.
///
/// The proxy holds references to the encoder, the storage backend and the
/// state registry; all three must outlive it. Concurrent writes to the same
/// key are not coordinated here.
template <typename Library>
class storage_proxy final {
 public:
  using encoder_t = schema::encoding::encoder<schema::encoding::scale_encoder_tag>;
  using storage_t = storage::storage<Library>;

  storage_proxy(encoder_t& encoder,
                storage_t& storage,
                conversation_scope scope,
                bot_identity bot,
                const state_registry_t& state_groups)
      : encoder_{encoder},
        storage_{storage},
        scope_{std::move(scope)},
        bot_{std::move(bot)},
        state_groups_{state_groups} {}

  /// Throws unknown_intent when nothing is stored for intent_id and
  /// unknown_state when the stored state is not registered.
  dialog_context_t load_context(std::string_view intent_id) const;

  /// A missing stack is not an error: a fresh stack with only the id is
  /// returned.
  dialog_stack_t load_stack(std::string_view stack_id = kDefaultStackId) const;

  void save_context(const std::optional<dialog_context_t>& context) const;
  void remove_context(std::string_view intent_id) const;

  /// A stack without intents and without a last message id is written as a
  /// tombstone, whatever access settings it carries.
  void save_stack(const std::optional<dialog_stack_t>& stack) const;
  void remove_stack(std::string_view stack_id) const;

  const conversation_scope& scope() const { return scope_; }
  const bot_identity& bot() const { return bot_; }

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  conversation_scope scope_;
  bot_identity bot_;
  const state_registry_t& state_groups_;
};

template <typename Library>
dialog_context_t storage_proxy<Library>::load_context(
    const std::string_view intent_id) const {
  auto key = make_context_key(scope_, bot_, intent_id);
  spdlog::debug("Loading context '{}'", key.destiny);
  auto raw = storage_.get(key);
  if (!raw.has_value() || raw->empty()) {
    throw unknown_intent{"Context not found for intent id: " +
                         std::string{intent_id}};
  }
  auto record = encoder_.decode<schema::context_record_t>(
      schema::make_bytes_view(*raw));
  return from_record(record, state_groups_);
}

template <typename Library>
dialog_stack_t storage_proxy<Library>::load_stack(
    const std::string_view stack_id) const {
  auto key = make_stack_key(scope_, bot_, stack_id);
  spdlog::debug("Loading stack '{}'", key.destiny);
  auto raw = storage_.get(key);
  if (!raw.has_value() || raw->empty()) {
    return dialog_stack_t{.id = std::string{stack_id}};
  }
  auto record = encoder_.decode<schema::stack_record_t>(
      schema::make_bytes_view(*raw));
  return from_record(record);
}

template <typename Library>
void storage_proxy<Library>::save_context(
    const std::optional<dialog_context_t>& context) const {
  if (!context.has_value()) {
    return;
  }
  auto key = make_context_key(scope_, bot_, context->id());
  spdlog::debug("Saving context '{}'", key.destiny);
  auto encoded = encoder_.encode(to_record(*context));
  storage_.set(key, schema::make_bytes_view(encoded));
}

template <typename Library>
void storage_proxy<Library>::remove_context(
    const std::string_view intent_id) const {
  auto key = make_context_key(scope_, bot_, intent_id);
  spdlog::debug("Removing context '{}'", key.destiny);
  storage_.set(key, schema::bytes_view_t{});
}

template <typename Library>
void storage_proxy<Library>::save_stack(
    const std::optional<dialog_stack_t>& stack) const {
  if (!stack.has_value()) {
    return;
  }
  auto key = make_stack_key(scope_, bot_, stack->id);
  if (stack->empty() && !stack->last_message_id.has_value()) {
    spdlog::debug("Saving empty stack '{}' as tombstone", key.destiny);
    storage_.set(key, schema::bytes_view_t{});
    return;
  }
  spdlog::debug("Saving stack '{}' with {} intent(s)", key.destiny,
                stack->intents.size());
  auto encoded = encoder_.encode(to_record(*stack));
  storage_.set(key, schema::make_bytes_view(encoded));
}

template <typename Library>
void storage_proxy<Library>::remove_stack(
    const std::string_view stack_id) const {
  auto key = make_stack_key(scope_, bot_, stack_id);
  spdlog::debug("Removing stack '{}'", key.destiny);
  storage_.set(key, schema::bytes_view_t{});
}

}  // namespace colloquy::dialog
