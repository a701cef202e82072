#include <gtest/gtest.h>
#include <colloquy/dialog/errors.hpp>
#include <colloquy/dialog/storage_proxy.hpp>
#include <colloquy/schema/encoding/scale/encoder.hpp>
#include <colloquy/storage/memory/storage.hpp>
#include <colloquy/storage/rocksdb/storage.hpp>
#include <colloquy/testing/common.hpp>
#include <colloquy/testing/storages.hpp>

#include <optional>
#include <string>

namespace {

using encoder_t = colloquy::schema::encoding::encoder<
    colloquy::schema::encoding::scale_encoder_tag>;
using counting_tag = colloquy::testing::counting_storage_tag;
using proxy_t = colloquy::dialog::storage_proxy<counting_tag>;

colloquy::dialog::conversation_scope make_scope(
    const std::optional<colloquy::schema::thread_id_t>& thread_id =
        std::nullopt) {
  return colloquy::dialog::conversation_scope{
      .user_id = 42,
      .chat_id = -100500,
      .chat_type = colloquy::schema::chat_type_t::supergroup,
      .thread_id = thread_id};
}

colloquy::dialog::bot_identity make_bot() {
  return colloquy::dialog::bot_identity{.id = 7, .username = "dialog_bot"};
}

class storage_proxy_test : public ::testing::Test {
 protected:
  proxy_t make_proxy(const std::optional<colloquy::schema::thread_id_t>&
                         thread_id = std::nullopt) {
    return proxy_t{encoder, storage, make_scope(thread_id), make_bot(),
                   registry};
  }

  const colloquy::dialog::state_t& main_state(const std::size_t index) const {
    return registry.at("Main").states.at(index);
  }

  colloquy::dialog::dialog_context_t make_context() const {
    return colloquy::dialog::dialog_context_t{
        .intent_id = "intent1",
        .stack_id = "",
        .state = &main_state(1),
        .start_data = colloquy::testing::make_blob("start"),
        .dialog_data = {{"name", colloquy::testing::make_blob("bob")}},
        .widget_data = {{"checkbox", colloquy::schema::bytes_t{0x01}},
                        {"pager", colloquy::schema::bytes_t{0x03}}}};
  }

  colloquy::dialog::dialog_stack_t make_stack() const {
    auto stack = colloquy::dialog::dialog_stack_t{.id = "side"};
    stack.intents = {"intent1", "intent2"};
    stack.last_message_id = 314;
    stack.last_media_id = "media";
    stack.access_settings = colloquy::dialog::access_settings_t{
        .user_ids = {42, 43},
        .member_status = colloquy::schema::chat_member_status_t::administrator,
        .custom = colloquy::testing::make_blob("custom")};
    return stack;
  }

  encoder_t encoder;
  colloquy::storage::storage<counting_tag> storage;
  colloquy::dialog::state_registry_t registry =
      colloquy::testing::make_test_registry();
};

}  // namespace

TEST_F(storage_proxy_test, context_round_trips_with_registered_state) {
  auto proxy = make_proxy();
  auto context = make_context();
  proxy.save_context(context);

  auto loaded = proxy.load_context("intent1");
  EXPECT_EQ(loaded, context);
  EXPECT_EQ(loaded.state, &main_state(1));
  EXPECT_EQ(loaded.state->state, "Main:step2");
}

TEST_F(storage_proxy_test, missing_context_is_unknown_intent) {
  auto proxy = make_proxy();
  try {
    static_cast<void>(proxy.load_context("x"));
    FAIL() << "expected unknown_intent";
  } catch (const colloquy::dialog::unknown_intent& ex) {
    EXPECT_NE(std::string{ex.what()}.find("x"), std::string::npos);
  }
}

TEST_F(storage_proxy_test, missing_stack_is_fresh_stack) {
  auto proxy = make_proxy();
  auto stack = proxy.load_stack("y");
  EXPECT_EQ(stack.id, "y");
  EXPECT_TRUE(stack.empty());
  EXPECT_FALSE(stack.last_message_id.has_value());
  EXPECT_FALSE(stack.access_settings.has_value());

  auto primary = proxy.load_stack();
  EXPECT_TRUE(primary.is_default());
}

TEST_F(storage_proxy_test, stack_round_trips_with_access_settings) {
  auto proxy = make_proxy();
  auto stack = make_stack();
  proxy.save_stack(stack);
  EXPECT_EQ(proxy.load_stack("side"), stack);
}

TEST_F(storage_proxy_test, stack_round_trips_without_access_settings) {
  auto proxy = make_proxy();
  auto stack = make_stack();
  stack.access_settings.reset();
  proxy.save_stack(stack);

  auto loaded = proxy.load_stack("side");
  EXPECT_EQ(loaded, stack);
  EXPECT_FALSE(loaded.access_settings.has_value());
}

TEST_F(storage_proxy_test, stack_keeps_empty_but_present_access_settings) {
  auto proxy = make_proxy();
  auto stack = make_stack();
  stack.access_settings = colloquy::dialog::access_settings_t{};
  proxy.save_stack(stack);

  auto loaded = proxy.load_stack("side");
  ASSERT_TRUE(loaded.access_settings.has_value());
  EXPECT_EQ(*loaded.access_settings, colloquy::dialog::access_settings_t{});
}

TEST_F(storage_proxy_test, stack_with_only_last_message_is_persisted) {
  auto proxy = make_proxy();
  auto stack = colloquy::dialog::dialog_stack_t{.id = ""};
  stack.last_message_id = 9;
  proxy.save_stack(stack);

  auto loaded = proxy.load_stack();
  EXPECT_EQ(loaded.last_message_id, 9);
  EXPECT_TRUE(loaded.empty());
}

TEST_F(storage_proxy_test, empty_stack_is_saved_as_tombstone) {
  auto proxy = make_proxy();
  proxy.save_stack(make_stack());

  auto emptied = make_stack();
  emptied.intents.clear();
  emptied.last_message_id.reset();
  proxy.save_stack(emptied);

  auto raw = storage.get(colloquy::dialog::make_stack_key(
      make_scope(), make_bot(), "side"));
  ASSERT_TRUE(raw.has_value());
  EXPECT_TRUE(raw->empty());

  auto loaded = proxy.load_stack("side");
  EXPECT_EQ(loaded.id, "side");
  EXPECT_FALSE(loaded.access_settings.has_value());
  EXPECT_FALSE(loaded.last_media_id.has_value());
}

TEST_F(storage_proxy_test, removal_is_idempotent) {
  auto proxy = make_proxy();
  proxy.save_context(make_context());
  proxy.save_stack(make_stack());

  proxy.remove_context("intent1");
  proxy.remove_context("intent1");
  proxy.remove_stack("side");
  proxy.remove_stack("side");

  EXPECT_THROW(static_cast<void>(proxy.load_context("intent1")),
               colloquy::dialog::unknown_intent);
  auto stack = proxy.load_stack("side");
  EXPECT_TRUE(stack.empty());
  EXPECT_FALSE(stack.access_settings.has_value());
}

TEST_F(storage_proxy_test, absent_entities_are_not_written) {
  auto proxy = make_proxy();
  proxy.save_context(std::nullopt);
  proxy.save_stack(std::nullopt);
  EXPECT_EQ(storage.writes, 0u);
  EXPECT_EQ(storage.reads, 0u);
}

TEST_F(storage_proxy_test, each_operation_touches_the_store_once) {
  auto proxy = make_proxy();

  proxy.save_context(make_context());
  EXPECT_EQ(storage.writes, 1u);
  static_cast<void>(proxy.load_context("intent1"));
  EXPECT_EQ(storage.reads, 1u);
  static_cast<void>(proxy.load_context("intent1"));
  EXPECT_EQ(storage.reads, 2u);

  proxy.save_stack(make_stack());
  EXPECT_EQ(storage.writes, 2u);
  proxy.save_stack(colloquy::dialog::dialog_stack_t{.id = "side"});
  EXPECT_EQ(storage.writes, 3u);
  static_cast<void>(proxy.load_stack("side"));
  EXPECT_EQ(storage.reads, 3u);

  proxy.remove_context("intent1");
  proxy.remove_stack("side");
  EXPECT_EQ(storage.writes, 5u);
  EXPECT_EQ(storage.reads, 3u);
}

TEST_F(storage_proxy_test, state_missing_from_registry_is_unknown_state) {
  auto legacy = colloquy::dialog::make_registry(
      {colloquy::dialog::make_state_group("Legacy", {"start"})});
  auto context = make_context();
  context.state = &legacy.at("Legacy").states[0];
  make_proxy().save_context(context);

  EXPECT_THROW(static_cast<void>(make_proxy().load_context("intent1")),
               colloquy::dialog::unknown_state);
}

TEST_F(storage_proxy_test, unknown_member_status_propagates) {
  auto record = colloquy::dialog::to_record(make_stack());
  record.access_settings->member_status = "overlord";
  auto encoded = encoder.encode(record);
  storage.set(colloquy::dialog::make_stack_key(make_scope(), make_bot(), "side"),
              colloquy::schema::make_bytes_view(encoded));

  EXPECT_THROW(static_cast<void>(make_proxy().load_stack("side")),
               colloquy::dialog::invalid_member_status);
}

TEST_F(storage_proxy_test, corrupt_record_propagates_decode_error) {
  auto garbage = colloquy::schema::bytes_t{0x01};
  storage.set(
      colloquy::dialog::make_context_key(make_scope(), make_bot(), "intent1"),
      colloquy::schema::make_bytes_view(garbage));

  EXPECT_THROW(static_cast<void>(make_proxy().load_context("intent1")),
               colloquy::schema::encoding::decode_error);
}

TEST_F(storage_proxy_test, threads_are_isolated) {
  auto main_thread = make_proxy();
  auto topic = make_proxy(17);
  main_thread.save_stack(make_stack());

  EXPECT_TRUE(topic.load_stack("side").empty());
  EXPECT_EQ(main_thread.load_stack("side"), make_stack());
}

TEST_F(storage_proxy_test, context_and_stack_with_same_id_coexist) {
  auto proxy = make_proxy();
  auto context = make_context();
  auto stack = make_stack();
  stack.id = context.intent_id;
  proxy.save_context(context);
  proxy.save_stack(stack);

  EXPECT_EQ(proxy.load_context(context.intent_id), context);
  EXPECT_EQ(proxy.load_stack(stack.id), stack);
}

TEST_F(storage_proxy_test, pushed_context_survives_save_and_load) {
  auto proxy = make_proxy();
  auto stack = proxy.load_stack();
  auto context = stack.push(main_state(0), std::nullopt);
  context.dialog_data.insert_or_assign("answer",
                                       colloquy::schema::bytes_t{42});
  proxy.save_context(context);
  proxy.save_stack(stack);

  auto loaded_stack = proxy.load_stack();
  ASSERT_EQ(loaded_stack.intents.size(), 1u);
  auto loaded = proxy.load_context(loaded_stack.last_intent_id());
  EXPECT_EQ(loaded, context);
  EXPECT_EQ(loaded.stack_id, colloquy::dialog::kDefaultStackId);
}

TEST(storage_proxy, store_failures_propagate_unchanged) {
  auto encoder = encoder_t{};
  auto storage =
      colloquy::storage::storage<colloquy::testing::failing_storage_tag>{};
  const auto registry = colloquy::testing::make_test_registry();
  auto proxy =
      colloquy::dialog::storage_proxy<colloquy::testing::failing_storage_tag>{
          encoder, storage, make_scope(), make_bot(), registry};

  EXPECT_THROW(static_cast<void>(proxy.load_stack()),
               colloquy::storage::storage_error);
  EXPECT_THROW(static_cast<void>(proxy.load_context("intent1")),
               colloquy::storage::storage_error);
  EXPECT_THROW(proxy.remove_stack(""), colloquy::storage::storage_error);
  EXPECT_THROW(proxy.remove_context("intent1"),
               colloquy::storage::storage_error);
}

TEST(storage_proxy, rocksdb_backend_round_trips) {
  auto db = colloquy::testing::make_db_path("colloquy_proxy_rocksdb");
  {
    auto encoder = encoder_t{};
    auto storage = colloquy::storage::make_storage<
        colloquy::storage::rocksdb_storage_tag>(db);
    const auto registry = colloquy::testing::make_test_registry();
    auto proxy = colloquy::dialog::storage_proxy<
        colloquy::storage::rocksdb_storage_tag>{encoder, storage, make_scope(),
                                                make_bot(), registry};

    auto stack = proxy.load_stack();
    auto context = stack.push(registry.at("Settings").states[0],
                              colloquy::testing::make_blob("en"));
    proxy.save_context(context);
    proxy.save_stack(stack);

    EXPECT_EQ(proxy.load_stack(), stack);
    EXPECT_EQ(proxy.load_context(context.id()), context);

    proxy.remove_context(context.id());
    EXPECT_THROW(static_cast<void>(proxy.load_context(context.id())),
                 colloquy::dialog::unknown_intent);
  }
  colloquy::testing::remove_path(db);
}
