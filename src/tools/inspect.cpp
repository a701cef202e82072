#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <colloquy/common/critical.hpp>
#include <colloquy/dialog/storage_proxy.hpp>
#include <colloquy/schema/encoding/scale/encoder.hpp>
#include <colloquy/schema/key/storage_key.hpp>
#include <colloquy/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = colloquy::schema::encoding::encoder<
    colloquy::schema::encoding::scale_encoder_tag>;
using storage_t =
    colloquy::storage::storage<colloquy::storage::rocksdb_storage_tag>;
using proxy_t =
    colloquy::dialog::storage_proxy<colloquy::storage::rocksdb_storage_tag>;
namespace po = boost::program_options;

std::string join(const std::vector<std::string>& items) {
  auto out = std::string{};
  for (const auto& item : items) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += item;
  }
  return out;
}

std::string optional_text(const std::optional<std::string>& value) {
  return value.value_or("none");
}

std::string optional_blob(
    const std::optional<colloquy::schema::bytes_t>& value) {
  if (!value.has_value()) {
    return "none";
  }
  return colloquy::schema::to_base64(*value);
}

colloquy::dialog::conversation_scope make_scope(const po::variables_map& vm) {
  auto scope = colloquy::dialog::conversation_scope{};
  scope.user_id = vm["user-id"].as<int64_t>();
  scope.chat_id = vm["chat-id"].as<int64_t>();
  auto chat_type = colloquy::schema::try_from_string<
      colloquy::schema::chat_type_t>(vm["chat-type"].as<std::string>());
  if (!chat_type.has_value()) {
    colloquy::common::critical(
        "chat-type must be private|group|supergroup|channel|sender");
  }
  scope.chat_type = *chat_type;
  if (vm.contains("thread-id")) {
    scope.thread_id = vm["thread-id"].as<int64_t>();
  }
  return scope;
}

colloquy::dialog::bot_identity make_bot(const po::variables_map& vm) {
  return colloquy::dialog::bot_identity{.id = vm["bot-id"].as<int64_t>(),
                                        .username = {}};
}

std::string require_string(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    colloquy::common::critical("missing required --{}", name);
  }
  return vm[name].as<std::string>();
}

colloquy::schema::key::storage_key build_query_key(
    const po::variables_map& vm) {
  auto scope = make_scope(vm);
  auto bot = make_bot(vm);
  auto kind = require_string(vm, "kind");
  auto id = vm["id"].as<std::string>();
  if (kind == "context") {
    return colloquy::dialog::make_context_key(scope, bot, id);
  }
  if (kind == "stack") {
    return colloquy::dialog::make_stack_key(scope, bot, id);
  }
  colloquy::common::critical("kind must be context|stack");
}

void print_stack(const colloquy::dialog::dialog_stack_t& stack) {
  std::cout << "id=" << stack.id << '\n';
  std::cout << "intents=" << join(stack.intents) << '\n';
  std::cout << "last_message_id="
            << (stack.last_message_id.has_value()
                    ? std::to_string(*stack.last_message_id)
                    : std::string{"none"})
            << '\n';
  std::cout << "last_reply_keyboard="
            << (stack.last_reply_keyboard ? "true" : "false") << '\n';
  std::cout << "last_media_id=" << optional_text(stack.last_media_id) << '\n';
  std::cout << "last_media_unique_id="
            << optional_text(stack.last_media_unique_id) << '\n';
  std::cout << "last_income_media_group_id="
            << optional_text(stack.last_income_media_group_id) << '\n';
  if (!stack.access_settings.has_value()) {
    std::cout << "access_settings=none\n";
    return;
  }
  const auto& settings = *stack.access_settings;
  auto user_ids = std::vector<std::string>{};
  for (const auto user_id : settings.user_ids) {
    user_ids.push_back(std::to_string(user_id));
  }
  std::cout << "access_settings.user_ids=" << join(user_ids) << '\n';
  std::cout << "access_settings.member_status="
            << (settings.member_status.has_value()
                    ? std::string{colloquy::schema::to_string(
                          *settings.member_status)}
                    : std::string{"none"})
            << '\n';
  std::cout << "access_settings.custom=" << optional_blob(settings.custom)
            << '\n';
}

// Printed without resolving the state, so records written by another state
// registry can still be inspected.
int show_context(const po::variables_map& vm,
                 encoder_t& encoder,
                 storage_t& storage) {
  auto key = colloquy::dialog::make_context_key(
      make_scope(vm), make_bot(vm), vm["id"].as<std::string>());
  auto raw = storage.get(key);
  if (!raw.has_value() || raw->empty()) {
    std::cout << "context " << key.destiny << " not found\n";
    return 2;
  }
  auto record = encoder.decode<colloquy::schema::context_record_t>(
      colloquy::schema::make_bytes_view(*raw));
  std::cout << "intent_id=" << record.intent_id << '\n';
  std::cout << "stack_id=" << record.stack_id << '\n';
  std::cout << "state=" << record.state << '\n';
  std::cout << "start_data=" << optional_blob(record.start_data) << '\n';
  for (const auto& entry : record.dialog_data) {
    std::cout << "dialog_data." << entry.key << '='
              << colloquy::schema::to_base64(entry.value) << '\n';
  }
  for (const auto& entry : record.widget_data) {
    std::cout << "widget_data." << entry.key << '='
              << colloquy::schema::to_base64(entry.value) << '\n';
  }
  return 0;
}

int list_records(const po::variables_map& vm, storage_t& storage) {
  auto scope = make_scope(vm);
  auto prefix = colloquy::schema::key::make_prefix(
      vm["bot-id"].as<int64_t>(), scope.chat_id, scope.user_id,
      scope.thread_id);
  auto rows = storage.list_by_prefix(colloquy::schema::make_bytes_view(prefix));
  for (const auto& [key, value] : rows) {
    auto destiny = colloquy::schema::make_string_view(
        colloquy::schema::bytes_view_t{key}.subspan(prefix.size()));
    if (value.empty()) {
      std::cout << destiny << " tombstone\n";
    } else {
      std::cout << destiny << ' ' << value.size() << " bytes\n";
    }
  }
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  colloquy_inspect query-key --kind context|stack [options]\n"
            << "  colloquy_inspect show-stack --db PATH [options]\n"
            << "  colloquy_inspect show-context --db PATH --id ID [options]\n"
            << "  colloquy_inspect remove-stack --db PATH [options]\n"
            << "  colloquy_inspect remove-context --db PATH --id ID "
               "[options]\n"
            << "  colloquy_inspect list --db PATH [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"colloquy_inspect options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "query-key|show-stack|show-context|remove-stack|remove-context|list")(
      "db", po::value<std::string>(), "RocksDB database path")(
      "bot-id", po::value<int64_t>()->default_value(0), "bot id")(
      "chat-id", po::value<int64_t>()->default_value(0), "chat id")(
      "user-id", po::value<int64_t>()->default_value(0), "user id")(
      "chat-type", po::value<std::string>()->default_value("private"),
      "private|group|supergroup|channel|sender")(
      "thread-id", po::value<int64_t>(), "forum topic id")(
      "kind", po::value<std::string>(), "context|stack")(
      "id", po::value<std::string>()->default_value(""),
      "intent id or stack id (default stack when omitted)")(
      "verbose,v", "enable debug logging");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  auto logger = spdlog::stderr_color_mt("inspect");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "query-key") {
    auto key = colloquy::schema::key::make_key(build_query_key(vm));
    std::cout << colloquy::schema::to_hex(key) << '\n';
    return 0;
  }

  try {
    auto encoder = encoder_t{};
    auto storage = colloquy::storage::make_storage<
        colloquy::storage::rocksdb_storage_tag>(require_string(vm, "db"));
    static const auto kNoStates = colloquy::dialog::state_registry_t{};
    auto proxy =
        proxy_t{encoder, storage, make_scope(vm), make_bot(vm), kNoStates};
    auto id = vm["id"].as<std::string>();

    if (command == "show-stack") {
      print_stack(proxy.load_stack(id));
      return 0;
    }
    if (command == "show-context") {
      return show_context(vm, encoder, storage);
    }
    if (command == "remove-stack") {
      proxy.remove_stack(id);
      spdlog::info("Removed stack '{}'", id);
      return 0;
    }
    if (command == "remove-context") {
      proxy.remove_context(id);
      spdlog::info("Removed context '{}'", id);
      return 0;
    }
    if (command == "list") {
      return list_records(vm, storage);
    }
  } catch (const std::exception& ex) {
    spdlog::error("{} failed: {}", command, ex.what());
    return 1;
  }

  colloquy::common::critical(
      "command must be "
      "query-key|show-stack|show-context|remove-stack|remove-context|list");
}
