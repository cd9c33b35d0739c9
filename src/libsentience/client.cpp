// SPDX-License-Identifier: MIT
#include "sentience/client.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <type_traits>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace sentience {

namespace {

bool flag_at(const json::object& obj, std::string_view key) {
  auto* v = obj.if_contains(key);
  return v && v->is_bool() && v->get_bool();
}

call_error invalid_params(std::string detail) {
  return call_error{call_errc::invalid_params, std::move(detail)};
}

bool valid_env_name(std::string_view name) {
  static const RE2 env_name_re{R"([A-Za-z_][A-Za-z0-9_]*)"};
  return RE2::FullMatch(name, env_name_re);
}

json::object env_entry(std::string_view name, std::string_view value) {
  json::object entry{};
  entry["name"] = name;
  entry["value"] = value;
  return entry;
}

template <typename Range>
std::variant<json::array, call_error> env_from_pairs(const Range& pairs) {
  json::array out{};
  for (const auto& [name, value] : pairs) {
    if (!valid_env_name(name))
      return invalid_params(fmt::format("invalid environment name '{}'", name));
    out.push_back(env_entry(name, value));
  }
  return out;
}

std::variant<json::array, call_error> env_from_json(const json::value& env) {
  if (env.is_null()) return json::array{};

  if (auto* obj = env.if_object()) {
    json::array out{};
    for (const auto& [name, value] : *obj) {
      auto* str = value.if_string();
      if (!str)
        return invalid_params(
            fmt::format("env value for '{}' must be a string", sv(name)));
      if (!valid_env_name(sv(name)))
        return invalid_params(
            fmt::format("invalid environment name '{}'", sv(name)));
      out.push_back(env_entry(sv(name), sv(*str)));
    }
    return out;
  }

  if (auto* arr = env.if_array()) {
    json::array out{};
    for (const auto& item : *arr) {
      auto* entry = item.if_object();
      auto* name = entry ? entry->if_contains("name") : nullptr;
      auto* value = entry ? entry->if_contains("value") : nullptr;
      if (!name || !name->is_string() || !value || !value->is_string())
        return invalid_params(
            "env entries must have string \"name\" and \"value\"");
      if (!valid_env_name(sv(name->get_string())))
        return invalid_params(fmt::format(
            "invalid environment name '{}'", sv(name->get_string())));
      out.push_back(env_entry(sv(name->get_string()), sv(value->get_string())));
    }
    return out;
  }

  return invalid_params("env must be a map, a list of pairs, or a list of {name, value}");
}

std::optional<call_error> check_non_negative(
    std::string_view what, const std::optional<std::int64_t>& v) {
  if (v && *v < 0)
    return invalid_params(fmt::format("{} must be an integer >= 0", what));
  return std::nullopt;
}

}  // namespace

client_capabilities client_capabilities::from_json(const json::object& caps) {
  client_capabilities out{};
  out.raw = caps;
  if (auto* fs = caps.if_contains("fs"); fs && fs->is_object()) {
    out.fs_read_text_file = flag_at(fs->get_object(), "readTextFile");
    out.fs_write_text_file = flag_at(fs->get_object(), "writeTextFile");
  }
  out.terminal = flag_at(caps, "terminal");
  return out;
}

std::variant<json::array, call_error> normalize_env(const env_input& env) {
  return std::visit(
      [](const auto& e) -> std::variant<json::array, call_error> {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return json::array{};
        } else if constexpr (std::is_same_v<T, json::value>) {
          return env_from_json(e);
        } else {
          return env_from_pairs(e);
        }
      },
      env);
}

std::vector<permission_option> default_permission_options() {
  return {
    {"allow-once", "Allow once", "allow_once"},
    {"reject-once", "Reject", "reject_once"},
  };
}

asio::awaitable<call_result> client::read_text_file(
    std::string session_id, std::string path, read_options opts) {
  if (!caps_->fs_read_text_file)
    co_return call_error{call_errc::unsupported, "fs/read_text_file"};
  if (!utils::is_absolute_path(path))
    co_return call_error{call_errc::invalid_path, path};
  if (auto err = check_non_negative("line", opts.line)) co_return *err;
  if (auto err = check_non_negative("limit", opts.limit)) co_return *err;

  json::object params{};
  params["sessionId"] = session_id;
  params["path"] = path;
  if (opts.line) params["line"] = *opts.line;
  if (opts.limit) params["limit"] = *opts.limit;
  co_return co_await router_->request(
      "fs/read_text_file", std::move(params), opts.timeout);
}

asio::awaitable<call_result> client::write_text_file(
    std::string session_id, std::string path, std::string content,
    std::chrono::milliseconds timeout) {
  if (!caps_->fs_write_text_file)
    co_return call_error{call_errc::unsupported, "fs/write_text_file"};
  if (!utils::is_absolute_path(path))
    co_return call_error{call_errc::invalid_path, path};

  json::object params{};
  params["sessionId"] = session_id;
  params["path"] = path;
  params["content"] = content;
  co_return co_await router_->request(
      "fs/write_text_file", std::move(params), timeout);
}

asio::awaitable<call_result> client::terminal_create(
    std::string session_id, std::string command, terminal_options opts) {
  if (!caps_->terminal)
    co_return call_error{call_errc::unsupported, "terminal/create"};
  if (opts.cwd && !utils::is_absolute_path(*opts.cwd))
    co_return call_error{call_errc::invalid_path, fmt::format("cwd={}", *opts.cwd)};
  if (auto err = check_non_negative("outputByteLimit", opts.output_byte_limit))
    co_return *err;

  auto env = normalize_env(opts.env);
  if (auto* err = std::get_if<call_error>(&env)) co_return *err;

  json::object params{};
  params["sessionId"] = session_id;
  params["command"] = command;
  params["args"] = json::array(opts.args.begin(), opts.args.end());
  params["env"] = std::move(std::get<json::array>(env));
  if (opts.cwd) params["cwd"] = *opts.cwd;
  if (opts.output_byte_limit) params["outputByteLimit"] = *opts.output_byte_limit;
  co_return co_await router_->request(
      "terminal/create", std::move(params), opts.timeout);
}

asio::awaitable<call_result> client::terminal_call(
    std::string method, std::string session_id, std::string terminal_id,
    std::chrono::milliseconds timeout) {
  if (!caps_->terminal) co_return call_error{call_errc::unsupported, method};

  json::object params{};
  params["sessionId"] = session_id;
  params["terminalId"] = terminal_id;
  co_return co_await router_->request(
      std::move(method), std::move(params), timeout);
}

asio::awaitable<call_result> client::terminal_output(
    std::string session_id, std::string terminal_id,
    std::chrono::milliseconds timeout) {
  return terminal_call(
      "terminal/output", std::move(session_id), std::move(terminal_id),
      timeout);
}

asio::awaitable<call_result> client::terminal_wait_for_exit(
    std::string session_id, std::string terminal_id,
    std::chrono::milliseconds timeout) {
  return terminal_call(
      "terminal/wait_for_exit", std::move(session_id), std::move(terminal_id),
      timeout);
}

asio::awaitable<call_result> client::terminal_kill(
    std::string session_id, std::string terminal_id,
    std::chrono::milliseconds timeout) {
  return terminal_call(
      "terminal/kill", std::move(session_id), std::move(terminal_id), timeout);
}

asio::awaitable<call_result> client::terminal_release(
    std::string session_id, std::string terminal_id,
    std::chrono::milliseconds timeout) {
  return terminal_call(
      "terminal/release", std::move(session_id), std::move(terminal_id),
      timeout);
}

asio::awaitable<call_result> client::request_permission(
    std::string session_id, json::object tool_call,
    std::optional<std::vector<permission_option>> options,
    std::chrono::milliseconds timeout) {
  auto* tool_call_id = tool_call.if_contains("toolCallId");
  if (!tool_call_id || !tool_call_id->is_string())
    co_return invalid_params("tool call must include a string toolCallId");

  if (!options) options = default_permission_options();
  json::array opts_json{};
  for (const auto& opt : *options) {
    if (opt.option_id.empty() || opt.name.empty() || opt.kind.empty())
      co_return invalid_params(
          "permission options need a non-empty optionId, name and kind");
    json::object o{};
    o["optionId"] = opt.option_id;
    o["name"] = opt.name;
    o["kind"] = opt.kind;
    opts_json.push_back(std::move(o));
  }

  LOG_DEBUG(
      "requesting permission for tool call {} in {}",
      sv(tool_call_id->get_string()), session_id);

  json::object params{};
  params["sessionId"] = session_id;
  params["toolCall"] = std::move(tool_call);
  params["options"] = std::move(opts_json);
  co_return co_await router_->request(
      "session/request_permission", std::move(params), timeout);
}

asio::awaitable<call_result> client::call(
    std::string session_id, std::string method, json::object params,
    std::chrono::milliseconds timeout) {
  std::string_view m{method};
  bool allowed = true;
  if (m == "fs/read_text_file")
    allowed = caps_->fs_read_text_file;
  else if (m == "fs/write_text_file")
    allowed = caps_->fs_write_text_file;
  else if (m.starts_with("fs/"))
    allowed = false;  // no capability flag covers it
  else if (m.starts_with("terminal/"))
    allowed = caps_->terminal;
  if (!allowed) co_return call_error{call_errc::unsupported, method};

  params["sessionId"] = session_id;
  co_return co_await router_->request(
      std::move(method), std::move(params), timeout);
}

}  // namespace sentience
