// SPDX-License-Identifier: MIT
#include "sentience/agent.hpp"

#include <fmt/format.h>

#include <array>
#include <exception>
#include <random>
#include <typeinfo>
#include <utility>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "sentience/prompt.hpp"
#include "utils.hpp"

namespace sentience {

namespace {

jsonrpc::error_object make_error(
    int code, std::string message, json::object data = {}) {
  jsonrpc::error_object err{code, std::move(message)};
  if (!data.empty()) err.data = json::value(std::move(data));
  return err;
}

jsonrpc::error_object invalid_params(std::string_view detail) {
  json::object data{};
  data["detail"] = detail;
  return make_error(jsonrpc::invalid_params, "Invalid params", std::move(data));
}

jsonrpc::error_object method_not_found(std::string_view name) {
  json::object data{};
  data["method"] = name;
  return make_error(
      jsonrpc::method_not_found, "Method not found", std::move(data));
}

bool is_integer(const json::value& v) { return v.is_int64() || v.is_uint64(); }

json::object agent_capabilities() {
  json::object prompt_caps{};
  prompt_caps["image"] = false;
  prompt_caps["audio"] = false;
  prompt_caps["embeddedContext"] = true;

  json::object mcp_caps{};
  mcp_caps["http"] = false;
  mcp_caps["sse"] = false;

  json::object caps{};
  caps["loadSession"] = false;
  caps["promptCapabilities"] = std::move(prompt_caps);
  caps["mcpCapabilities"] = std::move(mcp_caps);
  return caps;
}

json::object plan_entry(std::string_view content) {
  json::object entry{};
  entry["content"] = content;
  entry["priority"] = "high";
  entry["status"] = "completed";
  return entry;
}

json::object text_block(std::string_view text) {
  json::object block{};
  block["type"] = "text";
  block["text"] = text;
  return block;
}

}  // namespace

method parse_method(std::string_view name) {
  // clang-format off
  if (name == "initialize")       return method::initialize;
  if (name == "authenticate")     return method::authenticate;
  if (name == "session/new")      return method::session_new;
  if (name == "session/load")     return method::session_load;
  if (name == "session/set_mode") return method::session_set_mode;
  if (name == "session/prompt")   return method::session_prompt;
  if (name == "session/cancel")   return method::session_cancel;
  // clang-format on
  return method::unknown;
}

/// echo_responder

asio::awaitable<std::string> echo_responder::respond(turn_context& ctx) {
  constexpr std::array lines{
    "I received your prompt via ACP.",
    "",
    "What I can do right now:",
    "- Accept sessions and prompts correctly over JSON-RPC 2.0 (stdio).",
    "- Stream updates back to the editor via `session/update`.",
    "",
    "What I *don't* do yet:",
    "- Call an LLM provider (no model backend configured).",
    "- Execute tools (fs/terminal) or apply edits.",
    "",
    "Your prompt (rendered):",
  };
  std::string text{};
  for (const auto* line : lines) {
    text += line;
    text += '\n';
  }
  text += ctx.prompt_text;
  co_return text;
}

/// agent

agent::agent(
    router& r, jsonrpc::line_sink& sink, agent_options opts,
    std::unique_ptr<responder> resp)
    : router_{&r},
      sink_{&sink},
      opts_{std::move(opts)},
      responder_{resp ? std::move(resp) : std::make_unique<echo_responder>()} {}

asio::awaitable<void> agent::handle(jsonrpc::message msg) {
  if (auto* req = std::get_if<jsonrpc::request>(&msg)) {
    LOG_INFO("rpc: {} id={}", req->method, jsonrpc::id_to_string(req->id));
    reply r{};
    try {
      static const json::object no_params{};
      if (!req->params.is_null() && !req->params.is_object()) {
        r = invalid_params(fmt::format("{} params must be an object", req->method));
      } else {
        const auto& params =
            req->params.is_object() ? req->params.get_object() : no_params;
        r = co_await dispatch(parse_method(req->method), req->method, params);
      }
    } catch (const std::exception& e) {
      LOG_ERROR(
          "handler for {} threw {}: {}", req->method,
          utils::demangle_symbol(typeid(e).name()), e.what());
      r = make_error(jsonrpc::internal_error, "Internal error");
    }

    if (auto* result = std::get_if<json::value>(&r))
      send(jsonrpc::make_result(req->id, std::move(*result)));
    else
      send(jsonrpc::error_response{req->id, std::get<jsonrpc::error_object>(r)});
    co_return;
  }

  if (auto* note = std::get_if<jsonrpc::notification>(&msg)) {
    LOG_INFO("rpc notification: {}", note->method);
    try {
      if (parse_method(note->method) != method::session_cancel) {
        LOG_DEBUG("ignoring notification {}", note->method);
      } else if (auto* params = note->params.if_object()) {
        do_session_cancel(*params);
      } else {
        LOG_WARN("session/cancel without params object");
      }
    } catch (const std::exception& e) {
      LOG_ERROR(
          "notification handler for {} threw {}: {}", note->method,
          utils::demangle_symbol(typeid(e).name()), e.what());
    }
    co_return;
  }

  LOG_DEBUG("agent ignoring a reply nobody was waiting for");
}

asio::awaitable<agent::reply> agent::dispatch(
    method m, std::string_view name, const json::object& params) {
  switch (m) {
    case method::initialize:
      co_return do_initialize(params);
    case method::authenticate: {
      json::object outcome{};
      outcome["outcome"] = "not_required";
      json::object result{};
      result["outcome"] = std::move(outcome);
      co_return json::value(std::move(result));
    }
    case method::session_new:
      co_return do_session_new(params);
    case method::session_set_mode:
      co_return do_session_set_mode(params);
    case method::session_prompt:
      co_return co_await do_session_prompt(params);
    case method::session_load:    // sessions don't survive a restart
    case method::session_cancel:  // only meaningful as a notification
    case method::unknown:
      break;
  }
  co_return method_not_found(name);
}

agent::reply agent::do_initialize(const json::object& params) {
  auto* version = params.if_contains("protocolVersion");
  if (!version || !is_integer(*version))
    return invalid_params("protocolVersion must be an integer");

  json::object caps{};
  if (auto* c = params.if_contains("clientCapabilities")) {
    if (!c->is_object())
      return invalid_params("clientCapabilities must be an object");
    caps = c->get_object();
  }

  json::object info{};
  if (auto* i = params.if_contains("clientInfo"); i && i->is_object())
    info = i->get_object();

  // Only version 1 exists; anything else is answered with what we speak
  // and the client decides whether to go on.
  bool supported = version->is_int64() && version->get_int64() == protocol_version;
  if (!supported)
    LOG_WARN(
        "client asked for protocol {}, offering {}", json::serialize(*version),
        protocol_version);

  state_.protocol_version = protocol_version;
  state_.client_caps = client_capabilities::from_json(caps);
  state_.client_info = std::move(info);

  LOG_INFO(
      "initialized: protocol={} fs.read={} fs.write={} terminal={}",
      protocol_version, state_.client_caps.fs_read_text_file,
      state_.client_caps.fs_write_text_file, state_.client_caps.terminal);

  json::object agent_info{};
  agent_info["name"] = opts_.name;
  agent_info["title"] = opts_.title;
  agent_info["version"] = opts_.version;

  json::object result{};
  result["protocolVersion"] = protocol_version;
  result["agentCapabilities"] = agent_capabilities();
  result["agentInfo"] = std::move(agent_info);
  result["authMethods"] = json::array{};
  return json::value(std::move(result));
}

agent::reply agent::do_session_new(const json::object& params) {
  if (auto err = require_initialized("session/new")) return *err;

  auto* cwd = string_at(params, "cwd");
  if (!cwd) return invalid_params("cwd must be a string");
  if (!utils::is_absolute_path(sv(*cwd)))
    return invalid_params("cwd must be an absolute path");

  json::array servers{};
  if (auto* s = params.if_contains("mcpServers"); s && !s->is_null()) {
    if (!s->is_array()) return invalid_params("mcpServers must be a list");
    servers = s->get_array();
  }

  session sess{new_session_id(), std::string{sv(*cwd)}};
  sess.mcp_servers = std::move(servers);
  std::string id{sess.id};
  LOG_INFO("session/new: {} cwd={}", id, sess.cwd);
  state_.sessions.emplace(id, std::move(sess));

  json::object result{};
  result["sessionId"] = id;
  return json::value(std::move(result));
}

agent::reply agent::do_session_set_mode(const json::object& params) {
  if (auto err = require_initialized("session/set_mode")) return *err;

  auto found = find_session(params);
  if (auto* err = std::get_if<jsonrpc::error_object>(&found)) return *err;
  auto* sess = std::get<session*>(found);

  auto* mode = string_at(params, "mode");
  if (!mode) return invalid_params("mode must be a string");

  sess->mode = std::string{sv(*mode)};
  LOG_INFO("session/set_mode: {} -> {}", sess->id, *sess->mode);

  json::object update{};
  update["sessionUpdate"] = "mode";
  update["mode"] = *sess->mode;
  send_update(sess->id, std::move(update));

  return json::value(nullptr);
}

asio::awaitable<agent::reply> agent::do_session_prompt(
    const json::object& params) {
  if (auto err = require_initialized("session/prompt")) co_return *err;

  auto found = find_session(params);
  if (auto* err = std::get_if<jsonrpc::error_object>(&found)) co_return *err;
  auto* sess = std::get<session*>(found);

  auto* raw_prompt = params.if_contains("prompt");
  if (!raw_prompt || !raw_prompt->is_array())
    co_return invalid_params("prompt must be a list");
  const auto& blocks = raw_prompt->get_array();
  for (const auto& block : blocks)
    if (!block.is_object())
      co_return invalid_params("prompt must be a list of objects");

  std::string user_text{prompt::render(blocks)};
  sess->history.push_back(turn{role::user, blocks});

  json::object plan{};
  plan["sessionUpdate"] = "plan";
  plan["entries"] = json::array{
    plan_entry("Understand the request"),
    plan_entry("Respond with guidance or next actions"),
  };
  send_update(sess->id, std::move(plan));

  client host{*router_, state_.client_caps};
  std::string session_id{sess->id};
  turn_context ctx{
    *sess, blocks, user_text, host, [this, session_id](json::object update) {
      send_update(session_id, std::move(update));
    },
    opts_.request_timeout};
  std::string reply_text{co_await responder_->respond(ctx)};

  for (auto& chunk : prompt::chunk_text(reply_text, opts_.chunk_size)) {
    json::object update{};
    update["sessionUpdate"] = "agent_message_chunk";
    update["content"] = text_block(chunk);
    send_update(session_id, std::move(update));
  }

  sess->history.push_back(turn{role::agent, json::array{text_block(reply_text)}});
  LOG_DEBUG(
      "session/prompt: {} turn done, history has {} entries", session_id,
      sess->history.size());

  json::object result{};
  result["stopReason"] = "end_turn";
  co_return json::value(std::move(result));
}

void agent::do_session_cancel(const json::object& params) {
  if (require_initialized("session/cancel")) {
    LOG_WARN("session/cancel before initialize ignored");
    return;
  }
  auto found = find_session(params);
  if (auto* err = std::get_if<jsonrpc::error_object>(&found)) {
    LOG_WARN("session/cancel ignored: {}", err->data ? json::serialize(*err->data) : err->message);
    return;
  }
  auto* sess = std::get<session*>(found);
  LOG_INFO("session/cancel: {}", sess->id);

  // Advisory only: a turn that already started runs to completion.
  json::object update{};
  update["sessionUpdate"] = "agent_message_chunk";
  update["content"] = text_block("Cancellation requested.");
  send_update(sess->id, std::move(update));
}

std::variant<session*, jsonrpc::error_object> agent::find_session(
    const json::object& params) {
  auto* id = string_at(params, "sessionId");
  if (!id) return invalid_params("sessionId must be a string");
  auto it = state_.sessions.find(std::string{sv(*id)});
  if (it == state_.sessions.end()) {
    json::object data{};
    data["detail"] = "Unknown sessionId";
    data["sessionId"] = *id;
    return make_error(jsonrpc::invalid_params, "Invalid params", std::move(data));
  }
  return &it->second;
}

std::optional<jsonrpc::error_object> agent::require_initialized(
    std::string_view method_name) const {
  if (state_.protocol_version) return std::nullopt;
  json::object data{};
  data["detail"] = fmt::format("Call initialize before {}", method_name);
  return make_error(jsonrpc::not_initialized, "Not initialized", std::move(data));
}

std::string agent::new_session_id() const {
  std::random_device rd{};
  std::uniform_int_distribution<unsigned> byte{0, 255};
  for (;;) {
    std::string id{"sess_"};
    for (int i = 0; i < 12; ++i) id += fmt::format("{:02x}", byte(rd));
    if (!state_.sessions.contains(id)) return id;
  }
}

void agent::send_update(std::string_view session_id, json::object update) {
  json::object params{};
  params["sessionId"] = session_id;
  params["update"] = std::move(update);
  send(jsonrpc::make_notification("session/update", std::move(params)));
}

void agent::send(const jsonrpc::message& msg) {
  if (auto failure = jsonrpc::send(*sink_, msg))
    LOG_ERROR("dropping outbound message: {}", *failure);
}

}  // namespace sentience
