// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file agent.hpp
 * @brief The protocol state machine: negotiation, sessions, prompt turns.
 *
 * An @ref agent owns all protocol state for the lifetime of the process.  It
 * is fed one inbound request or notification at a time by a single dispatch
 * loop, so no two messages ever touch the state concurrently.  Handling a
 * message may suspend (a prompt turn may call back into the host through
 * the @ref router), but the next message is not handled until this one has
 * been answered.
 *
 * Every notification produced while handling a request is written before
 * that request's response.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "sentience/client.hpp"
#include "sentience/jsonrpc.hpp"
#include "sentience/router.hpp"

namespace sentience {

/// Inbound methods this agent understands.  Anything else is @c unknown.
enum class method {
  initialize,
  authenticate,
  session_new,
  session_load,
  session_set_mode,
  session_prompt,
  session_cancel,
  unknown,
};

method parse_method(std::string_view name);

enum class role { user, agent };

struct turn {
  role who;
  json::array content;
};

enum class session_status { active };

struct session {
  std::string id;
  std::string cwd;
  std::optional<std::string> mode{};
  json::array mcp_servers{};
  std::vector<turn> history{};
  session_status status{session_status::active};
};

struct agent_state {
  std::optional<std::int64_t> protocol_version{};
  json::object client_info{};
  client_capabilities client_caps{};
  std::unordered_map<std::string, session> sessions{};
};

struct agent_options {
  std::string name{"sentience"};
  std::string title{"Sentience"};
  std::string version{"0.1.0"};
  // Code points per agent_message_chunk; 0 sends the reply in one chunk.
  std::size_t chunk_size{600};
  std::chrono::milliseconds request_timeout{router::default_timeout};
};

inline constexpr std::int64_t protocol_version{1};

/// What a responder sees of the turn it is asked to answer.
struct turn_context {
  const session& sess;
  const json::array& prompt;
  std::string_view prompt_text;
  client& host;
  // Emits a session/update for this session.
  std::function<void(json::object)> update;
  // Deadline to use for calls into the host.
  std::chrono::milliseconds timeout;
};

/** @brief Produces the agent's side of a prompt turn.
 *
 * This is where a model backend plugs in.  The returned text is streamed to
 * the host as agent_message_chunk updates and recorded in the history.
 *
 * The agent never runs tools itself.  A responder that wants them passes
 * @c ctx.host, @c ctx.update and @c ctx.timeout to
 * @c tooling::execute_tool_calls, and wires its own @c cancelled check.
 * @ref echo_responder runs none.
 */
class responder {
 public:
  responder() = default;
  responder(const responder&) = delete;
  responder(responder&&) = delete;
  responder& operator=(const responder&) = delete;
  responder& operator=(responder&&) = delete;
  virtual ~responder() = default;

  virtual asio::awaitable<std::string> respond(turn_context& ctx) = 0;
};

/// Acknowledges the prompt and echoes its rendered text.
class echo_responder : public responder {
 public:
  asio::awaitable<std::string> respond(turn_context& ctx) override;
};

class agent {
 public:
  agent(
      router& r, jsonrpc::line_sink& sink, agent_options opts = {},
      std::unique_ptr<responder> resp = nullptr);
  agent(const agent&) = delete;
  agent(agent&&) = delete;
  agent& operator=(const agent&) = delete;
  agent& operator=(agent&&) = delete;
  ~agent() = default;

  /** @brief Handle one inbound request or notification.
   *
   * Writes any notifications and then, for requests, exactly one response.
   * Exceptions escaping a handler are logged and answered with
   * @c -32603 Internal error; they never propagate.
   */
  asio::awaitable<void> handle(jsonrpc::message msg);

  [[nodiscard]] const agent_state& state() const noexcept { return state_; }
  [[nodiscard]] const agent_options& options() const noexcept { return opts_; }

 private:
  using reply = std::variant<json::value, jsonrpc::error_object>;

  asio::awaitable<reply> dispatch(
      method m, std::string_view name, const json::object& params);

  reply do_initialize(const json::object& params);
  reply do_session_new(const json::object& params);
  reply do_session_set_mode(const json::object& params);
  asio::awaitable<reply> do_session_prompt(const json::object& params);
  void do_session_cancel(const json::object& params);

  std::variant<session*, jsonrpc::error_object> find_session(
      const json::object& params);
  std::optional<jsonrpc::error_object> require_initialized(
      std::string_view method_name) const;
  std::string new_session_id() const;

  void send_update(std::string_view session_id, json::object update);
  void send(const jsonrpc::message& msg);

  router* router_;
  jsonrpc::line_sink* sink_;
  agent_options opts_;
  std::unique_ptr<responder> responder_;
  agent_state state_{};
};

}  // namespace sentience
