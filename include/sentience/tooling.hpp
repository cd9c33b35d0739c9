// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file tooling.hpp
 * @brief Run model tool calls against the host through the client helpers.
 *
 * Each tool call is announced with a @c tool_call update, gated on a
 * permission prompt when it edits or executes, run, and concluded with a
 * @c tool_call_update carrying status and content.  Failures never escape
 * as exceptions: they become @c failed updates and @c ok == false results.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sentience/client.hpp"
#include "sentience/router.hpp"

namespace sentience::tooling {

struct tool_call {
  std::string id;
  std::string name;
  json::object arguments;
};

/** @brief Accept an OpenAI-style call (@c id, @c function.name,
 * @c function.arguments as object or JSON text) or a looser
 * @c {toolCallId|id, name, arguments} object.
 *
 * Missing ids are generated, missing names become "unknown".
 */
tool_call normalize_tool_call(const json::value& raw);

std::string_view tool_kind(std::string_view name);
std::string tool_title(std::string_view name, const json::object& args);

/// Where @c run_command executes.
enum class command_mode {
  client,  ///< host terminal only
  local,   ///< always spawn locally
  automatic,  ///< host terminal, falling back to local when it fails
};

command_mode parse_command_mode(std::string_view text);

/// Reads SENTIENCE_RUN_COMMAND_MODE, defaulting to @c client.
command_mode command_mode_from_env();

struct tool_result {
  std::string tool_call_id;
  std::string name;
  bool ok{};
  json::value output{};
  json::value error{};
};

struct options {
  bool request_permission{true};
  std::chrono::milliseconds timeout{router::default_timeout};
  std::int64_t terminal_output_byte_limit{1'048'576};
  command_mode mode{command_mode_from_env()};
  // Checked before each call; once true the remaining calls are skipped.
  std::function<bool()> cancelled{};
};

using update_fn = std::function<void(json::object)>;

/// Execute @p calls in order.  Skipped calls produce no result.
asio::awaitable<std::vector<tool_result>> execute_tool_calls(
    client& host, std::string session_id, std::vector<tool_call> calls,
    update_fn update, options opts = {});

/// {"role":"tool","tool_call_id","content"} per result, for the model.
json::array to_model_tool_results(const std::vector<tool_result>& results);

struct local_command {
  std::string command;
  std::vector<std::string> args{};
  std::optional<std::string> cwd{};
  env_pairs env{};
  std::chrono::milliseconds timeout{router::default_timeout};
  std::size_t output_limit{1'048'576};
};

struct local_command_result {
  std::string output;
  int exit_code{};
  bool truncated{};
  bool timed_out{};
};

/** @brief Spawn @p cmd on this machine, stderr merged into stdout.
 *
 * Throws std::runtime_error if the executable can't be found or started.
 */
asio::awaitable<local_command_result> run_local_command(local_command cmd);

}  // namespace sentience::tooling
