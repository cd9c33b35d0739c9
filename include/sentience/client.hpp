// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file client.hpp
 * @brief Capability-gated wrappers for host-provided methods.
 *
 * The host advertises optional features in @c initialize.clientCapabilities.
 * Every helper here checks the matching flag and validates its arguments
 * locally before anything is written to the wire, then delegates to
 * @ref router::request and returns its result unchanged.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "sentience/router.hpp"

namespace sentience {

/// The host's capability document, normalized once at initialize time.
struct client_capabilities {
  bool fs_read_text_file{};
  bool fs_write_text_file{};
  bool terminal{};
  json::object raw{};

  static client_capabilities from_json(const json::object& caps);
};

using env_pairs = std::vector<std::pair<std::string, std::string>>;

/** @brief Environment for @c terminal/create in any of its accepted shapes.
 *
 * A name to value map, an ordered list of pairs, or the wire shape itself
 * (a JSON array of @c {name, value} objects, or a JSON object).
 */
using env_input = std::variant<
    std::monostate, std::map<std::string, std::string>, env_pairs,
    json::value>;

/// Normalize @p env to the wire shape, or explain why it can't be.
std::variant<json::array, call_error> normalize_env(const env_input& env);

struct read_options {
  std::optional<std::int64_t> line{};
  std::optional<std::int64_t> limit{};
  std::chrono::milliseconds timeout{router::default_timeout};
};

struct terminal_options {
  std::vector<std::string> args{};
  env_input env{};
  std::optional<std::string> cwd{};
  std::optional<std::int64_t> output_byte_limit{};
  std::chrono::milliseconds timeout{router::default_timeout};
};

struct permission_option {
  std::string option_id;
  std::string name;
  std::string kind;
};

/// "allow-once" / "reject-once", offered when the caller supplies none.
std::vector<permission_option> default_permission_options();

class client {
 public:
  client(router& r, const client_capabilities& caps)
      : router_{&r}, caps_{&caps} {}

  [[nodiscard]] const client_capabilities& capabilities() const {
    return *caps_;
  }

  asio::awaitable<call_result> read_text_file(
      std::string session_id, std::string path, read_options opts = {});

  asio::awaitable<call_result> write_text_file(
      std::string session_id, std::string path, std::string content,
      std::chrono::milliseconds timeout = router::default_timeout);

  asio::awaitable<call_result> terminal_create(
      std::string session_id, std::string command, terminal_options opts = {});

  asio::awaitable<call_result> terminal_output(
      std::string session_id, std::string terminal_id,
      std::chrono::milliseconds timeout = router::default_timeout);

  asio::awaitable<call_result> terminal_wait_for_exit(
      std::string session_id, std::string terminal_id,
      std::chrono::milliseconds timeout = router::default_timeout);

  asio::awaitable<call_result> terminal_kill(
      std::string session_id, std::string terminal_id,
      std::chrono::milliseconds timeout = router::default_timeout);

  asio::awaitable<call_result> terminal_release(
      std::string session_id, std::string terminal_id,
      std::chrono::milliseconds timeout = router::default_timeout);

  /** @brief Ask the user whether a tool call may proceed.
   *
   * @p tool_call must carry a string @c toolCallId; any other fields are
   * passed through.  Without @p options the default allow/reject pair is
   * offered.
   */
  asio::awaitable<call_result> request_permission(
      std::string session_id, json::object tool_call,
      std::optional<std::vector<permission_option>> options = std::nullopt,
      std::chrono::milliseconds timeout = router::default_timeout);

  /** @brief Call an arbitrary host method with @c sessionId added.
   *
   * @c fs/ and @c terminal/ methods are gated on the matching capability
   * like the typed helpers, and an @c fs/ method with no capability flag is
   * unsupported.  Anything else goes straight to the router.
   */
  asio::awaitable<call_result> call(
      std::string session_id, std::string method, json::object params,
      std::chrono::milliseconds timeout = router::default_timeout);

 private:
  asio::awaitable<call_result> terminal_call(
      std::string method, std::string session_id, std::string terminal_id,
      std::chrono::milliseconds timeout);

  router* router_;
  const client_capabilities* caps_;
};

}  // namespace sentience
