// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file router.hpp
 * @brief Correlation of agent-initiated JSONRPC requests with host replies.
 *
 * The agent and the host share one bidirectional stdio stream.  When the
 * agent needs the host to do something (read a file, run a command, ask the
 * user) it allocates a fresh integer id, writes the request and suspends the
 * calling coroutine.  The read loop keeps running and hands every reply to
 * @ref router::handle_incoming, which wakes the matching caller.
 *
 * Each in-flight call parks on its own @c steady_timer that expires at the
 * call's deadline: the timer firing means timeout, a cancelled timer means
 * the call was resolved (or the router was stopped).
 */

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

#include "sentience/jsonrpc.hpp"

namespace sentience {

namespace asio = boost::asio;
namespace json = boost::json;

enum class call_errc {
  timeout,         ///< no reply before the deadline
  send_failed,     ///< the request never left the process
  router_stopped,  ///< input closed while the call was pending
  unsupported,     ///< host did not advertise the needed capability
  invalid_path,    ///< a path argument was not absolute
  invalid_params,  ///< other local argument validation failure
};

std::string_view to_string(call_errc errc);

/// Local failure of an agent-initiated call.  Never forwarded to the host.
struct call_error {
  call_errc code;
  std::string detail{};
  std::optional<std::int64_t> id{};
};

/** @brief Outcome of an agent-initiated call.
 *
 * Either the host's @c result, the host's @c error object, or a local
 * @ref call_error.
 */
using call_result = std::variant<json::value, jsonrpc::error_object, call_error>;

inline bool succeeded(const call_result& r) {
  return std::holds_alternative<json::value>(r);
}

std::string describe(const call_result& r);

class router {
 public:
  using clock_t = std::chrono::steady_clock;
  static constexpr std::chrono::milliseconds default_timeout{30'000};

  router(
      asio::any_io_executor executor, jsonrpc::line_sink& sink,
      std::int64_t id_start = 1);
  router(const router&) = delete;
  router(router&&) = delete;
  router& operator=(const router&) = delete;
  router& operator=(router&&) = delete;
  ~router();

  /** @brief Send @p method to the host and wait for the correlated reply.
   *
   * Suspends only the calling coroutine.  Resolves with the host result or
   * error, or with a @ref call_error for timeout, send failure or router
   * shutdown.  If the request cannot be written no pending entry is created.
   */
  asio::awaitable<call_result> request(
      std::string method, json::value params = nullptr,
      std::chrono::milliseconds timeout = default_timeout);

  /// Send a notification to the host.  No reply is expected.
  std::optional<jsonrpc::send_failure> notify(
      std::string method, json::value params = nullptr);

  /** @brief Offer an inbound message to the router.
   *
   * Returns true if @p msg was a reply to a pending call and has been
   * consumed.  Anything else is left for the caller to handle.
   */
  bool handle_incoming(const jsonrpc::message& msg);

  /// Fail every pending call with @c router_stopped and refuse new ones.
  void stop();

  [[nodiscard]] bool stopped() const noexcept { return stopped_; }
  [[nodiscard]] std::size_t pending_count() const noexcept {
    return pending_.size();
  }
  [[nodiscard]] bool is_pending(std::int64_t id) const {
    return pending_.contains(id);
  }

 private:
  struct pending_request {
    pending_request(
        const asio::any_io_executor& executor, std::int64_t id,
        std::string method, clock_t::time_point deadline);

    std::int64_t id;
    std::string method;
    clock_t::time_point created_at;
    clock_t::time_point deadline;
    asio::steady_timer timer;
    std::optional<call_result> outcome{};
  };

  bool resolve(std::int64_t id, call_result outcome);

  asio::any_io_executor executor_;
  jsonrpc::line_sink* sink_;
  std::int64_t next_id_;
  bool stopped_{false};
  std::unordered_map<std::int64_t, std::shared_ptr<pending_request>> pending_;
};

}  // namespace sentience
