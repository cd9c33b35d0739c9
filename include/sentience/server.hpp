// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file server.hpp
 * @brief The single dispatch point between the line stream and the agent.
 *
 * The transport feeds decoded lines with @ref server::feed_line as fast as
 * they arrive.  Replies to agent-initiated calls are routed immediately, so
 * a handler waiting on the host is woken even while it holds the dispatch
 * loop.  Requests and notifications are queued and handed to the
 * @ref agent one at a time, in arrival order, by @ref server::run.
 */

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <deque>
#include <memory>
#include <string_view>

#include "sentience/agent.hpp"
#include "sentience/jsonrpc.hpp"
#include "sentience/router.hpp"

namespace sentience {

class server {
 public:
  server(
      asio::any_io_executor executor, jsonrpc::line_sink& sink,
      agent_options opts = {}, std::unique_ptr<responder> resp = nullptr);
  server(const server&) = delete;
  server(server&&) = delete;
  server& operator=(const server&) = delete;
  server& operator=(server&&) = delete;
  ~server() = default;

  /// Decode one input line and route or queue it.  Never throws.
  void feed_line(std::string_view line);

  /// Input is exhausted: fail pending calls and let @ref run finish.
  void close();

  /// Dispatch queued messages until @ref close and the queue is empty.
  asio::awaitable<void> run();

  [[nodiscard]] router& rpc() noexcept { return router_; }
  [[nodiscard]] const agent& handler() const noexcept { return agent_; }
  [[nodiscard]] bool closed() const noexcept { return closed_; }
  [[nodiscard]] std::size_t queued() const noexcept { return inbox_.size(); }

 private:
  void reject(const jsonrpc::decode_error& err);

  jsonrpc::line_sink* sink_;
  router router_;
  agent agent_;
  std::deque<jsonrpc::message> inbox_{};
  asio::steady_timer wake_;
  bool closed_{false};
};

}  // namespace sentience
