#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sentience/jsonrpc.hpp"

namespace sentience::test {

namespace asio = boost::asio;
namespace json = boost::json;

// Remembers every line written to it.  Set `fail` to make writes fail.
struct capture_sink : jsonrpc::line_sink {
  std::vector<std::string> lines{};
  bool fail{false};

  std::optional<jsonrpc::send_failure> write_line(
      std::string_view line) override {
    if (fail) return jsonrpc::send_failure{"sink closed"};
    lines.emplace_back(line);
    return std::nullopt;
  }

  [[nodiscard]] json::object at(std::size_t i) const {
    return json::parse(lines.at(i)).as_object();
  }

  [[nodiscard]] json::object last() const { return at(lines.size() - 1); }
};

// Start @p aw on @p ctx; the slot fills in when it completes.
template <typename T>
std::shared_ptr<std::optional<T>> spawn(
    asio::io_context& ctx, asio::awaitable<T> aw) {
  auto slot = std::make_shared<std::optional<T>>();
  asio::co_spawn(ctx, std::move(aw), [slot](std::exception_ptr e, T v) {
    if (e) std::rethrow_exception(e);
    *slot = std::move(v);
  });
  return slot;
}

inline std::shared_ptr<bool> spawn(
    asio::io_context& ctx, asio::awaitable<void> aw) {
  auto done = std::make_shared<bool>(false);
  asio::co_spawn(ctx, std::move(aw), [done](std::exception_ptr e) {
    if (e) std::rethrow_exception(e);
    *done = true;
  });
  return done;
}

// Run every handler that is ready now, without blocking.
inline void settle(asio::io_context& ctx) {
  ctx.restart();
  ctx.poll();
}

// Run handlers until @p pred holds or @p limit passes.
template <typename Pred>
bool run_until(
    asio::io_context& ctx, Pred pred,
    std::chrono::milliseconds limit = std::chrono::seconds{5}) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    ctx.restart();
    ctx.run_one_for(std::chrono::milliseconds{10});
  }
  return true;
}

// Parse the id of an outbound request line.
inline std::int64_t id_of(const json::object& msg) {
  return msg.at("id").as_int64();
}

}  // namespace sentience::test
