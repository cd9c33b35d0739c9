// SPDX-License-Identifier: MIT
#include "sentience/router.hpp"

#include <fmt/format.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "logger.hpp"
#include "utils.hpp"

namespace sentience {

std::string_view to_string(call_errc errc) {
  // clang-format off
  switch (errc) {
  case call_errc::timeout:        return "timeout";
  case call_errc::send_failed:    return "send_failed";
  case call_errc::router_stopped: return "router_stopped";
  case call_errc::unsupported:    return "unsupported";
  case call_errc::invalid_path:   return "invalid_path";
  case call_errc::invalid_params: return "invalid_params";
  }
  // clang-format on
  return "unknown";
}

std::string describe(const call_result& r) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, json::value>) {
          return json::serialize(v);
        } else if constexpr (std::is_same_v<T, jsonrpc::error_object>) {
          return fmt::format("host error {}: {}", v.code, v.message);
        } else {
          if (v.detail.empty()) return std::string{to_string(v.code)};
          return fmt::format("{}: {}", to_string(v.code), v.detail);
        }
      },
      r);
}

router::pending_request::pending_request(
    const asio::any_io_executor& executor, std::int64_t id, std::string method,
    clock_t::time_point deadline)
    : id{id},
      method{std::move(method)},
      created_at{clock_t::now()},
      deadline{deadline},
      timer{executor, deadline} {}

router::router(
    asio::any_io_executor executor, jsonrpc::line_sink& sink,
    std::int64_t id_start)
    : executor_{std::move(executor)}, sink_{&sink}, next_id_{id_start} {
  if (id_start <= 0)
    utils::throwf<std::invalid_argument>(
        "router id_start must be positive, got {}", id_start);
}

router::~router() { stop(); }

asio::awaitable<call_result> router::request(
    std::string method, json::value params,
    std::chrono::milliseconds timeout) {
  if (stopped_) co_return call_error{call_errc::router_stopped};

  const std::int64_t id{next_id_++};
  LOG_DEBUG(
      "-> host request id={} method={} timeout_ms={}", id, method,
      timeout.count());

  if (auto failure = jsonrpc::send(
          *sink_, jsonrpc::request{id, method, std::move(params)})) {
    LOG_DEBUG("-> host send failed id={} reason={}", id, *failure);
    co_return call_error{call_errc::send_failed, std::move(*failure), id};
  }

  auto entry = std::make_shared<pending_request>(
      executor_, id, std::move(method), clock_t::now() + timeout);
  pending_.emplace(id, entry);

  boost::system::error_code ec{};
  co_await entry->timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));

  if (entry->outcome) co_return std::move(*entry->outcome);

  // The deadline won.  A reply arriving from now on is stale.
  pending_.erase(id);
  LOG_DEBUG("<- host timeout id={} method={}", id, entry->method);
  co_return call_error{
    call_errc::timeout,
    fmt::format("{} got no reply within {}ms", entry->method, timeout.count()),
    id};
}

std::optional<jsonrpc::send_failure> router::notify(
    std::string method, json::value params) {
  LOG_DEBUG("-> host notification method={}", method);
  return jsonrpc::send(
      *sink_, jsonrpc::notification{std::move(method), std::move(params)});
}

bool router::handle_incoming(const jsonrpc::message& msg) {
  if (auto* res = std::get_if<jsonrpc::response>(&msg)) {
    auto* id = std::get_if<std::int64_t>(&res->id);
    return id && resolve(*id, res->result);
  }
  if (auto* err = std::get_if<jsonrpc::error_response>(&msg)) {
    if (!err->id) return false;
    auto* id = std::get_if<std::int64_t>(&*err->id);
    return id && resolve(*id, err->error);
  }
  return false;
}

bool router::resolve(std::int64_t id, call_result outcome) {
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    LOG_DEBUG("<- host reply for unknown id={} (stale or foreign)", id);
    return false;
  }
  auto entry = std::move(it->second);
  pending_.erase(it);

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      clock_t::now() - entry->created_at);
  LOG_DEBUG(
      "<- host reply id={} method={} ok={} after {}ms", id, entry->method,
      succeeded(outcome), elapsed.count());

  entry->outcome = std::move(outcome);
  entry->timer.cancel();
  return true;
}

void router::stop() {
  if (stopped_) return;
  stopped_ = true;
  for (auto& [id, entry] : pending_) {
    LOG_DEBUG("router stopping; failing pending id={} method={}", id, entry->method);
    entry->outcome = call_error{call_errc::router_stopped, {}, id};
    entry->timer.cancel();
  }
  pending_.clear();
}

}  // namespace sentience
