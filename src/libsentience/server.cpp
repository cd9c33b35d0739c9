// SPDX-License-Identifier: MIT
#include "sentience/server.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <utility>

#include "logger.hpp"

namespace sentience {

server::server(
    asio::any_io_executor executor, jsonrpc::line_sink& sink,
    agent_options opts, std::unique_ptr<responder> resp)
    : sink_{&sink},
      router_{executor, sink},
      agent_{router_, sink, std::move(opts), std::move(resp)},
      wake_{executor} {}

void server::feed_line(std::string_view line) {
  line = jsonrpc::trim_line_end(line);
  auto decoded = jsonrpc::decode(line);
  if (auto* err = std::get_if<jsonrpc::decode_error>(&decoded)) {
    reject(*err);
    return;
  }
  auto& msg = std::get<jsonrpc::message>(decoded);

  if (router_.handle_incoming(msg)) return;

  if (std::holds_alternative<jsonrpc::response>(msg) ||
      std::holds_alternative<jsonrpc::error_response>(msg)) {
    LOG_WARN("dropping reply with no pending request: {}", line);
    return;
  }

  if (closed_) {
    LOG_WARN("input closed, dropping: {}", line);
    return;
  }
  inbox_.push_back(std::move(msg));
  wake_.cancel();
}

void server::close() {
  if (closed_) return;
  LOG_INFO("input closed, {} message(s) still queued", inbox_.size());
  closed_ = true;
  router_.stop();
  wake_.cancel();
}

asio::awaitable<void> server::run() {
  for (;;) {
    while (!inbox_.empty()) {
      auto msg = std::move(inbox_.front());
      inbox_.pop_front();
      co_await agent_.handle(std::move(msg));
    }
    if (closed_) break;

    boost::system::error_code ec;
    wake_.expires_at(asio::steady_timer::time_point::max());
    co_await wake_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
  }
  LOG_DEBUG("dispatch loop finished");
}

void server::reject(const jsonrpc::decode_error& err) {
  if (err.code == jsonrpc::decode_errc::empty) return;

  LOG_WARN("undecodable line ({}): {}", to_string(err.code), err.detail);
  if (err.code != jsonrpc::decode_errc::invalid_shape || !err.id) return;

  json::object data{};
  data["detail"] = err.detail;
  auto reply = jsonrpc::make_error(
      err.id, jsonrpc::invalid_request, "Invalid Request", json::value(std::move(data)));
  if (auto failure = jsonrpc::send(*sink_, reply))
    LOG_ERROR("dropping outbound message: {}", *failure);
}

}  // namespace sentience
