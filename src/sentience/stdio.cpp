#include "stdio.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <array>
#include <exception>
#include <string>

#include "../libsentience/logger.hpp"

namespace sentience::app {

/// stdout_sink

stdout_sink::stdout_sink(const asio::any_io_executor& executor)
    : out_{executor, ::dup(STDOUT_FILENO)} {}

std::optional<jsonrpc::send_failure> stdout_sink::write_line(
    std::string_view line) {
  std::array<asio::const_buffer, 2> bufs{
    asio::buffer(line.data(), line.size()), asio::buffer("\n", 1)};

  std::lock_guard lock{mutex_};
  boost::system::error_code ec;
  asio::write(out_, bufs, ec);
  if (ec) return fmt::format("write to stdout failed: {}", ec.message());
  return std::nullopt;
}

/// Read loop

asio::awaitable<void> read_lines(
    asio::posix::stream_descriptor& in, server& srv) {
  std::string buffer{};
  for (;;) {
    boost::system::error_code ec;
    std::size_t n = co_await asio::async_read_until(
        in, asio::dynamic_buffer(buffer), '\n',
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
      if (ec != asio::error::eof) LOG_ERROR("reading stdin: {}", ec.message());
      // A last line without its newline still counts.
      if (!buffer.empty()) srv.feed_line(buffer);
      break;
    }
    srv.feed_line(std::string_view{buffer.data(), n});
    buffer.erase(0, n);
  }
  LOG_INFO("stdin closed");
  srv.close();
}

/// Server

int run_stdio(agent_options opts) {
  asio::io_context ctx;
  stdout_sink sink{ctx.get_executor()};
  server srv{ctx.get_executor(), sink, std::move(opts)};
  asio::posix::stream_descriptor in{ctx, ::dup(STDIN_FILENO)};

  std::exception_ptr failure{};
  auto on_done = [&failure](std::exception_ptr e) {
    if (e && !failure) failure = e;
  };
  asio::co_spawn(ctx, read_lines(in, srv), on_done);
  asio::co_spawn(ctx, srv.run(), on_done);

  LOG_INFO("sentience --acp: serving on stdio");
  ctx.run();

  if (failure) std::rethrow_exception(failure);
  LOG_INFO("stdio session ended");
  return 0;
}

}  // namespace sentience::app
