#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <mutex>
#include <optional>
#include <string_view>

#include "sentience/agent.hpp"
#include "sentience/jsonrpc.hpp"
#include "sentience/server.hpp"

namespace sentience::app {

// Owns a duplicate of the process's stdout.  Each line goes out in one
// blocking write under a lock, so lines never interleave.
class stdout_sink : public jsonrpc::line_sink {
 public:
  explicit stdout_sink(const asio::any_io_executor& executor);

  std::optional<jsonrpc::send_failure> write_line(std::string_view line) override;

 private:
  std::mutex mutex_;
  asio::posix::stream_descriptor out_;
};

// Feed stdin to @p srv line by line until EOF, then close it.
asio::awaitable<void> read_lines(
    asio::posix::stream_descriptor& in, server& srv);

// Serve ACP on stdin/stdout until stdin is exhausted.
int run_stdio(agent_options opts);

}  // namespace sentience::app
