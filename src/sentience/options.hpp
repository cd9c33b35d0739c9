#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "sentience/agent.hpp"

namespace sentience::app {

struct cli_options {
  bool acp{false};
  int loglevel{3};
  std::optional<std::size_t> chunk_size{};
  std::optional<std::int64_t> request_timeout_ms{};
};

// Returns an exit code when the process should stop right away (help,
// version, bad arguments).
std::optional<int> parse_options(std::span<char*> args, cli_options& opts);

// Fold command-line overrides into the agent's configuration.
agent_options to_agent_options(const cli_options& opts);

}  // namespace sentience::app
