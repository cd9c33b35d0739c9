#include "options.hpp"

#include <fmt/format.h>

#include <CLI/CLI.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace sentience::app {

std::optional<int> parse_options(std::span<char*> args, cli_options& opts) {
  agent_options defaults{};
  CLI::App app{"Coding agent speaking the Agent Client Protocol over stdio"};

  app.set_version_flag("--version", defaults.version);
  app.add_flag(
      "--acp", opts.acp,
      "Serve ACP on stdin/stdout (the default when no mode is given)")
    ->capture_default_str();
  app.add_option(
      "-d,--debug",
      opts.loglevel,
      "Log level on stderr, 0=FATAL .. 5=TRACE (3=INFO)")
    ->envname("SENTIENCE_LOG_LEVEL")
    ->check(CLI::Range(0, 5))
    ->capture_default_str();
  app.add_option(
      "--chunk-size",
      opts.chunk_size,
      fmt::format(
          "Code points per streamed message chunk, 0 for one chunk "
          "(default {})",
          defaults.chunk_size))
    ->check(CLI::NonNegativeNumber);
  app.add_option(
      "--request-timeout-ms",
      opts.request_timeout_ms,
      fmt::format(
          "Deadline for requests sent to the editor (default {})",
          defaults.request_timeout.count()))
    ->check(CLI::PositiveNumber);

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  return std::nullopt;
}

agent_options to_agent_options(const cli_options& opts) {
  agent_options res{};
  if (opts.chunk_size) res.chunk_size = *opts.chunk_size;
  if (opts.request_timeout_ms)
    res.request_timeout = std::chrono::milliseconds{*opts.request_timeout_ms};
  return res;
}

}  // namespace sentience::app
