#include <csignal>
#include <exception>
#include <span>
#include <typeinfo>

#include "../libsentience/logger.hpp"
#include "../libsentience/utils.hpp"
#include "options.hpp"
#include "stdio.hpp"

namespace app = sentience::app;

int main(int argc, char* argv[]) {
  app::cli_options opts{};

  auto done = app::parse_options(std::span(argv, argc), opts);
  if (done) return done.value();

  sentience::logger::set_level(
      static_cast<sentience::logger::level>(opts.loglevel));
  LOG_DEBUG("loglevel={} acp={}", opts.loglevel, opts.acp);

  // A host that stops reading must surface as EPIPE on the write, not kill us.
  ::signal(SIGPIPE, SIG_IGN);

  try {
    return app::run_stdio(app::to_agent_options(opts));
  } catch (const std::exception& e) {
    LOG_FATAL(
        "{}: {}", sentience::utils::demangle_symbol(typeid(e).name()),
        e.what());
    return 1;
  }
}
