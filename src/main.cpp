#include "cli.h"
#include "libcurl_util.h"
#include "log.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  mosaic::log::init();

  auto args{ mosaic::cli_parse(argc, argv) };
  mosaic::log::scope log_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      mosaic::log::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    mosaic::log::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  try {
    mosaic::libcurl_ensure_initialized();

    auto cmd{ std::visit(
        [&args](auto const &cfg) { return mosaic::cmd::create(cfg, args.config); },
        *args.cmd_cfg) };
    cmd->execute();
  } catch (std::exception const &ex) {
    mosaic::log::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
