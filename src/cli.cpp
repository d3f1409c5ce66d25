#include "cli.h"

#include "CLI11.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace mosaic {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "mosaic - tenant web gui composer" };
  app.allow_windows_style_options(false);
  app.require_subcommand(0, 1);

  cli_args args{};
  app_config &config{ args.config };

  bool verbose{ false };
  app.add_flag("--verbose",
               verbose,
               "Enable decorated verbose logging (prefix output with timestamp and level)");

  std::string log_level;
  app.add_option("--log-level", log_level, "Log threshold: debug, info, warn, error")
      ->envname("MOSAIC_LOG_LEVEL");

  bool version_flag{ false };
  app.add_flag("-v,--version",
               version_flag,
               "Show version information (alias for version subcommand)");

  std::string pack_root{ config.pack_root.string() };
  app.add_option("--pack-root", pack_root, "Filesystem pack root")
      ->envname("MOSAIC_PACK_ROOT");
  app.add_option("--default-tenant",
                 config.default_tenant,
                 "Tenant used when the domain is not mapped")
      ->envname("MOSAIC_TENANT");
  app.add_option("--tenant", config.tenant, "Tenant id (overrides the domain mapping)");
  app.add_option("--domain", config.domain, "Request domain mapped through --tenant-map");

  std::string tenant_map;
  app.add_option("--tenant-map", tenant_map, "JSON object mapping domain to tenant")
      ->envname("MOSAIC_TENANT_MAP");
  app.add_option("--env", config.environment_id, "Environment id")->envname("MOSAIC_ENV");

  app.add_option("--distributor-url", config.distributor.url, "Distributor base url")
      ->envname("MOSAIC_DISTRIBUTOR_URL");
  app.add_option("--distributor-env",
                 config.distributor.environment_id,
                 "Distributor environment id (defaults to --env)")
      ->envname("MOSAIC_DISTRIBUTOR_ENV");
  app.add_option("--distributor-token",
                 config.distributor.token,
                 "Bearer token for the distributor")
      ->envname("MOSAIC_DISTRIBUTOR_TOKEN");
  app.add_option("--distributor-packs",
                 config.distributor.packs_json,
                 "JSON object mapping pack kind to {pack_id, component_id, version}")
      ->envname("MOSAIC_DISTRIBUTOR_PACKS");

  app.add_option("--fragment-timeout-ms",
                 config.fragment_timeout_ms,
                 "Per-fragment execution deadline in milliseconds")
      ->envname("MOSAIC_FRAGMENT_TIMEOUT_MS")
      ->check(CLI::PositiveNumber);
  app.add_option("--fragment-memory-mb",
                 config.fragment_memory_mb,
                 "Per-fragment memory ceiling in MiB")
      ->envname("MOSAIC_FRAGMENT_MEMORY_MB")
      ->check(CLI::PositiveNumber);

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto const on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_resolve::register_cli(app, on_selected);
  cmd_render::register_cli(app, on_selected);
  cmd_config::register_cli(app, on_selected);
  cmd_packs::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  config.pack_root = pack_root;

  if (!args.cli_output.empty()) { return args; }

  try {
    config.tenant_map = app_config_parse_tenant_map(tenant_map);
  } catch (std::runtime_error const &e) {
    args.cli_output = e.what();
    return args;
  }

  if (verbose) {
    args.verbosity = log::level::LOG_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = log::level::LOG_INFO;
  }

  if (!log_level.empty()) {
    auto const parsed{ log::parse_level(log_level) };
    if (!parsed) {
      args.cli_output = "Invalid log level: " + log_level;
      return args;
    }
    args.verbosity = parsed;
  }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = *cmd_cfg;
  } else {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace mosaic
