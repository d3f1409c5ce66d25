#pragma once

#include "cmds/cmd_config.h"
#include "cmds/cmd_packs.h"
#include "cmds/cmd_render.h"
#include "cmds/cmd_resolve.h"
#include "cmds/cmd_version.h"
#include "config.h"
#include "log.h"

#include <optional>
#include <string>
#include <variant>

namespace mosaic {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_config::cfg,
                                 cmd_packs::cfg,
                                 cmd_render::cfg,
                                 cmd_resolve::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  app_config config;
  std::optional<log::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;
};

// Environment variables (MOSAIC_*) back every global option.
cli_args cli_parse(int argc, char **argv);

}  // namespace mosaic
