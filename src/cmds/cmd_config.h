#pragma once

#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace mosaic {

class cmd_config : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_config> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_config(cfg cfg, app_config const &app);

  void execute() override;

 private:
  cfg cfg_;
  app_config const &app_;
};

}  // namespace mosaic
