#pragma once

#include "cmd.h"

#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace mosaic {

class cmd_resolve : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_resolve> {
    std::string path;
    std::optional<std::string> session_token;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_resolve(cfg cfg, app_config const &app);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  app_config const &app_;
};

}  // namespace mosaic
