#include "cmd_config.h"

#include "cmd_common.h"
#include "log.h"

#include "CLI11.hpp"

namespace mosaic {

void cmd_config::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("config", "Print the tenant gui config summary as JSON") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_config::cmd_config(cmd_config::cfg cfg, app_config const &app)
    : cfg_{ std::move(cfg) }, app_{ app } {}

void cmd_config::execute() {
  auto const ctx{ cmd_load_tenant(app_) };
  log::print_stdout("%s\n", tenant_gui_config_summary(ctx.gui).c_str());
}

}  // namespace mosaic
