#include "cmd_packs.h"

#include "cmd_common.h"
#include "log.h"

#include "CLI11.hpp"

namespace mosaic {

namespace {

void print_location(pack_kind kind, pack_location const &location) {
  log::print_stdout("%-14s %s\n",
                    pack_kind_name(kind),
                    location.root.string().c_str());
}

}  // namespace

void cmd_packs::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("packs", "List the packs loaded for the tenant") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_packs::cmd_packs(cmd_packs::cfg cfg, app_config const &app)
    : cfg_{ std::move(cfg) }, app_{ app } {}

void cmd_packs::execute() {
  auto const ctx{ cmd_load_tenant(app_) };
  auto const &gui{ ctx.gui };

  log::print_stdout("tenant %s\n", gui.tenant.c_str());
  print_location(pack_kind::layout, gui.layout.location);
  if (gui.auth) { print_location(pack_kind::auth, gui.auth->location); }
  if (gui.skin) { print_location(pack_kind::skin, *gui.skin); }
  if (gui.telemetry) { print_location(pack_kind::telemetry, *gui.telemetry); }
  for (auto const &feature : gui.features) {
    print_location(pack_kind::feature, feature.location);
  }

  for (auto const &req : gui.secret_requirements) {
    log::print_stdout("secret         %s\n", secret_requirement_key(req).c_str());
  }
}

}  // namespace mosaic
