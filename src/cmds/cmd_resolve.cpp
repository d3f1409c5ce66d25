#include "cmd_resolve.h"

#include "cmd_common.h"
#include "log.h"
#include "routing.h"
#include "session.h"

#include "CLI11.hpp"

#include <memory>

namespace mosaic {

void cmd_resolve::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("resolve", "Resolve a request path to a routing decision") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("path", cfg_ptr->path, "Request path")->required();
  sub->add_option("--session", cfg_ptr->session_token, "Session token");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_resolve::cmd_resolve(cmd_resolve::cfg cfg, app_config const &app)
    : cfg_{ std::move(cfg) }, app_{ app } {}

void cmd_resolve::execute() {
  auto ctx{ cmd_load_tenant(app_) };
  trusting_session_manager sessions{ ctx.gui.tenant, std::nullopt };

  auto const resolved{ ctx.gui.resolve_route(normalize_route(cfg_.path)) };
  log::debug("route %s -> %s",
             cfg_.path.c_str(),
             resolved.document.string().c_str());

  std::visit(match{
                 [](route_redirect const &r) {
                   log::print_stdout("redirect %s\n", r.location.c_str());
                 },
                 [&](route_serve const &s) {
                   log::print_stdout("serve %s\n", resolved.document.string().c_str());
                   log::print_stdout("  authenticated: %s\n",
                                     resolved.authenticated ? "yes" : "no");
                   log::print_stdout("  session: %s\n",
                                     s.session ? s.session->session_id.c_str() : "none");
                   for (auto const &f : s.fragments) {
                     log::print_stdout("  fragment %s -> %s (%s)\n",
                                       f.binding.id.c_str(),
                                       f.binding.selector.c_str(),
                                       f.assets_root.string().c_str());
                   }
                 },
             },
             decide_route(ctx.gui, cfg_.path, cfg_.session_token, sessions));
}

}  // namespace mosaic
