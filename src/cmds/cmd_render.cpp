#include "cmd_render.h"

#include "cmd_common.h"
#include "fragments.h"
#include "log.h"
#include "module_fragment_renderer.h"
#include "routing.h"
#include "session.h"

#include "CLI11.hpp"

#include <memory>

namespace mosaic {

void cmd_render::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("render", "Render the document served for a path") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("path", cfg_ptr->path, "Request path")->required();
  sub->add_option("--session", cfg_ptr->session_token, "Session token");
  sub->add_option("--user", cfg_ptr->user_id, "User id passed to fragments");
  sub->add_flag("--static-only",
                cfg_ptr->static_only,
                "Only use static fragment files, never run fragment modules");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_render::cmd_render(cmd_render::cfg cfg, app_config const &app)
    : cfg_{ std::move(cfg) }, app_{ app } {}

void cmd_render::execute() {
  auto ctx{ cmd_load_tenant(app_) };
  trusting_session_manager sessions{ ctx.gui.tenant, cfg_.user_id };

  auto decision{ decide_route(ctx.gui, cfg_.path, cfg_.session_token, sessions) };
  if (auto const *redirect{ std::get_if<route_redirect>(&decision) }) {
    log::info("%s requires a session; redirect to %s",
              cfg_.path.c_str(),
              redirect->location.c_str());
    log::print_stdout("redirect %s\n", redirect->location.c_str());
    return;
  }

  auto &serve{ std::get<route_serve>(decision) };
  std::shared_ptr<module_engine> engine;
  if (!cfg_.static_only) {
    engine = std::make_shared<module_engine>(app_.make_sandbox_limits());
  }
  auto const renderer{ make_fragment_renderer(engine) };

  auto const html{ inject_fragments(std::move(serve.html),
                                    serve.fragments,
                                    serve.session,
                                    ctx.gui.tenant,
                                    normalize_route(cfg_.path),
                                    *renderer) };
  log::print_stdout("%s", html.c_str());
}

}  // namespace mosaic
