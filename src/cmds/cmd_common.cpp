#include "cmd_common.h"

#include "log.h"

#include <utility>

namespace mosaic {

cmd_tenant_context cmd_load_tenant(app_config const &app) {
  auto provider{ app.make_pack_provider() };
  std::string const &tenant{ app.effective_tenant() };
  log::debug("loading gui config for tenant %s (domain '%s')",
             tenant.c_str(),
             app.domain.c_str());

  auto gui{ tenant_gui_config::load(tenant, app.domain, *provider) };
  return { .provider = std::move(provider), .gui = std::move(gui) };
}

}  // namespace mosaic
