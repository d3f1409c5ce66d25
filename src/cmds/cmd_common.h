#pragma once

#include "config.h"
#include "tenant_config.h"

#include <memory>
#include <string>

namespace mosaic {

struct cmd_tenant_context {
  std::unique_ptr<pack_provider> provider;
  tenant_gui_config gui;
};

// Builds the configured pack provider and assembles the effective tenant's config.
cmd_tenant_context cmd_load_tenant(app_config const &app);

}  // namespace mosaic
