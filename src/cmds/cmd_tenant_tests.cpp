#include "cmds/cmd_common.h"
#include "cmds/cmd_config.h"
#include "cmds/cmd_packs.h"
#include "cmds/cmd_render.h"
#include "cmds/cmd_resolve.h"

#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <stdexcept>
#include <type_traits>

namespace {

struct acme_app {
  std::filesystem::path root{ mosaic::util_make_temp_dir("mosaic-cmd-test-") };
  mosaic::scoped_path_cleanup cleanup{ root };
  mosaic::app_config app;

  acme_app() {
    mosaic::test::write_acme_tenant(root, true);
    app.pack_root = root;
    app.tenant_map = { { "acme.example.com", "acme" } };
    app.domain = "acme.example.com";
  }
};

}  // namespace

TEST_CASE("tenant command configs expose cmd_t aliases") {
  CHECK(std::is_same_v<mosaic::cmd_config::cfg::cmd_t, mosaic::cmd_config>);
  CHECK(std::is_same_v<mosaic::cmd_packs::cfg::cmd_t, mosaic::cmd_packs>);
  CHECK(std::is_same_v<mosaic::cmd_render::cfg::cmd_t, mosaic::cmd_render>);
  CHECK(std::is_same_v<mosaic::cmd_resolve::cfg::cmd_t, mosaic::cmd_resolve>);
}

TEST_CASE_FIXTURE(acme_app, "cmd_load_tenant maps the domain to a tenant") {
  auto const ctx{ mosaic::cmd_load_tenant(app) };
  REQUIRE(ctx.provider != nullptr);
  CHECK(ctx.gui.tenant == "acme");
  CHECK(ctx.gui.domain == "acme.example.com");
  CHECK(ctx.gui.auth.has_value());
  CHECK(ctx.gui.features.size() == 1);
}

TEST_CASE_FIXTURE(acme_app, "cmd_load_tenant fails for a tenant without packs") {
  app.tenant = "nobody";
  CHECK_THROWS_AS(mosaic::cmd_load_tenant(app), std::runtime_error);
}

TEST_CASE_FIXTURE(acme_app, "cmd_config and cmd_packs execute for the tenant") {
  CHECK_NOTHROW(mosaic::cmd::create(mosaic::cmd_config::cfg{}, app)->execute());
  CHECK_NOTHROW(mosaic::cmd::create(mosaic::cmd_packs::cfg{}, app)->execute());
}

TEST_CASE_FIXTURE(acme_app, "cmd_resolve handles redirects and served routes") {
  SUBCASE("no session") {
    mosaic::cmd_resolve::cfg cfg;
    cfg.path = "/invoices";
    mosaic::cmd_resolve cmd{ cfg, app };
    CHECK(cmd.get_cfg().path == "/invoices");
    CHECK_NOTHROW(cmd.execute());
  }

  SUBCASE("with session") {
    mosaic::cmd_resolve::cfg cfg;
    cfg.path = "/invoices";
    cfg.session_token = "token-123";
    CHECK_NOTHROW(mosaic::cmd::create(cfg, app)->execute());
  }
}

TEST_CASE_FIXTURE(acme_app, "cmd_render renders the served document") {
  mosaic::cmd_render::cfg cfg;
  cfg.path = "/invoices";
  cfg.session_token = "token-123";
  cfg.user_id = "user-1";

  SUBCASE("static only") {
    cfg.static_only = true;
    CHECK_NOTHROW(mosaic::cmd::create(cfg, app)->execute());
  }

  SUBCASE("with the module renderer") {
    CHECK_NOTHROW(mosaic::cmd::create(cfg, app)->execute());
  }

  SUBCASE("redirect") {
    cfg.session_token.reset();
    CHECK_NOTHROW(mosaic::cmd::create(cfg, app)->execute());
  }

  SUBCASE("invalid sandbox limits") {
    app.fragment_timeout_ms = 0;
    CHECK_THROWS_AS(mosaic::cmd::create(cfg, app)->execute(), std::invalid_argument);
  }
}
