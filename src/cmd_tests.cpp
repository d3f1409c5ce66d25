#include "cmd.h"
#include "cmds/cmd_resolve.h"
#include "cmds/cmd_version.h"

#include "doctest.h"

#include <type_traits>

TEST_CASE("cmd factory creates the command named by its config") {
  mosaic::app_config const app;
  mosaic::cmd_resolve::cfg cfg;
  cfg.path = "/invoices";

  auto command_ptr{ mosaic::cmd::create(cfg, app) };

  REQUIRE(command_ptr != nullptr);
  auto const *resolve{ dynamic_cast<mosaic::cmd_resolve *>(command_ptr.get()) };
  REQUIRE(resolve != nullptr);
  CHECK(resolve->get_cfg().path == "/invoices");

  auto version_ptr{ mosaic::cmd::create(mosaic::cmd_version::cfg{}, app) };
  CHECK(dynamic_cast<mosaic::cmd_version *>(version_ptr.get()) != nullptr);
}

TEST_CASE("cmd_cfg provides correct cmd_t typedef") {
  using config_type = mosaic::cmd_resolve::cfg;
  using expected_command = mosaic::cmd_resolve;
  using actual_command = config_type::cmd_t;

  CHECK(std::is_same_v<actual_command, expected_command>);
}
