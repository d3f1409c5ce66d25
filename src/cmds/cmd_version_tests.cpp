#include "cmds/cmd_version.h"

#include "doctest.h"

#include <type_traits>

TEST_CASE("cmd_version config exposes cmd_t alias") {
  using config_type = mosaic::cmd_version::cfg;
  using expected_command = mosaic::cmd_version;
  using actual_command = config_type::cmd_t;

  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd_version execute is callable") {
  auto cmd{ mosaic::cmd::create(mosaic::cmd_version::cfg{}, mosaic::app_config{}) };
  CHECK_NOTHROW(cmd->execute());
}
