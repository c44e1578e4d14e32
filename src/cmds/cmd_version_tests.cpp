#include "cmds/cmd_version.h"

#include "doctest.h"

TEST_CASE("cmd_version config exposes cmd_t alias") {
  using config_type = depconf::cmd_version::cfg;
  using expected_command = depconf::cmd_version;
  using actual_command = config_type::cmd_t;

  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd_version: execute succeeds") {
  depconf::cmd_version cmd{ depconf::cmd_version::cfg{} };
  CHECK(cmd.execute());
}
