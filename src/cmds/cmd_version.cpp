#include "cmd_version.h"

#include "tui.h"

#include "CLI/CLI.hpp"
#include "oneapi/tbb/version.h"
#include "sol/sol.hpp"

#include <memory>

#ifndef DEPCONF_VERSION_STR
#error "DEPCONF_VERSION_STR must be defined by the build system"
#endif

namespace depconf {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("depconf version %s", DEPCONF_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  oneTBB: %s (runtime %s)", TBB_VERSION_STRING, TBB_runtime_version());
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace depconf
