#include "cmd_validate.h"

#include "cmd_common.h"
#include "report.h"
#include "resolution_session.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace depconf {

void cmd_validate::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("validate", "Lock every configuration and report problems") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("script", cfg_ptr->script_path, "Lua build script")
      ->required()
      ->check(CLI::ExistingFile);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_validate::cmd_validate(cmd_validate::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_validate::execute() {
  resolution_session session;
  auto const script{ load_build_script_or_throw(cfg_.script_path, session) };

  auto const failures{ session.lock_all_lenient() };
  if (failures.empty()) {
    tui::info("%zu configuration(s) in project %s are valid",
              script->container().size(),
              script->project_path().c_str());
    return true;
  }

  tui::print_stdout("%s", report_validation_failures(failures).c_str());
  tui::error("Configuration validation failed with %zu problem(s)", failures.size());
  return false;
}

}  // namespace depconf
