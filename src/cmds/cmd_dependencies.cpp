#include "cmd_dependencies.h"

#include "cmd_common.h"
#include "report.h"
#include "resolution_session.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace depconf {

void cmd_dependencies::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("dependencies", "Print declared dependencies") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("script", cfg_ptr->script_path, "Lua build script")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--configuration", cfg_ptr->configuration, "Report only this configuration");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_dependencies::cmd_dependencies(cmd_dependencies::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_dependencies::execute() {
  resolution_session session;
  auto const script{ load_build_script_or_throw(cfg_.script_path, session) };

  auto const selected{ select_configurations(script->container(),
                                             cfg_.configuration,
                                             [](configuration const &) { return true; }) };

  for (std::size_t i{ 0 }; i < selected.size(); ++i) {
    auto &cfg{ *selected[i] };
    cfg.run_dependency_actions();
    cfg.mark_as_observed(internal_state::build_dependencies_resolved);
    if (cfg.can_be_resolved()) { cfg.maybe_emit_resolution_deprecation(); }

    if (i > 0) { tui::print_stdout("\n"); }
    tui::print_stdout("%s", report_dependencies(cfg).c_str());
  }
  return true;
}

}  // namespace depconf
