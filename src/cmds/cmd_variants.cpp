#include "cmd_variants.h"

#include "cmd_common.h"
#include "report.h"
#include "resolution_session.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>

namespace depconf {

void cmd_variants::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("variants", "Report outgoing variants of configurations") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("script", cfg_ptr->script_path, "Lua build script")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--configuration", cfg_ptr->configuration, "Report only this configuration");
  sub->add_flag("--all", cfg_ptr->all, "Include configurations that cannot be consumed");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_variants::cmd_variants(cmd_variants::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_variants::execute() {
  resolution_session session;
  auto const script{ load_build_script_or_throw(cfg_.script_path, session) };

  auto const selected{ select_configurations(
      script->container(),
      cfg_.configuration,
      [this](configuration const &c) { return cfg_.all || c.can_be_consumed(); }) };

  if (selected.empty()) {
    tui::info("No consumable configurations in project %s", script->project_path().c_str());
    return true;
  }

  for (std::size_t i{ 0 }; i < selected.size(); ++i) {
    if (i > 0) { tui::print_stdout("\n"); }
    auto const report{ report_outgoing_variants(*selected[i], session.classifier()) };
    tui::print_stdout("%s", report.c_str());
  }
  return true;
}

}  // namespace depconf
