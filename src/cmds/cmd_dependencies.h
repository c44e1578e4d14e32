#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace depconf {

// Runs dependency actions, marks build dependencies resolved and prints the
// declared dependencies of each selected configuration.
class cmd_dependencies : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_dependencies> {
    std::filesystem::path script_path;
    std::optional<std::string> configuration;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_dependencies(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace depconf
