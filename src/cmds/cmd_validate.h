#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace depconf {

// Locks every configuration of a build script and reports every lock-time
// validation problem.
class cmd_validate : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_validate> {
    std::filesystem::path script_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_validate(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace depconf
