#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace depconf {

class cmd_variants : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_variants> {
    std::filesystem::path script_path;
    std::optional<std::string> configuration;
    bool all{ false };  // include configurations that cannot be consumed
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_variants(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace depconf
