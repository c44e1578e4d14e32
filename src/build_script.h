#pragma once

#include "configuration_container.h"
#include "resolution_session.h"
#include "sol_util.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace depconf {

// Declares one project's configurations from a Lua build script:
//
//   PROJECT = ":app"                      -- optional, defaults to ":"
//   CONFIGURATIONS = {
//     { name = "api", role = "dependency_scope", dependencies = { "g:n:v" } },
//     { name = "compileClasspath", role = "resolvable", extends_from = { "api" } },
//   }
//
// The Lua state is kept alive because Lua functions registered as dependency
// actions run later, when the configuration's dependency actions are run.
class build_script : unmovable {
 public:
  static std::unique_ptr<build_script> load(std::filesystem::path const &path,
                                            resolution_session &session);
  static std::unique_ptr<build_script> load_string(std::string_view script,
                                                   std::string const &chunk_name,
                                                   resolution_session &session);

  std::string const &project_path() const { return project_path_; }
  configuration_container &container() const { return *container_; }

 private:
  build_script(sol_state_ptr lua, std::string chunk_name, resolution_session &session);

  void evaluate();
  void declare(sol::table const &cfg_table);
  void populate(sol::table const &cfg_table);

  sol_state_ptr lua_;
  std::string chunk_name_;
  resolution_session *session_;
  std::string project_path_;
  configuration_container *container_{ nullptr };
};

}  // namespace depconf
