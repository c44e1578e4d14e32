#include "cmd_common.h"

#include <stdexcept>

namespace depconf {

std::unique_ptr<build_script> load_build_script_or_throw(std::filesystem::path const &path,
                                                         resolution_session &session) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("build script not found: " + path.string());
  }
  if (std::filesystem::is_directory(path)) {
    throw std::runtime_error("build script is a directory: " + path.string());
  }
  return build_script::load(path, session);
}

std::vector<configuration *> select_configurations(
    configuration_container &container,
    std::optional<std::string> const &name,
    std::function<bool(configuration const &)> const &keep) {
  if (name) { return { &container.get(*name) }; }

  std::vector<configuration *> out;
  for (auto *cfg : container.all()) {
    if (keep(*cfg)) { out.push_back(cfg); }
  }
  return out;
}

}  // namespace depconf
