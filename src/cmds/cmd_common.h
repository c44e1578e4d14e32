#pragma once

#include "build_script.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace depconf {

std::unique_ptr<build_script> load_build_script_or_throw(std::filesystem::path const &path,
                                                         resolution_session &session);

// The named configuration, or every configuration accepted by keep when no
// name was given. Unknown names throw.
std::vector<configuration *> select_configurations(
    configuration_container &container,
    std::optional<std::string> const &name,
    std::function<bool(configuration const &)> const &keep);

}  // namespace depconf
