#pragma once

#include <optional>
#include <string_view>

namespace depconf {

// Resolution progress of a configuration; only ever moves forward.
enum class internal_state : int {
  unresolved = 0,
  build_dependencies_resolved = 1,
  graph_resolved = 2,
  artifacts_resolved = 3,  // Terminal for the session
};

constexpr int internal_state_count = 4;

std::string_view internal_state_name(internal_state s);
std::optional<internal_state> internal_state_parse(std::string_view name);

}  // namespace depconf
