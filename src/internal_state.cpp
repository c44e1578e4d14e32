#include "internal_state.h"

#include <algorithm>
#include <array>

namespace depconf {

namespace {

// Index = enum value (order must match internal_state in internal_state.h)
constinit std::array<std::string_view, internal_state_count> const
    internal_state_name_table{ {
        "unresolved",
        "build_dependencies_resolved",
        "graph_resolved",
        "artifacts_resolved",
    } };

}  // namespace

std::string_view internal_state_name(internal_state s) {
  auto const idx{ static_cast<std::size_t>(s) };
  if (idx >= internal_state_name_table.size()) { return "unknown"; }
  return internal_state_name_table[idx];
}

std::optional<internal_state> internal_state_parse(std::string_view name) {
  if (auto it{ std::ranges::find(internal_state_name_table, name) };
      it != internal_state_name_table.end()) {
    return static_cast<internal_state>(std::distance(internal_state_name_table.begin(), it));
  }
  return std::nullopt;
}

}  // namespace depconf
