#pragma once

#include "module_identifier.h"

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace depconf {

struct dependency {
  module_identifier const *module;  // interned, owned by the session registry
  std::string version;

  std::string to_string() const;  // "group:name:version", or "group:name" without a version

  bool operator==(dependency const &other) const {
    return module == other.module && version == other.version;
  }
};

struct dependency_constraint {
  module_identifier const *module;
  std::string version;
  std::string reason;

  std::string to_string() const;
};

// Removes transitive dependencies matching group and/or module. An unset
// field matches anything.
struct exclude_rule {
  std::optional<std::string> group;
  std::optional<std::string> module;

  std::string to_string() const;  // "group:module", "*" for unset fields

  auto operator<=>(exclude_rule const &) const = default;
  bool operator==(exclude_rule const &) const = default;
};

struct capability {
  std::string group;
  std::string name;
  std::string version;

  std::string to_string() const;

  auto operator<=>(capability const &) const = default;
  bool operator==(capability const &) const = default;
};

struct publish_artifact {
  std::string name;
  std::string type;
  std::string extension;
  std::string classifier;
  std::string file;

  std::string to_string() const;  // "name-classifier.extension (type)"

  bool operator==(publish_artifact const &) const = default;
};

// A (module, version) pair selected by the resolver.
struct resolved_component {
  module_identifier const *module;
  std::string version;
};

struct coordinate_notation {
  std::string group;
  std::string name;
  std::string version;  // may be empty
};

// Parses "group:name" or "group:name:version". Throws std::runtime_error when
// malformed.
coordinate_notation parse_coordinate_notation(std::string_view notation);

}  // namespace depconf
