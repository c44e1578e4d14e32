#include "dependency.h"

#include "util.h"

#include <stdexcept>

namespace depconf {

std::string dependency::to_string() const {
  std::string out{ module->to_string() };
  if (!version.empty()) { out += ":" + version; }
  return out;
}

std::string dependency_constraint::to_string() const {
  std::string out{ module->to_string() };
  if (!version.empty()) { out += ":" + version; }
  if (!reason.empty()) { out += " (" + reason + ")"; }
  return out;
}

std::string exclude_rule::to_string() const {
  return group.value_or("*") + ":" + module.value_or("*");
}

std::string capability::to_string() const {
  std::string out{ group + ":" + name };
  if (!version.empty()) { out += ":" + version; }
  return out;
}

std::string publish_artifact::to_string() const {
  std::string out{ name };
  if (!classifier.empty()) { out += "-" + classifier; }
  if (!extension.empty()) { out += "." + extension; }
  if (!type.empty()) { out += " (" + type + ")"; }
  return out;
}

coordinate_notation parse_coordinate_notation(std::string_view notation) {
  auto const parts{ util_split(notation, ':') };
  if (parts.size() < 2 || parts.size() > 3 || parts[0].empty() || parts[1].empty()) {
    throw std::runtime_error("Invalid dependency notation '" + std::string{ notation } +
                             "': expected 'group:name' or 'group:name:version'");
  }
  return { .group = std::string{ parts[0] },
           .name = std::string{ parts[1] },
           .version = parts.size() == 3 ? std::string{ parts[2] } : std::string{} };
}

}  // namespace depconf
