#pragma once

#include "attributes.h"
#include "dependency.h"

#include <string>
#include <vector>

namespace depconf {

class configuration;

// Receives a configuration's exposure in order: visit_artifacts first, then
// visit_own_variant (when the configuration is selectable itself), then one
// visit_child_variant per declared variant in declaration order.
class variant_visitor {
 public:
  virtual ~variant_visitor() = default;

  virtual void visit_artifacts(std::vector<publish_artifact> const &artifacts) = 0;

  virtual void visit_own_variant(std::string const &display_name,
                                 immutable_attributes const &attributes,
                                 std::vector<capability> const &capabilities,
                                 std::vector<publish_artifact> const &artifacts) = 0;

  virtual void visit_child_variant(std::string const &name,
                                   std::string const &display_name,
                                   immutable_attributes const &attributes,
                                   std::vector<capability> const &capabilities,
                                   std::vector<publish_artifact> const &artifacts) = 0;
};

// Secondary variant declared on a configuration.
struct child_variant {
  std::string name;
  mutable_attributes attributes;
  std::vector<publish_artifact> artifacts;
  std::vector<capability> capabilities;  // empty: inherit the configuration's
};

// Live view of a configuration's own variant. Every accessor reads the
// configuration's current state; nothing is cached.
class outgoing_variant {
 public:
  explicit outgoing_variant(configuration const &source) : source_{ &source } {}

  std::string const &display_name() const;
  immutable_attributes attributes() const;
  std::vector<capability> capabilities() const;
  std::vector<publish_artifact> artifacts() const;  // own plus inherited

 private:
  configuration const *source_;
};

}  // namespace depconf
