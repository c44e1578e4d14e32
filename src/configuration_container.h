#pragma once

#include "configuration.h"
#include "configuration_role.h"
#include "mutation_guard.h"

#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace depconf {

// Per-project pool of configurations. Addresses are stable for the container's
// lifetime; iteration follows declaration order.
class configuration_container : unmovable {
 public:
  explicit configuration_container(std::string project_path);

  std::string const &project_path() const { return project_path_; }

  // Throws std::runtime_error on an empty, ':'-containing or duplicate name.
  configuration &create(std::string name, configuration_role role = configuration_roles::legacy);

  configuration *find(std::string_view name);
  configuration const *find(std::string_view name) const;
  configuration &get(std::string_view name);  // throws if absent

  std::vector<configuration *> all();
  std::vector<configuration const *> all() const;
  std::size_t size() const;

  // Locks every configuration, in parallel. Before-locking actions must
  // therefore be thread-safe. Failures are returned in declaration order.
  std::vector<validation_failure> lock_all_lenient();

 private:
  std::string project_path_;
  mutable std::mutex mutex_;
  std::deque<configuration> storage_;
};

}  // namespace depconf
