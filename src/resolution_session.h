#pragma once

#include "configuration_container.h"
#include "incubation.h"
#include "module_identifier.h"
#include "util.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace depconf {

// Shared state for one build: the identifier registry, the incubation
// classifier and every project's configurations. Constructed at session start
// and torn down with the build; nothing is evicted before then.
class resolution_session : unmovable {
 public:
  resolution_session();
  explicit resolution_session(std::unique_ptr<incubation_classifier const> classifier);

  module_identifier_registry &identifiers() { return identifiers_; }
  incubation_classifier const &classifier() const { return *classifier_; }

  configuration_container &project(std::string const &project_path);  // get-or-create
  configuration_container *find_project(std::string_view project_path);
  std::vector<configuration_container *> projects();  // ordered by path

  // Parses "group:name[:version]" and interns the module.
  dependency make_dependency(std::string_view notation);

  // Locks every configuration of every project; failures ordered by project path.
  std::vector<validation_failure> lock_all_lenient();

 private:
  module_identifier_registry identifiers_;
  std::unique_ptr<incubation_classifier const> classifier_;

  std::mutex mutex_;
  std::map<std::string, std::unique_ptr<configuration_container>, std::less<>> projects_;
};

}  // namespace depconf
