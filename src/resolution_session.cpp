#include "resolution_session.h"

#include <tbb/task_group.h>

#include <iterator>

namespace depconf {

resolution_session::resolution_session()
    : resolution_session{ std::make_unique<default_incubation_classifier const>() } {}

resolution_session::resolution_session(
    std::unique_ptr<incubation_classifier const> classifier)
    : classifier_{ std::move(classifier) } {}

configuration_container &resolution_session::project(std::string const &project_path) {
  std::lock_guard const lock{ mutex_ };
  auto it{ projects_.find(project_path) };
  if (it == projects_.end()) {
    it = projects_
             .emplace(project_path, std::make_unique<configuration_container>(project_path))
             .first;
  }
  return *it->second;
}

configuration_container *resolution_session::find_project(std::string_view project_path) {
  std::lock_guard const lock{ mutex_ };
  auto const it{ projects_.find(project_path) };
  return it == projects_.end() ? nullptr : it->second.get();
}

std::vector<configuration_container *> resolution_session::projects() {
  std::lock_guard const lock{ mutex_ };
  std::vector<configuration_container *> out;
  out.reserve(projects_.size());
  for (auto const &[path, container] : projects_) { out.push_back(container.get()); }
  return out;
}

dependency resolution_session::make_dependency(std::string_view notation) {
  auto const coords{ parse_coordinate_notation(notation) };
  return { .module = &identifiers_.intern(coords.group, coords.name),
           .version = coords.version };
}

std::vector<validation_failure> resolution_session::lock_all_lenient() {
  auto const containers{ projects() };
  std::vector<std::vector<validation_failure>> per_project(containers.size());

  tbb::task_group group;
  for (std::size_t i{ 0 }; i < containers.size(); ++i) {
    group.run([&, i] { per_project[i] = containers[i]->lock_all_lenient(); });
  }
  group.wait();

  std::vector<validation_failure> failures;
  for (auto &f : per_project) {
    failures.insert(failures.end(),
                    std::make_move_iterator(f.begin()),
                    std::make_move_iterator(f.end()));
  }
  return failures;
}

}  // namespace depconf
