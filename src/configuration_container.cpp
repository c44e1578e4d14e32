#include "configuration_container.h"

#include "tui.h"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace depconf {

configuration_container::configuration_container(std::string project_path)
    : project_path_{ std::move(project_path) } {
  if (project_path_.empty() || project_path_.front() != ':') {
    throw std::runtime_error("Invalid project path '" + project_path_ +
                             "': must start with ':'");
  }
}

configuration &configuration_container::create(std::string name, configuration_role role) {
  if (name.empty() || name.find(':') != std::string::npos) {
    throw std::runtime_error("Invalid configuration name '" + name + "' in project '" +
                             project_path_ + "'");
  }

  std::lock_guard const lock{ mutex_ };
  if (std::ranges::any_of(storage_, [&](configuration const &c) { return c.name() == name; })) {
    throw std::runtime_error("Cannot add a configuration with name '" + name +
                             "' as a configuration with that name already exists in project '" +
                             project_path_ + "'");
  }

  storage_.emplace_back(configuration::ctor_tag{}, project_path_, std::move(name), role);
  tui::debug("created %s (role %s)",
             storage_.back().display_name().c_str(),
             std::string{ role.name }.c_str());
  return storage_.back();
}

configuration *configuration_container::find(std::string_view name) {
  std::lock_guard const lock{ mutex_ };
  auto it{ std::ranges::find_if(storage_,
                                [&](configuration const &c) { return c.name() == name; }) };
  return it == storage_.end() ? nullptr : &*it;
}

configuration const *configuration_container::find(std::string_view name) const {
  std::lock_guard const lock{ mutex_ };
  auto it{ std::ranges::find_if(storage_,
                                [&](configuration const &c) { return c.name() == name; }) };
  return it == storage_.end() ? nullptr : &*it;
}

configuration &configuration_container::get(std::string_view name) {
  if (auto *config{ find(name) }) { return *config; }
  throw std::runtime_error("Configuration with name '" + std::string{ name } +
                           "' not found in project '" + project_path_ + "'");
}

std::vector<configuration *> configuration_container::all() {
  std::lock_guard const lock{ mutex_ };
  std::vector<configuration *> out;
  out.reserve(storage_.size());
  for (auto &c : storage_) { out.push_back(&c); }
  return out;
}

std::vector<configuration const *> configuration_container::all() const {
  std::lock_guard const lock{ mutex_ };
  std::vector<configuration const *> out;
  out.reserve(storage_.size());
  for (auto const &c : storage_) { out.push_back(&c); }
  return out;
}

std::size_t configuration_container::size() const {
  std::lock_guard const lock{ mutex_ };
  return storage_.size();
}

std::vector<validation_failure> configuration_container::lock_all_lenient() {
  auto const configs{ all() };
  std::vector<std::vector<validation_failure>> per_config(configs.size());

  tbb::parallel_for(tbb::blocked_range<std::size_t>{ 0, configs.size() },
                    [&](tbb::blocked_range<std::size_t> const &range) {
                      for (std::size_t i{ range.begin() }; i != range.end(); ++i) {
                        per_config[i] = configs[i]->prevent_from_further_mutation_lenient();
                      }
                    });

  std::vector<validation_failure> failures;
  for (auto &f : per_config) {
    failures.insert(failures.end(),
                    std::make_move_iterator(f.begin()),
                    std::make_move_iterator(f.end()));
  }
  return failures;
}

}  // namespace depconf
