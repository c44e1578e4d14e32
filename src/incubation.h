#pragma once

#include "attributes.h"

#include <set>
#include <string>
#include <utility>

namespace depconf {

// Decides whether an attribute (and optionally its value) belongs to an
// unstable API surface. value is nullptr when the attribute is absent.
class incubation_classifier {
 public:
  virtual ~incubation_classifier() = default;
  virtual bool is_incubating(attribute_key const &key, attribute_value const *value) const = 0;
};

// Table-driven classifier: whole attributes by name, or single
// (name, string value) pairs.
class default_incubation_classifier final : public incubation_classifier {
 public:
  default_incubation_classifier();
  default_incubation_classifier(std::set<std::string> incubating_names,
                                std::set<std::pair<std::string, std::string>> incubating_values);

  bool is_incubating(attribute_key const &key, attribute_value const *value) const override;

 private:
  std::set<std::string> names_;
  std::set<std::pair<std::string, std::string>> values_;
};

}  // namespace depconf
