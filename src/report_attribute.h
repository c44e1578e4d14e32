#pragma once

#include "attributes.h"
#include "incubation.h"

#include <optional>
#include <string>

namespace depconf {

// Point-in-time snapshot of one attribute read from a container. Holds no
// reference back to the container.
class report_attribute {
 public:
  static report_attribute from_attribute_in_container(attribute_key const &key,
                                                      attribute_container const &container,
                                                      incubation_classifier const &classifier);

  template <attribute_value_type T>
  static report_attribute from_attribute_in_container(attribute<T> const &attr,
                                                      attribute_container const &container,
                                                      incubation_classifier const &classifier) {
    return from_attribute_in_container(attr.erased(), container, classifier);
  }

  std::string const &name() const { return name_; }
  std::optional<attribute_value> const &value() const { return value_; }
  bool is_incubating() const { return incubating_; }

  std::string value_string() const;  // "(null)" when absent

 private:
  report_attribute(std::string name, std::optional<attribute_value> value, bool incubating);

  std::string name_;
  std::optional<attribute_value> value_;
  bool incubating_;
};

}  // namespace depconf
