#include "attributes.h"

#include <stdexcept>

namespace depconf {

namespace {

std::vector<attribute_key> keys_of(attribute_map_t const &values) {
  std::vector<attribute_key> keys;
  keys.reserve(values.size());
  for (auto const &[key, value] : values) { keys.push_back(key); }
  return keys;
}

}  // namespace

std::string attribute_container::to_string() const {
  std::string out{ "{" };
  bool first{ true };
  for (auto const &key : keys()) {
    if (!first) { out.append(", "); }
    first = false;
    out.append(key.name());
    out.push_back('=');
    if (auto const *value{ find(key) }) { out.append(value->to_string()); }
  }
  out.push_back('}');
  return out;
}

immutable_attributes::immutable_attributes()
    : values_{ std::make_shared<attribute_map_t const>() } {}

immutable_attributes::immutable_attributes(attribute_map_t values)
    : values_{ std::make_shared<attribute_map_t const>(std::move(values)) } {}

attribute_value const *immutable_attributes::find(attribute_key const &key) const {
  auto const it{ values_->find(key) };
  return it == values_->end() ? nullptr : &it->second;
}

std::vector<attribute_key> immutable_attributes::keys() const { return keys_of(*values_); }

attribute_value const *mutable_attributes::find(attribute_key const &key) const {
  auto const it{ values_.find(key) };
  return it == values_.end() ? nullptr : &it->second;
}

std::vector<attribute_key> mutable_attributes::keys() const { return keys_of(values_); }

void mutable_attributes::put(attribute_key key, attribute_value value) {
  if (key.type() != value.type()) {
    throw std::runtime_error("Unexpected type for attribute '" + key.name() +
                             "': value '" + value.to_string() +
                             "' does not match the attribute's declared type");
  }
  values_.insert_or_assign(std::move(key), std::move(value));
}

bool mutable_attributes::remove(attribute_key const &key) { return values_.erase(key) > 0; }

}  // namespace depconf
