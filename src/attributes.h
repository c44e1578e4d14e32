#pragma once

#include <concepts>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace depconf {

template <typename T>
concept attribute_value_type = std::copy_constructible<T> && std::equality_comparable<T> &&
                               requires(std::ostream &os, T const &v) { os << v; };

// Immutable, type-erased attribute value. Equality compares type and value.
class attribute_value {
 public:
  template <attribute_value_type T>
  static attribute_value of(T value) {
    return attribute_value{ std::make_shared<holder<T> const>(std::move(value)) };
  }

  std::type_index type() const { return holder_->type(); }
  std::string to_string() const { return holder_->to_string(); }

  template <typename T>
  T const *get_if() const {
    if (holder_->type() != std::type_index{ typeid(T) }) { return nullptr; }
    return &static_cast<holder<T> const &>(*holder_).value;
  }

  bool operator==(attribute_value const &other) const {
    return holder_->equals(*other.holder_);
  }

 private:
  struct holder_base {
    virtual ~holder_base() = default;
    virtual std::type_index type() const = 0;
    virtual std::string to_string() const = 0;
    virtual bool equals(holder_base const &other) const = 0;
  };

  template <typename T>
  struct holder final : holder_base {
    explicit holder(T v) : value{ std::move(v) } {}

    std::type_index type() const override { return typeid(T); }

    std::string to_string() const override {
      std::ostringstream oss;
      oss << std::boolalpha << value;
      return oss.str();
    }

    bool equals(holder_base const &other) const override {
      auto const *typed{ dynamic_cast<holder const *>(&other) };
      return typed && typed->value == value;
    }

    T const value;
  };

  explicit attribute_value(std::shared_ptr<holder_base const> h) : holder_{ std::move(h) } {}

  std::shared_ptr<holder_base const> holder_;
};

// Erased attribute key: a name plus the runtime tag of the value type.
class attribute_key {
 public:
  attribute_key(std::string name, std::type_index type)
      : name_{ std::move(name) }, type_{ type } {}

  std::string const &name() const { return name_; }
  std::type_index type() const { return type_; }

  bool operator==(attribute_key const &other) const {
    return name_ == other.name_ && type_ == other.type_;
  }
  bool operator<(attribute_key const &other) const {
    if (name_ != other.name_) { return name_ < other.name_; }
    return type_ < other.type_;
  }

 private:
  std::string name_;
  std::type_index type_;
};

// Typed attribute key; erased() is what containers store and look up.
template <attribute_value_type T>
class attribute {
 public:
  using value_type = T;

  explicit attribute(std::string name) : key_{ std::move(name), typeid(T) } {}

  std::string const &name() const { return key_.name(); }
  attribute_key const &erased() const { return key_; }

 private:
  attribute_key key_;
};

using attribute_map_t = std::map<attribute_key, attribute_value>;

class immutable_attributes;

// Read side shared by mutable and immutable containers. find() is the single
// erased accessor; typed reads go through attribute_get().
class attribute_container {
 public:
  virtual ~attribute_container() = default;

  virtual attribute_value const *find(attribute_key const &key) const = 0;
  virtual std::vector<attribute_key> keys() const = 0;  // ordered by name

  bool contains(attribute_key const &key) const { return find(key) != nullptr; }
  bool empty() const { return keys().empty(); }

  // "{name=value, ...}" in key order
  std::string to_string() const;
};

class immutable_attributes final : public attribute_container {
 public:
  immutable_attributes();
  explicit immutable_attributes(attribute_map_t values);

  attribute_value const *find(attribute_key const &key) const override;
  std::vector<attribute_key> keys() const override;
  std::size_t size() const { return values_->size(); }

  bool operator==(immutable_attributes const &other) const {
    return *values_ == *other.values_;
  }

 private:
  std::shared_ptr<attribute_map_t const> values_;
};

class mutable_attributes final : public attribute_container {
 public:
  attribute_value const *find(attribute_key const &key) const override;
  std::vector<attribute_key> keys() const override;

  // Throws std::runtime_error if value's type differs from the key's type tag.
  void put(attribute_key key, attribute_value value);
  bool remove(attribute_key const &key);

  immutable_attributes as_immutable() const { return immutable_attributes{ values_ }; }

 private:
  attribute_map_t values_;
};

template <attribute_value_type T>
std::optional<T> attribute_get(attribute_container const &container,
                               attribute<T> const &attr) {
  attribute_value const *value{ container.find(attr.erased()) };
  if (!value) { return std::nullopt; }
  T const *typed{ value->get_if<T>() };
  if (!typed) { return std::nullopt; }
  return *typed;
}

template <attribute_value_type T>
void attribute_put(mutable_attributes &container, attribute<T> const &attr, T value) {
  container.put(attr.erased(), attribute_value::of(std::move(value)));
}

// Well-known attributes used by the reporting and incubation classification code.
namespace standard_attributes {
inline attribute<std::string> const usage{ "org.gradle.usage" };
inline attribute<std::string> const category{ "org.gradle.category" };
inline attribute<std::string> const library_elements{ "org.gradle.libraryelements" };
inline attribute<std::string> const bundling{ "org.gradle.dependency.bundling" };
inline attribute<std::string> const docs_type{ "org.gradle.docstype" };
inline attribute<std::string> const verification_type{ "org.gradle.verificationtype" };
inline attribute<std::string> const test_suite_type{ "org.gradle.testsuite.type" };
inline attribute<std::string> const test_suite_name{ "org.gradle.testsuite.name" };
inline attribute<std::string> const test_suite_target_name{
  "org.gradle.testsuite.target.name"
};
inline attribute<std::int64_t> const target_jvm_version{ "org.gradle.jvm.version" };
}  // namespace standard_attributes

}  // namespace depconf
