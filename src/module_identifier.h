#pragma once

#include "util.h"

#include <tbb/concurrent_hash_map.h>

#include <atomic>
#include <compare>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace depconf {

// Immutable (group, name) coordinate. Instances are owned by a
// module_identifier_registry and live as long as it does.
class module_identifier : unmovable {
 public:
  module_identifier(std::string group, std::string name);

  std::string const &group() const { return group_; }
  std::string const &name() const { return name_; }
  std::string to_string() const;  // "group:name"

  bool operator==(module_identifier const &other) const {
    return group_ == other.group_ && name_ == other.name_;
  }
  auto operator<=>(module_identifier const &other) const {
    if (auto const c{ group_ <=> other.group_ }; c != 0) { return c; }
    return name_ <=> other.name_;
  }

 private:
  std::string const group_;
  std::string const name_;
};

// Interns (group, name) pairs into canonical module_identifier instances.
// intern() is an atomic get-or-create: concurrent callers with equal keys always
// receive the same object. Entries are never evicted.
class module_identifier_registry : unmovable {
 public:
  module_identifier_registry() = default;

  module_identifier const &intern(std::string_view group, std::string_view name);

  std::size_t size() const { return count_.load(std::memory_order_relaxed); }

 private:
  using by_name_t =
      tbb::concurrent_hash_map<std::string, std::unique_ptr<module_identifier const>>;
  using by_group_t = tbb::concurrent_hash_map<std::string, std::unique_ptr<by_name_t>>;

  by_name_t &names_for(std::string_view group);

  by_group_t by_group_;
  std::atomic<std::size_t> count_{ 0 };
};

}  // namespace depconf
