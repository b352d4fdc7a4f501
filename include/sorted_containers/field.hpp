// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <compare>
#include <utility>

namespace kressler::sorted_containers {

/**
 * An owned key/value pair removed from (or replaced in) a sorted container.
 *
 * The key is read-only: once a key has been stored it only changes by
 * removing the field and inserting a new one. The value may be modified
 * freely.
 */
template <typename Key, typename Value>
class field {
 public:
  using key_type = Key;
  using mapped_type = Value;

  field(Key key, Value value)
      : value(std::move(value)), key_(std::move(key)) {}

  const Key& key() const { return key_; }

  Key into_key() && { return std::move(key_); }

  std::pair<Key, Value> into_parts() && {
    return {std::move(key_), std::move(value)};
  }

  bool operator==(const field&) const = default;

  friend auto operator<=>(const field& lhs, const field& rhs)
    requires std::three_way_comparable<Key> &&
             std::three_way_comparable<Value>
  {
    using ordering =
        std::common_comparison_category_t<std::compare_three_way_result_t<Key>,
                                          std::compare_three_way_result_t<Value>>;
    if (ordering cmp = lhs.key_ <=> rhs.key_; cmp != 0) {
      return cmp;
    }
    return ordering(lhs.value <=> rhs.value);
  }

  Value value;

 private:
  Key key_;
};

}  // namespace kressler::sorted_containers
