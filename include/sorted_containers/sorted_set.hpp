// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <variant>

#include "sorted_map.hpp"

namespace kressler::sorted_containers {

/**
 * An ordered set of unique members stored in one contiguous sorted buffer.
 * A thin adapter over sorted_map with std::monostate values.
 *
 * @tparam T The member type (must be ComparatorCompatible with Compare)
 * @tparam Compare Strict weak ordering on members (defaults to std::less<T>)
 * @tparam SearchModeT Search strategy (defaults to SearchMode::Hybrid)
 * @tparam Allocator Allocator for T
 */
template <typename T, typename Compare = std::less<T>,
          SearchMode SearchModeT = SearchMode::Hybrid,
          typename Allocator = std::allocator<T>>
  requires ComparatorCompatible<T, Compare>
class sorted_set {
  using map_allocator = typename std::allocator_traits<
      Allocator>::template rebind_alloc<std::pair<T, std::monostate>>;
  using map_type =
      sorted_map<T, std::monostate, Compare, SearchModeT, map_allocator>;

 public:
  using key_type = T;
  using value_type = T;
  using size_type = std::size_t;
  using key_compare = Compare;
  using value_compare = Compare;
  using allocator_type = Allocator;
  using const_iterator = typename std::span<const T>::iterator;
  using iterator = const_iterator;
  using const_reverse_iterator = typename std::span<const T>::reverse_iterator;
  using reverse_iterator = const_reverse_iterator;

  using union_type = member_sequence<typename map_type::union_type>;
  using intersection_type =
      member_sequence<typename map_type::intersection_type>;
  using difference_sequence_type =
      member_sequence<typename map_type::difference_sequence_type>;
  using drain_type = member_drain<typename map_type::buffer_type>;

  sorted_set() = default;

  explicit sorted_set(const Compare& comp, const Allocator& alloc = Allocator())
      : map_(comp, map_allocator(alloc)) {}

  static sorted_set with_capacity(size_type capacity) {
    sorted_set result;
    result.map_.reserve(capacity);
    return result;
  }

  template <std::input_iterator InputIt>
  sorted_set(InputIt first, InputIt last, const Compare& comp = Compare(),
             const Allocator& alloc = Allocator())
      : sorted_set(comp, alloc) {
    for (; first != last; ++first) {
      insert(*first);
    }
  }

  sorted_set(std::initializer_list<T> init, const Compare& comp = Compare(),
             const Allocator& alloc = Allocator())
      : sorted_set(init.begin(), init.end(), comp, alloc) {}

  /**
   * Insert member if no equivalent member is stored.
   *
   * @return true if member was inserted; false if an equivalent member was
   *         already present (the stored member is left untouched)
   */
  bool insert(T member) {
    const auto rejected =
        map_.insert_with(std::move(member), [] { return std::monostate{}; });
    return !rejected.has_value();
  }

  /**
   * Insert member, replacing an equivalent stored member.
   *
   * @return The replaced member, or std::nullopt if none was stored
   */
  std::optional<T> replace(T member) {
    if (auto previous = map_.insert(std::move(member), std::monostate{})) {
      return std::move(*previous).into_key();
    }
    return std::nullopt;
  }

  bool contains(const T& member) const { return map_.contains(member); }

  template <typename K>
    requires TransparentComparator<Compare>
  bool contains(const K& member) const {
    return map_.contains(member);
  }

  /**
   * The stored member equivalent to member.
   *
   * @return Pointer to the stored member, or nullptr if none
   */
  const T* get(const T& member) const { return get<T>(member); }

  template <typename K>
    requires TransparentComparator<Compare> || std::same_as<K, T>
  const T* get(const K& member) const {
    if (auto stored = map_.get_field(member)) {
      return &stored->first;
    }
    return nullptr;
  }

  /**
   * Remove the member equivalent to member.
   *
   * @return The removed member, or std::nullopt if none was stored
   */
  std::optional<T> remove(const T& member) { return remove<T>(member); }

  template <typename K>
    requires TransparentComparator<Compare> || std::same_as<K, T>
  std::optional<T> remove(const K& member) {
    if (auto removed = map_.remove(member)) {
      return std::move(*removed).into_key();
    }
    return std::nullopt;
  }

  /**
   * The member at a position in sorted order.
   *
   * @return Pointer to the member, or nullptr if index >= size()
   */
  const T* member(size_type index) const {
    if (auto stored = map_.field(index)) {
      return &stored->first;
    }
    return nullptr;
  }

  /**
   * Remove the member at a position in sorted order.
   *
   * @return The removed member, or std::nullopt if index >= size()
   */
  std::optional<T> remove_member(size_type index) {
    if (index >= map_.size()) {
      return std::nullopt;
    }
    return map_.remove_by_index(index).into_key();
  }

  /**
   * Lazily walk the members of both sets in sorted order.
   * Both sets are shared-borrowed until the sequence is destroyed.
   */
  union_type union_with(const sorted_set& other) const {
    return union_type(map_.union_with(other.map_));
  }

  intersection_type intersection(const sorted_set& other) const {
    return intersection_type(map_.intersection(other.map_));
  }

  // Members of this set that are not in other
  difference_sequence_type difference(const sorted_set& other) const {
    return difference_sequence_type(map_.difference(other.map_));
  }

  /**
   * Remove members from the front, one per step. Members not consumed when
   * the drain is destroyed stay in the set.
   */
  drain_type drain() { return drain_type(map_.drain()); }

  size_type size() const { return map_.size(); }
  bool empty() const { return map_.empty(); }
  size_type capacity() const { return map_.capacity(); }
  void reserve(size_type capacity) { map_.reserve(capacity); }
  void shrink_to(size_type capacity) { map_.shrink_to(capacity); }
  void shrink_to_fit() { map_.shrink_to_fit(); }
  void clear() { map_.clear(); }

  // Members in sorted order
  std::span<const T> members() const { return map_.keys(); }

  const_iterator begin() const { return members().begin(); }
  const_iterator end() const { return members().end(); }
  const_reverse_iterator rbegin() const { return members().rbegin(); }
  const_reverse_iterator rend() const { return members().rend(); }

  key_compare key_comp() const { return map_.key_comp(); }
  bool is_borrowed() const { return map_.is_borrowed(); }

  void swap(sorted_set& other) { map_.swap(other.map_); }

  friend bool operator==(const sorted_set& lhs, const sorted_set& rhs) {
    return lhs.map_ == rhs.map_;
  }

  friend auto operator<=>(const sorted_set& lhs, const sorted_set& rhs)
    requires std::three_way_comparable<T>
  {
    return lhs.map_ <=> rhs.map_;
  }

 private:
  map_type map_;
};

template <typename T, typename Compare, SearchMode SearchModeT,
          typename Allocator>
void swap(sorted_set<T, Compare, SearchModeT, Allocator>& lhs,
          sorted_set<T, Compare, SearchModeT, Allocator>& rhs) {
  lhs.swap(rhs);
}

}  // namespace kressler::sorted_containers
