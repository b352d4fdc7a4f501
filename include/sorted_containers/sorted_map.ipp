// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// sorted_map.ipp - Implementation details for sorted_map
// This file is included at the end of sorted_map.hpp
// DO NOT include this file directly

namespace kressler::sorted_containers {

// ============================================================================
// Construction and Assignment
// ============================================================================

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <std::input_iterator InputIt>
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::sorted_map(
    InputIt first, InputIt last, const Compare& comp, const Allocator& alloc)
    : buffer_(alloc), comp_(comp) {
  if constexpr (std::forward_iterator<InputIt>) {
    buffer_.reserve(static_cast<size_type>(std::distance(first, last)));
  }
  for (; first != last; ++first) {
    auto&& item = *first;
    insert(item.first, item.second);
  }
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
sorted_map<Key, Value, Compare, SearchModeT, Allocator>&
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::operator=(
    const sorted_map& other) {
  if (this != &other) {
    borrow_.check_writable("assign");
    other.borrow_.check_readable("copy");
    buffer_ = other.buffer_;
    comp_ = other.comp_;
  }
  return *this;
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
sorted_map<Key, Value, Compare, SearchModeT, Allocator>&
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::operator=(
    sorted_map&& other) {
  if (this != &other) {
    borrow_.check_writable("assign");
    other.borrow_.check_writable("move");
    buffer_ = std::move(other.buffer_);
    comp_ = std::move(other.comp_);
  }
  return *this;
}

// ============================================================================
// Lookup Operations
// ============================================================================

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename K>
  requires TransparentComparator<Compare> || std::same_as<K, Key>
const Value* sorted_map<Key, Value, Compare, SearchModeT, Allocator>::get(
    const K& key) const {
  borrow_.check_readable("look up key");
  const locate_result result = locate_key(key);
  return result.is_found() ? &buffer_.value_at(result.index()) : nullptr;
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename K>
  requires TransparentComparator<Compare> || std::same_as<K, Key>
Value* sorted_map<Key, Value, Compare, SearchModeT, Allocator>::get_mut(
    const K& key) {
  borrow_.check_writable("modify value");
  const locate_result result = locate_key(key);
  return result.is_found() ? &buffer_.value_at(result.index()) : nullptr;
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename K>
  requires TransparentComparator<Compare> || std::same_as<K, Key>
std::optional<typename sorted_map<Key, Value, Compare, SearchModeT,
                                  Allocator>::const_reference>
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::get_field(
    const K& key) const {
  borrow_.check_readable("look up key");
  const locate_result result = locate_key(key);
  if (!result.is_found()) {
    return std::nullopt;
  }
  return buffer_[result.index()];
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename K>
  requires TransparentComparator<Compare> || std::same_as<K, Key>
typename sorted_map<Key, Value, Compare, SearchModeT, Allocator>::iterator
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::find(const K& key) {
  borrow_.check_writable("find");
  const locate_result result = locate_key(key);
  return result.is_found() ? buffer_.begin() + result.index() : buffer_.end();
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename K>
  requires TransparentComparator<Compare> || std::same_as<K, Key>
typename sorted_map<Key, Value, Compare, SearchModeT, Allocator>::const_iterator
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::find(
    const K& key) const {
  borrow_.check_readable("find");
  const locate_result result = locate_key(key);
  return result.is_found() ? buffer_.begin() + result.index() : buffer_.end();
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
Value& sorted_map<Key, Value, Compare, SearchModeT, Allocator>::at(
    const Key& key) {
  Value* value = get_mut(key);
  if (value == nullptr) {
    throw std::out_of_range("Key not found in sorted_map");
  }
  return *value;
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
const Value& sorted_map<Key, Value, Compare, SearchModeT, Allocator>::at(
    const Key& key) const {
  const Value* value = get(key);
  if (value == nullptr) {
    throw std::out_of_range("Key not found in sorted_map");
  }
  return *value;
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<typename sorted_map<Key, Value, Compare, SearchModeT,
                                  Allocator>::const_reference>
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::field(
    size_type index) const {
  borrow_.check_readable("read field");
  if (index >= buffer_.size()) {
    return std::nullopt;
  }
  return buffer_[index];
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<
    typename sorted_map<Key, Value, Compare, SearchModeT, Allocator>::reference>
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::field_mut(
    size_type index) {
  borrow_.check_writable("modify field");
  if (index >= buffer_.size()) {
    return std::nullopt;
  }
  return buffer_[index];
}

// ============================================================================
// Insert and Remove Operations
// ============================================================================

/**
 * One search; a found key is replaced in place (key and value), an absent key
 * is inserted at the position the search returned.
 */
template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<
    typename sorted_map<Key, Value, Compare, SearchModeT, Allocator>::field_type>
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::insert(Key key,
                                                                Value value) {
  borrow_.check_writable("insert");
  const locate_result result = locate_key(key);
  if (result.is_found()) {
    return buffer_.replace_at(result.index(), std::move(key), std::move(value));
  }
  buffer_.insert_at(result.index(), std::move(key), std::move(value));
  assert(sorted_around(result.index()));
  return std::nullopt;
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename F>
  requires std::invocable<F&> &&
           std::convertible_to<std::invoke_result_t<F&>, Value>
std::optional<Key>
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::insert_with(
    Key key, F&& make_value) {
  // Held across make_value() so it cannot move the insertion point
  auto guard = borrow_.borrow_exclusive("insert");
  const locate_result result = locate_key(key);
  if (result.is_found()) {
    return std::optional<Key>(std::move(key));
  }
  buffer_.insert_at(result.index(), std::move(key), std::invoke(make_value));
  assert(sorted_around(result.index()));
  return std::nullopt;
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename K>
  requires TransparentComparator<Compare> || std::same_as<K, Key>
std::optional<
    typename sorted_map<Key, Value, Compare, SearchModeT, Allocator>::field_type>
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::remove(const K& key) {
  borrow_.check_writable("remove");
  const locate_result result = locate_key(key);
  if (!result.is_found()) {
    return std::nullopt;
  }
  return buffer_.remove_at(result.index());
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename sorted_map<Key, Value, Compare, SearchModeT, Allocator>::field_type
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::remove_by_index(
    size_type index) {
  borrow_.check_writable("remove");
  if (index >= buffer_.size()) {
    throw std::out_of_range("Cannot remove: index out of range");
  }
  return buffer_.remove_at(index);
}

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename Borrowed>
typename sorted_map<Key, Value, Compare, SearchModeT,
                    Allocator>::template entry_type<Borrowed>
sorted_map<Key, Value, Compare, SearchModeT, Allocator>::make_entry(
    search_key<Key, Borrowed> key) {
  auto guard = borrow_.borrow_exclusive("create entry");
  const locate_result result = locate_key(key.get());
  if (result.is_found()) {
    return entry_type<Borrowed>(
        occupied_entry_type(buffer_, result.index(), std::move(guard)));
  }
  return entry_type<Borrowed>(vacant_entry_type<Borrowed>(
      buffer_, std::move(key), result.index(), std::move(guard)));
}

// ============================================================================
// Merge Operations
// ============================================================================

/**
 * Two-cursor merge into a fresh buffer sized for both inputs, swapped in at
 * the end. Fields of this map are moved; fields of other are copied, or
 * moved when other is an rvalue (which is left empty).
 *
 * The caller holds the borrows of both maps for the duration.
 * If a resolver, filter or constructor throws, this map is left empty, as is
 * a consumed other.
 */
template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename Other, typename Filter, typename Resolve>
void sorted_map<Key, Value, Compare, SearchModeT, Allocator>::merge_from(
    Other&& other, Filter& filter, Resolve& resolve) {
  constexpr bool consume_other = !std::is_lvalue_reference_v<Other>;
  auto& right = other.buffer_;

  buffer_type merged(buffer_.get_allocator());
  merged.reserve(buffer_.size() + right.size());

  auto take_right = [&](size_type j) {
    if constexpr (std::same_as<Filter, detail::keep_all>) {
      if constexpr (consume_other) {
        merged.transfer_back_from(right, j);
      } else {
        merged.emplace_back(right.key_at(j), right.value_at(j));
      }
    } else {
      std::optional<Value> admitted = std::invoke(
          filter, right.key_at(j), std::as_const(right).value_at(j));
      if (!admitted) {
        return;
      }
      if constexpr (consume_other) {
        merged.emplace_back(right.take_at(j).into_key(), std::move(*admitted));
      } else {
        merged.emplace_back(right.key_at(j), std::move(*admitted));
      }
    }
  };

  try {
    size_type i = 0;
    size_type j = 0;
    while (i < buffer_.size() && j < right.size()) {
      const auto cmp = compare_keys(comp_, buffer_.key_at(i), right.key_at(j));
      if (cmp == std::weak_ordering::less) {
        merged.transfer_back_from(buffer_, i++);
      } else if (cmp == std::weak_ordering::greater) {
        take_right(j++);
      } else {
        const merge_action action = [&] {
          if constexpr (consume_other) {
            return detail::resolve_shared(resolve, buffer_.key_at(i),
                                          buffer_.value_at(i),
                                          std::move(right.value_at(j)));
          } else {
            return detail::resolve_shared(resolve, buffer_.key_at(i),
                                          buffer_.value_at(i),
                                          right.value_at(j));
          }
        }();
        if (action == merge_action::keep) {
          merged.transfer_back_from(buffer_, i);
        }
        ++i;
        ++j;
      }
    }
    for (; i < buffer_.size(); ++i) {
      merged.transfer_back_from(buffer_, i);
    }
    for (; j < right.size(); ++j) {
      take_right(j);
    }
  } catch (...) {
    // Consumed slots are moved-from and cannot be put back
    buffer_.clear();
    if constexpr (consume_other) {
      right.clear();
    }
    throw;
  }

  buffer_.swap(merged);
  if constexpr (consume_other) {
    right.clear();
  }
}

// ============================================================================
// Debug Helpers
// ============================================================================

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool sorted_map<Key, Value, Compare, SearchModeT, Allocator>::sorted_around(
    size_type index) const {
  if (index > 0 && compare_keys(comp_, buffer_.key_at(index - 1),
                                buffer_.key_at(index)) !=
                       std::weak_ordering::less) {
    return false;
  }
  if (index + 1 < buffer_.size() &&
      compare_keys(comp_, buffer_.key_at(index),
                   buffer_.key_at(index + 1)) != std::weak_ordering::less) {
    return false;
  }
  return true;
}

}  // namespace kressler::sorted_containers
