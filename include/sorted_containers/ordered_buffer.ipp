// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

// ordered_buffer.ipp - Implementation details for ordered_buffer
// This file is included at the end of ordered_buffer.hpp
// DO NOT include this file directly

namespace kressler::sorted_containers {

// ============================================================================
// Insert and Remove Operations
// ============================================================================

/**
 * Insert a field at a position that keeps the keys sorted.
 * Both arrays shift right from index. The value array is updated second; if
 * that throws, the key just inserted is erased so both arrays stay the same
 * length.
 */
template <typename Key, typename Value, typename Allocator>
template <typename K, typename V>
Value& ordered_buffer<Key, Value, Allocator>::insert_at(size_type index,
                                                        K&& key, V&& value) {
  assert(index <= size() && "Insertion index out of bounds");
  assert(keys_.size() == values_.size());

  keys_.emplace(keys_.begin() + index, std::forward<K>(key));
  try {
    values_.emplace(values_.begin() + index, std::forward<V>(value));
  } catch (...) {
    keys_.erase(keys_.begin() + index);
    throw;
  }
  return values_[index];
}

/**
 * Remove the field at index. Later elements shift left by one in both arrays.
 */
template <typename Key, typename Value, typename Allocator>
typename ordered_buffer<Key, Value, Allocator>::field_type
ordered_buffer<Key, Value, Allocator>::remove_at(size_type index) {
  assert(index < size() && "Cannot remove past the end");

  field_type removed(std::move(keys_[index]), std::move(values_[index]));
  keys_.erase(keys_.begin() + index);
  values_.erase(values_.begin() + index);
  return removed;
}

/**
 * Replace both halves of the field at index. The new key must be equivalent
 * to the old one, so sorted order is unchanged.
 */
template <typename Key, typename Value, typename Allocator>
template <typename K, typename V>
typename ordered_buffer<Key, Value, Allocator>::field_type
ordered_buffer<Key, Value, Allocator>::replace_at(size_type index, K&& key,
                                                  V&& value) {
  assert(index < size() && "Cannot replace past the end");

  field_type previous(std::exchange(keys_[index], std::forward<K>(key)),
                      std::exchange(values_[index], std::forward<V>(value)));
  return previous;
}

/**
 * Move a field out of its slot without shifting. Used by drains and merges,
 * which discard or erase the consumed slots afterwards.
 */
template <typename Key, typename Value, typename Allocator>
typename ordered_buffer<Key, Value, Allocator>::field_type
ordered_buffer<Key, Value, Allocator>::take_at(size_type index) {
  assert(index < size() && "Cannot take past the end");

  return field_type(std::move(keys_[index]), std::move(values_[index]));
}

template <typename Key, typename Value, typename Allocator>
void ordered_buffer<Key, Value, Allocator>::transfer_back_from(
    ordered_buffer& source, size_type index) {
  assert(index < source.size() && "Cannot transfer past the end");

  emplace_back(std::move(source.keys_[index]), std::move(source.values_[index]));
}

/**
 * Append a field at the end. The caller guarantees the key sorts after every
 * stored key.
 */
template <typename Key, typename Value, typename Allocator>
template <typename K, typename V>
void ordered_buffer<Key, Value, Allocator>::emplace_back(K&& key, V&& value) {
  keys_.emplace_back(std::forward<K>(key));
  try {
    values_.emplace_back(std::forward<V>(value));
  } catch (...) {
    keys_.pop_back();
    throw;
  }
}

/**
 * Destroy the first count fields and shift the remainder to the front.
 * Complexity: O(n)
 */
template <typename Key, typename Value, typename Allocator>
void ordered_buffer<Key, Value, Allocator>::erase_prefix(size_type count) {
  assert(count <= size() && "Cannot erase more fields than are stored");

  keys_.erase(keys_.begin(), keys_.begin() + count);
  values_.erase(values_.begin(), values_.begin() + count);
}

// ============================================================================
// Capacity Operations
// ============================================================================

/**
 * Reallocate both arrays to exactly max(capacity, size()) slots when that is
 * smaller than the current capacity. Fields are moved in order.
 */
template <typename Key, typename Value, typename Allocator>
void ordered_buffer<Key, Value, Allocator>::shrink_to(size_type capacity) {
  const size_type target = std::max(capacity, size());
  if (target >= keys_.capacity() && target >= values_.capacity()) {
    return;
  }

  std::vector<Key, key_allocator> keys(keys_.get_allocator());
  std::vector<Value, value_allocator> values(values_.get_allocator());
  keys.reserve(target);
  values.reserve(target);
  std::move(keys_.begin(), keys_.end(), std::back_inserter(keys));
  std::move(values_.begin(), values_.end(), std::back_inserter(values));

  keys_.swap(keys);
  values_.swap(values);
}

}  // namespace kressler::sorted_containers
