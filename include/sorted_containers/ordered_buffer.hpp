// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <compare>
#include <cassert>
#include <cstddef>
#include <iterator>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "field.hpp"

namespace kressler::sorted_containers {

/**
 * Contiguous storage for the fields of a sorted container.
 * Keys and values are stored in separate arrays so that searching only
 * touches keys.
 *
 * The buffer does not search or compare: callers pass positions that already
 * keep the keys sorted (normally produced by locate()). Debug builds assert
 * index ranges.
 *
 * @tparam Key The key type
 * @tparam Value The value type
 * @tparam Allocator Allocator for std::pair<Key, Value>; rebound separately
 *         for the key and value arrays
 */
template <typename Key, typename Value,
          typename Allocator = std::allocator<std::pair<Key, Value>>>
class ordered_buffer {
 private:
  template <bool IsConst>
  class ordered_buffer_iterator;

  using key_allocator =
      typename std::allocator_traits<Allocator>::template rebind_alloc<Key>;
  using value_allocator =
      typename std::allocator_traits<Allocator>::template rebind_alloc<Value>;

 public:
  using key_type = Key;
  using mapped_type = Value;
  using value_type = std::pair<Key, Value>;
  using size_type = std::size_t;
  using allocator_type = Allocator;
  using field_type = field<Key, Value>;

  // Proxy class to represent a key-value pair reference
  template <bool IsConst>
  class pair_proxy {
   public:
    // Key is always const to prevent breaking sorted order invariant
    using key_ref_type = const Key&;
    using value_ref_type = std::conditional_t<IsConst, const Value&, Value&>;

    pair_proxy(key_ref_type k, value_ref_type v) : first(k), second(v) {}

    // Mutable proxies convert to read-only ones
    template <bool WasConst = IsConst, typename = std::enable_if_t<WasConst>>
    pair_proxy(const pair_proxy<false>& other)
        : first(other.first), second(other.second) {}

    // Allow conversion to std::pair for compatibility
    operator std::pair<Key, Value>() const { return {first, second}; }

    key_ref_type first;
    value_ref_type second;
  };

  using reference = pair_proxy<false>;
  using const_reference = pair_proxy<true>;
  using iterator = ordered_buffer_iterator<false>;
  using const_iterator = ordered_buffer_iterator<true>;
  using reverse_iterator = std::reverse_iterator<iterator>;
  using const_reverse_iterator = std::reverse_iterator<const_iterator>;

  ordered_buffer() = default;

  explicit ordered_buffer(const Allocator& alloc)
      : keys_(key_allocator(alloc)), values_(value_allocator(alloc)) {}

  /**
   * Insert a field at a position that keeps the keys sorted.
   * Elements at and after index shift right by one.
   *
   * If inserting the value throws, the key is removed again and the buffer is
   * left as it was.
   *
   * @param index Insertion position (0 <= index <= size())
   * @param key The key to insert
   * @param value The value to insert
   * @return Reference to the inserted value
   */
  template <typename K, typename V>
  Value& insert_at(size_type index, K&& key, V&& value);

  /**
   * Remove the field at index, shifting later elements left by one.
   *
   * @param index Position of the field (index < size())
   * @return The removed field, owned by the caller
   */
  field_type remove_at(size_type index);

  /**
   * Replace the field at index with one whose key is equivalent.
   *
   * @param index Position of the field (index < size())
   * @return The previous field, owned by the caller
   */
  template <typename K, typename V>
  field_type replace_at(size_type index, K&& key, V&& value);

  /**
   * Move the field at index out, leaving a moved-from slot behind.
   * The caller must erase or overwrite the slot before the buffer is read
   * again (see erase_prefix()).
   */
  field_type take_at(size_type index);

  /**
   * Move the field at index of source onto the end of this buffer, leaving a
   * moved-from slot in source. The key must sort after every key stored here.
   */
  void transfer_back_from(ordered_buffer& source, size_type index);

  /**
   * Append a field whose key sorts after every stored key.
   * Used to build a buffer from an already-sorted sequence.
   */
  template <typename K, typename V>
  void emplace_back(K&& key, V&& value);

  /**
   * Destroy the first count fields, shifting the rest to the front.
   */
  void erase_prefix(size_type count);

  void clear() {
    keys_.clear();
    values_.clear();
  }

  void reserve(size_type capacity) {
    keys_.reserve(capacity);
    values_.reserve(capacity);
  }

  /**
   * Reallocate to hold max(capacity, size()) fields if that is smaller than
   * the current capacity. Element order is preserved.
   */
  void shrink_to(size_type capacity);

  void shrink_to_fit() { shrink_to(0); }

  size_type size() const { return keys_.size(); }
  bool empty() const { return keys_.empty(); }

  size_type capacity() const {
    return std::min(keys_.capacity(), values_.capacity());
  }

  allocator_type get_allocator() const {
    return allocator_type(keys_.get_allocator());
  }

  std::span<const Key> keys() const { return {keys_.data(), keys_.size()}; }
  std::span<const Value> values() const {
    return {values_.data(), values_.size()};
  }
  std::span<Value> values() { return {values_.data(), values_.size()}; }

  const Key& key_at(size_type index) const {
    assert(index < size() && "Index out of bounds");
    return keys_[index];
  }

  const Value& value_at(size_type index) const {
    assert(index < size() && "Index out of bounds");
    return values_[index];
  }

  Value& value_at(size_type index) {
    assert(index < size() && "Index out of bounds");
    return values_[index];
  }

  reference operator[](size_type index) {
    return reference(keys_[index], values_[index]);
  }

  const_reference operator[](size_type index) const {
    return const_reference(keys_[index], values_[index]);
  }

  void swap(ordered_buffer& other) noexcept {
    keys_.swap(other.keys_);
    values_.swap(other.values_);
  }

  bool operator==(const ordered_buffer& other) const = default;

  // Iterator methods
  iterator begin() { return iterator(this, 0); }
  iterator end() { return iterator(this, size()); }
  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const { return const_iterator(this, size()); }
  const_iterator cbegin() const { return const_iterator(this, 0); }
  const_iterator cend() const { return const_iterator(this, size()); }

  reverse_iterator rbegin() { return reverse_iterator(end()); }
  reverse_iterator rend() { return reverse_iterator(begin()); }
  const_reverse_iterator rbegin() const {
    return const_reverse_iterator(end());
  }
  const_reverse_iterator rend() const {
    return const_reverse_iterator(begin());
  }

 private:
  std::vector<Key, key_allocator> keys_;
  std::vector<Value, value_allocator> values_;

  // Random-access cursor over both arrays; dereferences to a pair_proxy
  template <bool IsConst>
  class ordered_buffer_iterator {
    using buffer_ptr_type =
        std::conditional_t<IsConst, const ordered_buffer*, ordered_buffer*>;

   public:
    using iterator_category = std::random_access_iterator_tag;
    using value_type = std::pair<Key, Value>;
    using difference_type = std::ptrdiff_t;
    using reference = pair_proxy<IsConst>;

    // operator-> has to return something that outlives the expression
    struct pointer {
      reference proxy;
      reference* operator->() { return &proxy; }
    };

    ordered_buffer_iterator() = default;

    ordered_buffer_iterator(buffer_ptr_type buffer, size_type index)
        : buffer_(buffer), index_(index) {}

    template <bool WasConst = IsConst, typename = std::enable_if_t<WasConst>>
    ordered_buffer_iterator(const ordered_buffer_iterator<false>& other)
        : buffer_(other.buffer_), index_(other.index_) {}

    reference operator*() const { return (*buffer_)[index_]; }
    pointer operator->() const { return pointer{**this}; }
    reference operator[](difference_type n) const { return *(*this + n); }

    ordered_buffer_iterator& operator+=(difference_type n) {
      index_ = static_cast<size_type>(static_cast<difference_type>(index_) + n);
      return *this;
    }
    ordered_buffer_iterator& operator-=(difference_type n) {
      return *this += -n;
    }
    ordered_buffer_iterator& operator++() { return *this += 1; }
    ordered_buffer_iterator& operator--() { return *this -= 1; }

    ordered_buffer_iterator operator++(int) {
      ordered_buffer_iterator previous = *this;
      ++*this;
      return previous;
    }
    ordered_buffer_iterator operator--(int) {
      ordered_buffer_iterator previous = *this;
      --*this;
      return previous;
    }

    friend ordered_buffer_iterator operator+(ordered_buffer_iterator it,
                                             difference_type n) {
      return it += n;
    }
    friend ordered_buffer_iterator operator+(difference_type n,
                                             ordered_buffer_iterator it) {
      return it += n;
    }
    friend ordered_buffer_iterator operator-(ordered_buffer_iterator it,
                                             difference_type n) {
      return it -= n;
    }
    friend difference_type operator-(const ordered_buffer_iterator& lhs,
                                     const ordered_buffer_iterator& rhs) {
      return static_cast<difference_type>(lhs.index_) -
             static_cast<difference_type>(rhs.index_);
    }

    bool operator==(const ordered_buffer_iterator& other) const {
      return index_ == other.index_;
    }
    auto operator<=>(const ordered_buffer_iterator& other) const {
      return index_ <=> other.index_;
    }

   private:
    buffer_ptr_type buffer_ = nullptr;
    size_type index_ = 0;

    template <bool>
    friend class ordered_buffer_iterator;
  };
};

}  // namespace kressler::sorted_containers

// Include implementation
#include "ordered_buffer.ipp"
