// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

#include "borrow_flag.hpp"
#include "locator.hpp"

namespace kressler::sorted_containers {

/**
 * Single-pass input iterator over a lazy sequence.
 *
 * Sequence must provide next(), returning either std::optional<Item> or a
 * pointer; an empty optional or nullptr ends the sequence. The first item is
 * pulled when the iterator is created, so begin() should be called once.
 */
template <typename Sequence>
class sequence_iterator {
 public:
  using item_type = decltype(std::declval<Sequence&>().next());
  using reference = decltype(*std::declval<item_type&>());
  using value_type = std::remove_cvref_t<reference>;
  using difference_type = std::ptrdiff_t;
  using iterator_category = std::input_iterator_tag;

  sequence_iterator() = default;

  explicit sequence_iterator(Sequence* sequence)
      : sequence_(sequence), current_(sequence->next()) {}

  reference operator*() const { return *current_; }

  auto operator->() const { return std::addressof(*current_); }

  sequence_iterator& operator++() {
    current_ = sequence_->next();
    return *this;
  }

  void operator++(int) { ++*this; }

  friend bool operator==(const sequence_iterator& it,
                         std::default_sentinel_t) {
    return !it.current_;
  }

 private:
  Sequence* sequence_ = nullptr;
  mutable item_type current_{};
};

// Which side(s) of a union an item came from
enum class union_origin { left, right, both };

/**
 * Item of a map union: a key present in the left map, the right map, or
 * both. Points into the maps, which stay borrowed while the sequence lives.
 */
template <typename Key, typename Value>
class unioned {
 public:
  unioned(union_origin origin, const Key* key, const Value* left,
          const Value* right)
      : origin_(origin), key_(key), left_(left), right_(right) {}

  union_origin origin() const { return origin_; }
  bool is_left() const { return origin_ == union_origin::left; }
  bool is_right() const { return origin_ == union_origin::right; }
  bool is_both() const { return origin_ == union_origin::both; }

  const Key& key() const { return *key_; }

  // nullptr when the key is only in the right map
  const Value* left() const { return left_; }

  // nullptr when the key is only in the left map
  const Value* right() const { return right_; }

  /**
   * Collapse the item into an owned pair. A key present on both sides is
   * combined with merge(left, right); otherwise the single value is copied.
   */
  template <typename F>
  std::pair<Key, Value> map_both(F&& merge) const {
    switch (origin_) {
      case union_origin::left:
        return {*key_, *left_};
      case union_origin::right:
        return {*key_, *right_};
      case union_origin::both:
        break;
    }
    return {*key_, std::invoke(std::forward<F>(merge), *left_, *right_)};
  }

 private:
  union_origin origin_;
  const Key* key_;
  const Value* left_;
  const Value* right_;
};

// Item of a map intersection: a key present in both maps
template <typename Key, typename Value>
class intersected {
 public:
  intersected(const Key* key, const Value* left, const Value* right)
      : key_(key), left_(left), right_(right) {}

  const Key& key() const { return *key_; }
  const Value& left() const { return *left_; }
  const Value& right() const { return *right_; }

 private:
  const Key* key_;
  const Value* left_;
  const Value* right_;
};

// Read-only view of one stored field
template <typename Key, typename Value>
class field_view {
 public:
  field_view(const Key* key, const Value* value) : key_(key), value_(value) {}

  const Key& key() const { return *key_; }
  const Value& value() const { return *value_; }

 private:
  const Key* key_;
  const Value* value_;
};

// ============================================================================
// Set-algebra sequences
// ============================================================================

/**
 * Shared state of the two-cursor sequences: both buffers, the comparator and
 * a shared borrow on each owner. Moving is allowed, copying is not.
 */
template <typename Buffer, typename Compare>
class two_cursor_sequence {
 public:
  using size_type = typename Buffer::size_type;

  two_cursor_sequence(const Buffer& left, const Buffer& right,
                      const Compare& comp, borrow_flag::shared_guard left_guard,
                      borrow_flag::shared_guard right_guard)
      : left_(&left),
        right_(&right),
        comp_(comp),
        left_guard_(std::move(left_guard)),
        right_guard_(std::move(right_guard)) {}

 protected:
  bool left_done() const { return i_ >= left_->size(); }
  bool right_done() const { return j_ >= right_->size(); }

  std::weak_ordering compare_heads() const {
    return compare_keys(comp_, left_->key_at(i_), right_->key_at(j_));
  }

  const Buffer* left_;
  const Buffer* right_;
  size_type i_ = 0;
  size_type j_ = 0;

 private:
  [[no_unique_address]] Compare comp_;
  borrow_flag::shared_guard left_guard_;
  borrow_flag::shared_guard right_guard_;
};

/**
 * Every key of either map, in sorted order, each exactly once.
 */
template <typename Buffer, typename Compare>
class union_sequence : private two_cursor_sequence<Buffer, Compare> {
  using base = two_cursor_sequence<Buffer, Compare>;

 public:
  using key_type = typename Buffer::key_type;
  using mapped_type = typename Buffer::mapped_type;
  using item_type = unioned<key_type, mapped_type>;

  using base::base;

  std::optional<item_type> next() {
    if (this->left_done() && this->right_done()) {
      return std::nullopt;
    }
    if (this->right_done()) {
      return take_left();
    }
    if (this->left_done()) {
      return take_right();
    }

    const auto cmp = this->compare_heads();
    if (cmp == std::weak_ordering::less) {
      return take_left();
    }
    if (cmp == std::weak_ordering::greater) {
      return take_right();
    }
    item_type item(union_origin::both, &this->left_->key_at(this->i_),
                   &this->left_->value_at(this->i_),
                   &this->right_->value_at(this->j_));
    ++this->i_;
    ++this->j_;
    return item;
  }

  sequence_iterator<union_sequence> begin() {
    return sequence_iterator<union_sequence>(this);
  }
  std::default_sentinel_t end() const { return {}; }

 private:
  item_type take_left() {
    const auto i = this->i_++;
    return item_type(union_origin::left, &this->left_->key_at(i),
                     &this->left_->value_at(i), nullptr);
  }

  item_type take_right() {
    const auto j = this->j_++;
    return item_type(union_origin::right, &this->right_->key_at(j), nullptr,
                     &this->right_->value_at(j));
  }
};

/**
 * Keys present in both maps, in sorted order.
 */
template <typename Buffer, typename Compare>
class intersection_sequence : private two_cursor_sequence<Buffer, Compare> {
  using base = two_cursor_sequence<Buffer, Compare>;

 public:
  using key_type = typename Buffer::key_type;
  using mapped_type = typename Buffer::mapped_type;
  using item_type = intersected<key_type, mapped_type>;

  using base::base;

  std::optional<item_type> next() {
    while (!this->left_done() && !this->right_done()) {
      const auto cmp = this->compare_heads();
      if (cmp == std::weak_ordering::less) {
        ++this->i_;
      } else if (cmp == std::weak_ordering::greater) {
        ++this->j_;
      } else {
        item_type item(&this->left_->key_at(this->i_),
                       &this->left_->value_at(this->i_),
                       &this->right_->value_at(this->j_));
        ++this->i_;
        ++this->j_;
        return item;
      }
    }
    return std::nullopt;
  }

  sequence_iterator<intersection_sequence> begin() {
    return sequence_iterator<intersection_sequence>(this);
  }
  std::default_sentinel_t end() const { return {}; }
};

/**
 * Keys of the left map that are absent from the right map, in sorted order.
 */
template <typename Buffer, typename Compare>
class difference_sequence : private two_cursor_sequence<Buffer, Compare> {
  using base = two_cursor_sequence<Buffer, Compare>;

 public:
  using key_type = typename Buffer::key_type;
  using mapped_type = typename Buffer::mapped_type;
  using item_type = field_view<key_type, mapped_type>;

  using base::base;

  std::optional<item_type> next() {
    while (!this->left_done()) {
      if (!this->right_done()) {
        const auto cmp = this->compare_heads();
        if (cmp == std::weak_ordering::greater) {
          ++this->j_;
          continue;
        }
        if (cmp == std::weak_ordering::equivalent) {
          ++this->i_;
          ++this->j_;
          continue;
        }
      }
      const auto i = this->i_++;
      return item_type(&this->left_->key_at(i), &this->left_->value_at(i));
    }
    return std::nullopt;
  }

  sequence_iterator<difference_sequence> begin() {
    return sequence_iterator<difference_sequence>(this);
  }
  std::default_sentinel_t end() const { return {}; }
};

// ============================================================================
// Drain
// ============================================================================

/**
 * Removes fields from the front of a map and hands them to the caller, one
 * per next(). Holds the map's exclusive borrow.
 *
 * Consumed slots are erased when the drain is destroyed; whatever was not
 * consumed stays in the map, still sorted.
 */
template <typename Buffer>
class drain_sequence {
 public:
  using field_type = typename Buffer::field_type;
  using size_type = typename Buffer::size_type;

  drain_sequence(Buffer& buffer, borrow_flag::exclusive_guard guard)
      : buffer_(&buffer), guard_(std::move(guard)) {}

  drain_sequence(const drain_sequence&) = delete;
  drain_sequence& operator=(const drain_sequence&) = delete;

  drain_sequence(drain_sequence&& other) noexcept
      : buffer_(std::exchange(other.buffer_, nullptr)),
        consumed_(std::exchange(other.consumed_, 0)),
        guard_(std::move(other.guard_)) {}

  drain_sequence& operator=(drain_sequence&&) = delete;

  ~drain_sequence() {
    if (buffer_ != nullptr) {
      buffer_->erase_prefix(consumed_);
    }
  }

  std::optional<field_type> next() {
    if (buffer_ == nullptr || consumed_ >= buffer_->size()) {
      return std::nullopt;
    }
    return buffer_->take_at(consumed_++);
  }

  // Number of fields not yet handed out
  size_type remaining() const {
    return buffer_ == nullptr ? 0 : buffer_->size() - consumed_;
  }

  sequence_iterator<drain_sequence> begin() {
    return sequence_iterator<drain_sequence>(this);
  }
  std::default_sentinel_t end() const { return {}; }

 private:
  Buffer* buffer_;
  size_type consumed_ = 0;
  // Declared last so the prefix is erased before the borrow ends
  borrow_flag::exclusive_guard guard_;
};

// ============================================================================
// Set views of the map sequences
// ============================================================================

/**
 * Projects a map sequence onto its keys. next() returns a pointer to the
 * member, or nullptr at the end.
 */
template <typename Inner>
class member_sequence {
 public:
  using member_type = typename Inner::key_type;

  explicit member_sequence(Inner inner) : inner_(std::move(inner)) {}

  const member_type* next() {
    if (auto item = inner_.next()) {
      return &item->key();
    }
    return nullptr;
  }

  sequence_iterator<member_sequence> begin() {
    return sequence_iterator<member_sequence>(this);
  }
  std::default_sentinel_t end() const { return {}; }

 private:
  Inner inner_;
};

// Drain of a set: yields owned members
template <typename Buffer>
class member_drain {
 public:
  using member_type = typename Buffer::key_type;
  using size_type = typename Buffer::size_type;

  explicit member_drain(drain_sequence<Buffer> inner)
      : inner_(std::move(inner)) {}

  std::optional<member_type> next() {
    if (auto removed = inner_.next()) {
      return std::move(*removed).into_key();
    }
    return std::nullopt;
  }

  size_type remaining() const { return inner_.remaining(); }

  sequence_iterator<member_drain> begin() {
    return sequence_iterator<member_drain>(this);
  }
  std::default_sentinel_t end() const { return {}; }

 private:
  drain_sequence<Buffer> inner_;
};

}  // namespace kressler::sorted_containers
