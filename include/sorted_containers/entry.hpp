// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "borrow_flag.hpp"

namespace kressler::sorted_containers {

/**
 * The key handed to sorted_map::entry().
 *
 * Either owns a Key (entry(Key&&)), points at a caller-owned Key
 * (entry(const Key&)), or holds a copy of a heterogeneous lookup key such as
 * a std::string_view. A borrowed or heterogeneous key is converted to an owned
 * Key only when a vacant entry is actually filled.
 */
template <typename Key, typename Borrowed = Key>
class search_key {
  static constexpr bool heterogeneous = !std::same_as<Key, Borrowed>;

 public:
  static search_key owned(Key key)
    requires(!heterogeneous)
  {
    search_key result;
    result.owned_.emplace(std::move(key));
    return result;
  }

  static search_key borrowed(const Borrowed& key)
    requires std::constructible_from<Key, const Borrowed&>
  {
    search_key result;
    if constexpr (heterogeneous) {
      result.held_.emplace(key);
    } else {
      result.borrowed_ = std::addressof(key);
    }
    return result;
  }

  bool is_owned() const { return owned_.has_value(); }

  const Borrowed& get() const {
    if constexpr (heterogeneous) {
      return *held_;
    } else {
      return owned_ ? *owned_ : *borrowed_;
    }
  }

  Key into_owned() && {
    if constexpr (heterogeneous) {
      return Key(*held_);
    } else if constexpr (std::constructible_from<Key, const Key&>) {
      return owned_ ? std::move(*owned_) : Key(*borrowed_);
    } else {
      // Keys that cannot be copied are only ever owned
      return std::move(*owned_);
    }
  }

 private:
  search_key() = default;

  std::optional<Key> owned_;
  const Key* borrowed_ = nullptr;
  std::optional<std::conditional_t<heterogeneous, Borrowed, std::monostate>>
      held_;
};

/**
 * An entry whose key was found. Holds the map's exclusive borrow until it is
 * destroyed or remove() is called.
 *
 * @tparam Buffer The ordered_buffer type of the owning map
 */
template <typename Buffer>
class occupied_entry {
 public:
  using key_type = typename Buffer::key_type;
  using mapped_type = typename Buffer::mapped_type;
  using field_type = typename Buffer::field_type;
  using size_type = typename Buffer::size_type;

  occupied_entry(Buffer& buffer, size_type index,
                 borrow_flag::exclusive_guard guard)
      : buffer_(&buffer), index_(index), guard_(std::move(guard)) {}

  occupied_entry(occupied_entry&&) noexcept = default;
  occupied_entry& operator=(occupied_entry&&) noexcept = default;

  const key_type& key() const { return live("read entry").key_at(index_); }

  const mapped_type& value() const {
    return live("read entry").value_at(index_);
  }

  mapped_type& value() { return live("modify entry").value_at(index_); }

  const mapped_type& operator*() const { return value(); }
  mapped_type& operator*() { return value(); }
  const mapped_type* operator->() const { return &value(); }
  mapped_type* operator->() { return &value(); }

  /**
   * Reference to the stored value that stays valid after the entry is
   * destroyed (until the map is next mutated).
   */
  mapped_type& into_mut() { return value(); }

  /**
   * Store value in this field.
   *
   * @return The value that was stored before
   */
  mapped_type replace(mapped_type value) {
    return std::exchange(this->value(), std::move(value));
  }

  /**
   * Remove the field from the map. Later fields shift left by one.
   * The entry is spent afterwards and its borrow is released; any further
   * use of it throws.
   *
   * @return The removed field
   * @throws std::runtime_error if the field was already removed
   */
  field_type remove() {
    field_type removed = live("remove entry").remove_at(index_);
    buffer_ = nullptr;
    guard_.release();
    return removed;
  }

  size_type index() const { return index_; }

 private:
  Buffer& live(const char* operation) const {
    if (buffer_ == nullptr) {
      throw std::runtime_error(std::string("Cannot ") + operation +
                               ": field was already removed");
    }
    return *buffer_;
  }

  Buffer* buffer_;
  size_type index_;
  borrow_flag::exclusive_guard guard_;
};

/**
 * An entry whose key was not found. Remembers where the key belongs so that
 * insert() does not search again.
 *
 * @tparam Buffer The ordered_buffer type of the owning map
 * @tparam Borrowed The type of the key passed to entry()
 */
template <typename Buffer, typename Borrowed>
class vacant_entry {
 public:
  using key_type = typename Buffer::key_type;
  using mapped_type = typename Buffer::mapped_type;
  using size_type = typename Buffer::size_type;

  vacant_entry(Buffer& buffer, search_key<key_type, Borrowed> key,
               size_type index, borrow_flag::exclusive_guard guard)
      : buffer_(&buffer),
        key_(std::move(key)),
        index_(index),
        guard_(std::move(guard)) {}

  vacant_entry(vacant_entry&&) noexcept = default;
  vacant_entry& operator=(vacant_entry&&) noexcept = default;

  // The pending key, exactly as passed to entry()
  const Borrowed& key() const { return key_.get(); }

  /**
   * Insert the pending key with value at the recorded position.
   * A borrowed key is converted to an owned key here, and only here.
   * The entry is spent afterwards.
   *
   * @return Reference to the inserted value
   * @throws std::runtime_error if the entry was already filled
   */
  mapped_type& insert(mapped_type value) {
    if (buffer_ == nullptr) {
      throw std::runtime_error("Cannot insert: entry was already filled");
    }
    Buffer* buffer = std::exchange(buffer_, nullptr);
    return buffer->insert_at(index_, std::move(key_).into_owned(),
                             std::move(value));
  }

  size_type index() const { return index_; }

 private:
  Buffer* buffer_;
  search_key<key_type, Borrowed> key_;
  size_type index_;
  borrow_flag::exclusive_guard guard_;
};

/**
 * Result of sorted_map::entry(): either an occupied_entry or a vacant_entry.
 * Produced by a single search; none of the operations below search again.
 */
template <typename Buffer, typename Borrowed>
class entry {
 public:
  using mapped_type = typename Buffer::mapped_type;
  using occupied_type = occupied_entry<Buffer>;
  using vacant_type = vacant_entry<Buffer, Borrowed>;

  explicit entry(occupied_type occupied) : state_(std::move(occupied)) {}
  explicit entry(vacant_type vacant) : state_(std::move(vacant)) {}

  bool is_occupied() const {
    return std::holds_alternative<occupied_type>(state_);
  }
  bool is_vacant() const { return std::holds_alternative<vacant_type>(state_); }

  // The stored key if occupied, otherwise the pending key
  const Borrowed& key() const
    requires std::same_as<Borrowed, typename Buffer::key_type>
  {
    if (const auto* occupied = std::get_if<occupied_type>(&state_)) {
      return occupied->key();
    }
    return std::get<vacant_type>(state_).key();
  }

  // nullptr unless the entry is occupied
  occupied_type* as_occupied() { return std::get_if<occupied_type>(&state_); }

  // nullptr unless the entry is vacant
  vacant_type* as_vacant() { return std::get_if<vacant_type>(&state_); }

  /**
   * Call update with the stored value if the entry is occupied.
   */
  template <typename F>
  entry& and_modify(F&& update) {
    if (auto* occupied = as_occupied()) {
      std::invoke(std::forward<F>(update), occupied->value());
    }
    return *this;
  }

  mapped_type& or_insert(mapped_type value) {
    if (auto* occupied = as_occupied()) {
      return occupied->into_mut();
    }
    return as_vacant()->insert(std::move(value));
  }

  /**
   * Insert the result of contents() if vacant. contents is not called when
   * the entry is occupied.
   */
  template <typename F>
  mapped_type& or_insert_with(F&& contents) {
    if (auto* occupied = as_occupied()) {
      return occupied->into_mut();
    }
    return as_vacant()->insert(std::invoke(std::forward<F>(contents)));
  }

  /**
   * Insert a default-constructed value if vacant. No value is constructed
   * when the entry is occupied.
   */
  mapped_type& or_default()
    requires std::default_initializable<mapped_type>
  {
    return or_insert_with([] { return mapped_type(); });
  }

 private:
  std::variant<occupied_type, vacant_type> state_;
};

}  // namespace kressler::sorted_containers
