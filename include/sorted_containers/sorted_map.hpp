// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cassert>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "borrow_flag.hpp"
#include "entry.hpp"
#include "field.hpp"
#include "locator.hpp"
#include "ordered_buffer.hpp"
#include "sequences.hpp"

namespace kressler::sorted_containers {

// What merge_with() does with a key present in both maps
enum class merge_action {
  keep,  // Keep the key with the (possibly updated) left value
  drop   // Omit the key from the result
};

namespace detail {

// Filter that admits every field of the right-hand map unchanged
struct keep_all {};

// Call a merge resolver; a resolver returning void keeps the key
template <typename Resolve, typename... Args>
merge_action resolve_shared(Resolve& resolve, Args&&... args) {
  if constexpr (std::is_void_v<std::invoke_result_t<Resolve&, Args...>>) {
    std::invoke(resolve, std::forward<Args>(args)...);
    return merge_action::keep;
  } else {
    return std::invoke(resolve, std::forward<Args>(args)...);
  }
}

}  // namespace detail

/**
 * An ordered map stored in one contiguous sorted buffer.
 *
 * Lookups run the Locator over the key array (binary, linear or hybrid
 * search); inserts and removes shift the tail of the buffer. Iteration
 * is always in key order and never depends on insertion order.
 *
 * Aliasing is checked at runtime: entries and drains hold an exclusive borrow
 * of the map, set-algebra sequences hold a shared one. Accessing a map in a
 * way its current borrow forbids throws std::runtime_error.
 *
 * @tparam Key The key type (must be ComparatorCompatible with Compare)
 * @tparam Value The value type
 * @tparam Compare Strict weak ordering on keys (defaults to std::less<Key>).
 *         A transparent comparator enables heterogeneous lookup.
 * @tparam SearchModeT Search strategy (defaults to SearchMode::Hybrid)
 * @tparam Allocator Allocator for std::pair<Key, Value>
 */
template <typename Key, typename Value, typename Compare = std::less<Key>,
          SearchMode SearchModeT = SearchMode::Hybrid,
          typename Allocator = std::allocator<std::pair<Key, Value>>>
  requires ComparatorCompatible<Key, Compare>
class sorted_map {
 public:
  // Type aliases
  using key_type = Key;
  using mapped_type = Value;
  using value_type = std::pair<Key, Value>;
  using size_type = std::size_t;
  using allocator_type = Allocator;
  using key_compare = Compare;
  using buffer_type = ordered_buffer<Key, Value, Allocator>;
  using field_type = sorted_containers::field<Key, Value>;
  using reference = typename buffer_type::reference;
  using const_reference = typename buffer_type::const_reference;
  using iterator = typename buffer_type::iterator;
  using const_iterator = typename buffer_type::const_iterator;
  using reverse_iterator = typename buffer_type::reverse_iterator;
  using const_reverse_iterator = typename buffer_type::const_reverse_iterator;

  template <typename Borrowed = Key>
  using entry_type = sorted_containers::entry<buffer_type, Borrowed>;
  using occupied_entry_type = occupied_entry<buffer_type>;
  template <typename Borrowed = Key>
  using vacant_entry_type = vacant_entry<buffer_type, Borrowed>;

  using union_type = union_sequence<buffer_type, Compare>;
  using intersection_type = intersection_sequence<buffer_type, Compare>;
  using difference_sequence_type = difference_sequence<buffer_type, Compare>;
  using drain_type = drain_sequence<buffer_type>;

  // Window below which the hybrid search scans instead of bisecting
  static constexpr std::size_t scan_limit = default_scan_limit<Key>();

  /**
   * Default constructor - creates an empty map without allocating.
   */
  sorted_map() = default;

  explicit sorted_map(const Compare& comp,
                      const Allocator& alloc = Allocator())
      : buffer_(alloc), comp_(comp) {}

  explicit sorted_map(const Allocator& alloc) : buffer_(alloc) {}

  /**
   * Creates an empty map with room for capacity fields.
   */
  static sorted_map with_capacity(size_type capacity) {
    sorted_map result;
    result.buffer_.reserve(capacity);
    return result;
  }

  /**
   * Construct from a range of key-value pairs. Pairs are inserted in order,
   * so a later duplicate replaces an earlier one.
   */
  template <std::input_iterator InputIt>
  sorted_map(InputIt first, InputIt last, const Compare& comp = Compare(),
             const Allocator& alloc = Allocator());

  sorted_map(std::initializer_list<value_type> init,
             const Compare& comp = Compare(),
             const Allocator& alloc = Allocator())
      : sorted_map(init.begin(), init.end(), comp, alloc) {}

  /**
   * Copy constructor - copies every field. The copy starts unborrowed.
   *
   * @throws std::runtime_error if other is exclusively borrowed
   */
  sorted_map(const sorted_map& other)
      : buffer_(readable(other, "copy").buffer_), comp_(other.comp_) {}

  /**
   * Move constructor.
   *
   * @throws std::runtime_error if other is borrowed
   */
  sorted_map(sorted_map&& other)
      : buffer_(std::move(writable(other, "move").buffer_)),
        comp_(std::move(other.comp_)) {}

  sorted_map& operator=(const sorted_map& other);
  sorted_map& operator=(sorted_map&& other);

  ~sorted_map() = default;

  // ==========================================================================
  // Lookup
  // ==========================================================================

  bool contains(const Key& key) const { return contains<Key>(key); }

  template <typename K>
    requires TransparentComparator<Compare> || std::same_as<K, Key>
  bool contains(const K& key) const {
    borrow_.check_readable("look up key");
    return locate_key(key).is_found();
  }

  /**
   * Find the value stored under key.
   *
   * @return Pointer to the value, or nullptr if key is absent
   */
  const Value* get(const Key& key) const { return get<Key>(key); }

  template <typename K>
    requires TransparentComparator<Compare> || std::same_as<K, Key>
  const Value* get(const K& key) const;

  /**
   * Find the value stored under key for modification.
   *
   * @return Pointer to the value, or nullptr if key is absent
   * @throws std::runtime_error if the map is borrowed
   */
  Value* get_mut(const Key& key) { return get_mut<Key>(key); }

  template <typename K>
    requires TransparentComparator<Compare> || std::same_as<K, Key>
  Value* get_mut(const K& key);

  // The stored key and value for key, if present
  std::optional<const_reference> get_field(const Key& key) const {
    return get_field<Key>(key);
  }

  template <typename K>
    requires TransparentComparator<Compare> || std::same_as<K, Key>
  std::optional<const_reference> get_field(const K& key) const;

  iterator find(const Key& key) { return find<Key>(key); }
  const_iterator find(const Key& key) const { return find<Key>(key); }

  template <typename K>
    requires TransparentComparator<Compare> || std::same_as<K, Key>
  iterator find(const K& key);

  template <typename K>
    requires TransparentComparator<Compare> || std::same_as<K, Key>
  const_iterator find(const K& key) const;

  /**
   * Access the value stored under key.
   *
   * @throws std::out_of_range if key is absent
   */
  Value& at(const Key& key);
  const Value& at(const Key& key) const;

  /**
   * Access the value stored under key, inserting a default-constructed
   * value first if key is absent.
   */
  Value& operator[](const Key& key)
    requires std::default_initializable<Value>
  {
    return entry(key).or_default();
  }

  Value& operator[](Key&& key)
    requires std::default_initializable<Value>
  {
    return entry(std::move(key)).or_default();
  }

  /**
   * The field at a position in sorted order.
   *
   * @return The field, or std::nullopt if index >= size()
   */
  std::optional<const_reference> field(size_type index) const;
  std::optional<reference> field_mut(size_type index);

  // ==========================================================================
  // Modification
  // ==========================================================================

  /**
   * Insert a field, replacing any field with an equivalent key.
   * Both the key and the value are replaced.
   *
   * @return The field that was replaced, or std::nullopt if key was absent
   * @throws std::runtime_error if the map is borrowed
   */
  std::optional<field_type> insert(Key key, Value value);

  /**
   * Insert key with the value produced by make_value(), but only if key is
   * absent. make_value is not called when key is present.
   *
   * @return std::nullopt if the field was inserted; otherwise the caller's
   *         key, handed back untouched
   * @throws std::runtime_error if the map is borrowed
   */
  template <typename F>
    requires std::invocable<F&> &&
             std::convertible_to<std::invoke_result_t<F&>, Value>
  std::optional<Key> insert_with(Key key, F&& make_value);

  /**
   * Locate key once and return an entry for it.
   * The map is exclusively borrowed until the entry is destroyed.
   *
   * The rvalue overload stores the key and moves it into the map if the entry
   * is filled. The const Key& overload only points at the caller's key, which
   * must outlive the entry, and copies it if the entry is filled. The
   * heterogeneous overload keeps its own copy of the lookup key (for example
   * a std::string_view) and converts it to a Key if the entry is filled; the
   * data such a view refers to must still outlive the entry.
   *
   * @throws std::runtime_error if the map is borrowed
   */
  entry_type<Key> entry(Key&& key) {
    return make_entry(search_key<Key>::owned(std::move(key)));
  }

  entry_type<Key> entry(const Key& key) {
    return make_entry(search_key<Key>::borrowed(key));
  }

  template <typename K>
    requires TransparentComparator<Compare> &&
             (!std::same_as<K, Key>) && (!std::is_array_v<K>) &&
             std::constructible_from<Key, const K&>
  entry_type<K> entry(const K& key) {
    return make_entry(search_key<Key, K>::borrowed(key));
  }

  /**
   * Remove the field stored under key.
   *
   * @return The removed field, or std::nullopt if key was absent
   * @throws std::runtime_error if the map is borrowed
   */
  std::optional<field_type> remove(const Key& key) { return remove<Key>(key); }

  template <typename K>
    requires TransparentComparator<Compare> || std::same_as<K, Key>
  std::optional<field_type> remove(const K& key);

  /**
   * Remove the field at a position in sorted order.
   *
   * @throws std::out_of_range if index >= size()
   * @throws std::runtime_error if the map is borrowed
   */
  field_type remove_by_index(size_type index);

  /**
   * Remove fields from the front, one per step, handing them to the caller.
   * Fields not consumed when the drain is destroyed stay in the map.
   *
   * @throws std::runtime_error if the map is borrowed
   */
  drain_type drain() {
    return drain_type(buffer_, borrow_.borrow_exclusive("drain"));
  }

  /**
   * Merge other into this map in one pass over both.
   *
   * Keys only in this map are kept. Keys only in other are copied in (moved
   * in when other is an rvalue). For keys in both maps resolve(key, left,
   * right) is called with this map's value as a mutable reference; it may
   * update left and returns merge_action::keep or merge_action::drop. A
   * resolver returning void keeps every shared key.
   *
   * Both maps stay borrowed while the walk runs: this map exclusively, other
   * shared (exclusively when it is an rvalue). A resolver or filter that
   * touches either map throws std::runtime_error.
   *
   * If a resolver, filter or constructor throws, this map is left empty, and
   * so is other when it was passed as an rvalue.
   *
   * Complexity: O(n + m) comparisons and moves
   *
   * @throws std::runtime_error if either map is borrowed
   */
  template <typename Other, typename Resolve>
    requires std::same_as<std::remove_cvref_t<Other>, sorted_map>
  void merge_with(Other&& other, Resolve resolve) {
    merge_with(std::forward<Other>(other), detail::keep_all{},
               std::move(resolve));
  }

  /**
   * As merge_with(other, resolve), but every field only present in other is
   * first passed to filter(key, value), which returns the value to insert or
   * std::nullopt to skip the key.
   */
  template <typename Other, typename Filter, typename Resolve>
    requires std::same_as<std::remove_cvref_t<Other>, sorted_map>
  void merge_with(Other&& other, Filter filter, Resolve resolve) {
    if constexpr (std::is_lvalue_reference_v<Other>) {
      if (&other == this) {
        // Every key is shared with itself; merge against a snapshot
        const sorted_map snapshot(other);
        auto guard = borrow_.borrow_exclusive("merge");
        auto snapshot_guard = snapshot.borrow_.borrow_shared("merge");
        merge_from(snapshot, filter, resolve);
        return;
      }
      auto guard = borrow_.borrow_exclusive("merge");
      auto other_guard = other.borrow_.borrow_shared("merge");
      merge_from(other, filter, resolve);
    } else {
      if (&other == this) {
        throw std::invalid_argument(
            "Cannot merge: a map cannot consume itself");
      }
      auto guard = borrow_.borrow_exclusive("merge");
      auto other_guard = other.borrow_.borrow_exclusive("merge");
      merge_from(std::move(other), filter, resolve);
    }
  }

  /**
   * Merged copy of this map and other. This map is unchanged.
   */
  template <typename Other, typename... Functions>
    requires std::same_as<std::remove_cvref_t<Other>, sorted_map>
  sorted_map merged_with(Other&& other, Functions... functions) const {
    sorted_map result(*this);
    result.merge_with(std::forward<Other>(other), std::move(functions)...);
    return result;
  }

  // ==========================================================================
  // Set algebra
  // ==========================================================================

  /**
   * Lazily walk the keys of both maps in sorted order.
   * Both maps are shared-borrowed until the sequence is destroyed.
   */
  union_type union_with(const sorted_map& other) const {
    return union_type(buffer_, other.buffer_, comp_,
                      borrow_.borrow_shared("union"),
                      other.borrow_.borrow_shared("union"));
  }

  intersection_type intersection(const sorted_map& other) const {
    return intersection_type(buffer_, other.buffer_, comp_,
                             borrow_.borrow_shared("intersect"),
                             other.borrow_.borrow_shared("intersect"));
  }

  difference_sequence_type difference(const sorted_map& other) const {
    return difference_sequence_type(buffer_, other.buffer_, comp_,
                           borrow_.borrow_shared("difference"),
                           other.borrow_.borrow_shared("difference"));
  }

  // ==========================================================================
  // Capacity
  // ==========================================================================

  size_type size() const { return buffer_.size(); }
  bool empty() const { return buffer_.empty(); }
  size_type capacity() const { return buffer_.capacity(); }

  void reserve(size_type capacity) {
    borrow_.check_writable("reserve");
    buffer_.reserve(capacity);
  }

  /**
   * Reduce the capacity to max(capacity, size()). Never grows.
   */
  void shrink_to(size_type capacity) {
    borrow_.check_writable("shrink");
    buffer_.shrink_to(capacity);
  }

  void shrink_to_fit() { shrink_to(0); }

  void clear() {
    borrow_.check_writable("clear");
    buffer_.clear();
  }

  // ==========================================================================
  // Views and iteration
  // ==========================================================================

  std::span<const Key> keys() const {
    borrow_.check_readable("read keys");
    return buffer_.keys();
  }

  std::span<const Value> values() const {
    borrow_.check_readable("read values");
    return std::as_const(buffer_).values();
  }

  std::span<Value> values_mut() {
    borrow_.check_writable("modify values");
    return buffer_.values();
  }

  // Non-const iteration allows modifying values, so it needs a free map
  iterator begin() {
    borrow_.check_writable("iterate");
    return buffer_.begin();
  }
  iterator end() { return buffer_.end(); }

  const_iterator begin() const {
    borrow_.check_readable("iterate");
    return buffer_.begin();
  }
  const_iterator end() const { return buffer_.end(); }
  const_iterator cbegin() const { return begin(); }
  const_iterator cend() const { return end(); }

  reverse_iterator rbegin() {
    borrow_.check_writable("iterate");
    return buffer_.rbegin();
  }
  reverse_iterator rend() { return buffer_.rend(); }
  const_reverse_iterator rbegin() const {
    borrow_.check_readable("iterate");
    return buffer_.rbegin();
  }
  const_reverse_iterator rend() const { return buffer_.rend(); }

  key_compare key_comp() const { return comp_; }
  allocator_type get_allocator() const { return buffer_.get_allocator(); }

  // Whether any entry, drain or sequence currently borrows this map
  bool is_borrowed() const { return !borrow_.is_free(); }

  void swap(sorted_map& other) {
    borrow_.check_writable("swap");
    other.borrow_.check_writable("swap");
    buffer_.swap(other.buffer_);
    std::swap(comp_, other.comp_);
  }

  /**
   * Maps are equal when they hold equal fields in the same order.
   */
  friend bool operator==(const sorted_map& lhs, const sorted_map& rhs) {
    lhs.borrow_.check_readable("compare");
    rhs.borrow_.check_readable("compare");
    return lhs.buffer_ == rhs.buffer_;
  }

  /**
   * Lexicographic comparison of the fields in iteration order.
   */
  friend auto operator<=>(const sorted_map& lhs, const sorted_map& rhs)
    requires std::three_way_comparable<Key> &&
             std::three_way_comparable<Value>
  {
    using ordering =
        std::common_comparison_category_t<std::compare_three_way_result_t<Key>,
                                          std::compare_three_way_result_t<Value>>;
    lhs.borrow_.check_readable("compare");
    rhs.borrow_.check_readable("compare");
    const size_type common = std::min(lhs.size(), rhs.size());
    for (size_type i = 0; i < common; ++i) {
      if (ordering cmp =
              lhs.buffer_.key_at(i) <=> rhs.buffer_.key_at(i);
          cmp != 0) {
        return cmp;
      }
      if (ordering cmp =
              lhs.buffer_.value_at(i) <=> rhs.buffer_.value_at(i);
          cmp != 0) {
        return cmp;
      }
    }
    return ordering(lhs.size() <=> rhs.size());
  }

 private:
  template <typename K>
  locate_result locate_key(const K& key) const {
    return locate<SearchModeT, scan_limit>(buffer_.keys(), key, comp_);
  }

  template <typename Borrowed>
  entry_type<Borrowed> make_entry(search_key<Key, Borrowed> key);

  template <typename Other, typename Filter, typename Resolve>
  void merge_from(Other&& other, Filter& filter, Resolve& resolve);

  // Whether the field at index sorts strictly between its neighbours
  bool sorted_around(size_type index) const;

  static const sorted_map& readable(const sorted_map& map,
                                    const char* operation) {
    map.borrow_.check_readable(operation);
    return map;
  }

  static sorted_map& writable(sorted_map& map, const char* operation) {
    map.borrow_.check_writable(operation);
    return map;
  }

  buffer_type buffer_;
  [[no_unique_address]] Compare comp_;
  borrow_flag borrow_;
};

template <typename Key, typename Value, typename Compare,
          SearchMode SearchModeT, typename Allocator>
void swap(sorted_map<Key, Value, Compare, SearchModeT, Allocator>& lhs,
          sorted_map<Key, Value, Compare, SearchModeT, Allocator>& rhs) {
  lhs.swap(rhs);
}

}  // namespace kressler::sorted_containers

// Include implementation
#include "sorted_map.ipp"
