// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <span>
#include <type_traits>

namespace kressler::sorted_containers {

// Enum to control search strategy
enum class SearchMode {
  Binary,  // Binary search using std::lower_bound (O(log n))
  Linear,  // Linear search for small arrays (better cache behavior)
  Hybrid   // Bisect until the window fits in a few cache lines, then scan
};

// Concept to enforce that a comparator is compatible with a key type
template <typename Key, typename Compare>
concept ComparatorCompatible = requires(Compare comp, Key a, Key b) {
  { comp(a, b) } -> std::convertible_to<bool>;
} && std::is_default_constructible_v<Compare>;

// Comparators tagged with is_transparent accept any comparable lookup type
template <typename Compare>
concept TransparentComparator = requires { typename Compare::is_transparent; };

/**
 * Heuristic for the window size below which the hybrid search switches from
 * bisection to a sequential scan. Targets two cache lines of keys.
 *
 * @tparam Key The key type
 * @return Number of keys scanned sequentially
 *
 * Formula:
 *   Entry size: sizeof(Key) rounded up to alignof(Key)
 *   Window: 128 bytes / entry size
 *   Clamped to [4, 16] so tiny keys don't scan too far and huge keys still
 *   get a short scan
 */
template <typename Key>
constexpr std::size_t default_scan_limit() {
  constexpr std::size_t align = alignof(Key);
  constexpr std::size_t aligned = ((sizeof(Key) + (align - 1)) / align) * align;
  if constexpr (aligned == 0) {
    return 1;
  } else {
    return std::clamp(static_cast<std::size_t>(128) / aligned,
                      static_cast<std::size_t>(4),
                      static_cast<std::size_t>(16));
  }
}

/**
 * Result of locating a key in a sorted key array.
 *
 * found(i):     keys[i] is equivalent to the searched key
 * insert_at(i): the key is absent; inserting it at i keeps the array sorted
 *               (0 <= i <= size)
 */
class locate_result {
 public:
  static constexpr locate_result found(std::size_t index) {
    return locate_result(index, true);
  }

  static constexpr locate_result insert_at(std::size_t index) {
    return locate_result(index, false);
  }

  constexpr bool is_found() const { return found_; }
  constexpr std::size_t index() const { return index_; }

  constexpr bool operator==(const locate_result&) const = default;

 private:
  constexpr locate_result(std::size_t index, bool found)
      : index_(index), found_(found) {}

  std::size_t index_;
  bool found_;
};

namespace detail {

template <typename Compare>
inline constexpr bool is_default_less = false;

template <typename T>
inline constexpr bool is_default_less<std::less<T>> = true;

}  // namespace detail

/**
 * Three-way comparison of a stored key against a lookup key.
 *
 * Uses operator<=> when the comparator is std::less and both types are weakly
 * three-way comparable (one comparison per probe). Any other comparator is
 * called at most twice.
 */
template <typename Compare, typename A, typename B>
constexpr std::weak_ordering compare_keys(const Compare& comp, const A& a,
                                          const B& b) {
  if constexpr (detail::is_default_less<Compare> &&
                std::three_way_comparable_with<A, B, std::weak_ordering>) {
    return a <=> b;
  } else {
    if (comp(a, b)) {
      return std::weak_ordering::less;
    }
    if (comp(b, a)) {
      return std::weak_ordering::greater;
    }
    return std::weak_ordering::equivalent;
  }
}

/**
 * Reference binary search. Every other search mode must return exactly what
 * this returns.
 */
template <typename Key, typename K, typename Compare>
constexpr locate_result binary_locate(std::span<const Key> keys, const K& key,
                                      const Compare& comp) {
  const auto it = std::lower_bound(keys.begin(), keys.end(), key, comp);
  const std::size_t idx = it - keys.begin();
  if (it != keys.end() && !comp(key, *it)) {
    return locate_result::found(idx);
  }
  return locate_result::insert_at(idx);
}

// Linear search: scan from beginning until we find key >= search key
template <typename Key, typename K, typename Compare>
constexpr locate_result linear_locate(std::span<const Key> keys, const K& key,
                                      const Compare& comp) {
  for (std::size_t i = 0; i < keys.size(); ++i) {
    const auto cmp = compare_keys(comp, keys[i], key);
    if (cmp == std::weak_ordering::less) {
      continue;
    }
    if (cmp == std::weak_ordering::equivalent) {
      return locate_result::found(i);
    }
    return locate_result::insert_at(i);
  }
  return locate_result::insert_at(keys.size());
}

/**
 * Hybrid search: classic bisection over the window [low, high) while it is
 * wider than ScanLimit, then a sequential scan of what remains.
 *
 * When the array holds ScanLimit or fewer keys no bisection step runs at all.
 * An equivalent key found at a midpoint returns immediately.
 *
 * @tparam ScanLimit Window width at which scanning takes over (>= 1)
 */
template <std::size_t ScanLimit, typename Key, typename K, typename Compare>
constexpr locate_result hybrid_locate(std::span<const Key> keys, const K& key,
                                      const Compare& comp) {
  static_assert(ScanLimit > 0, "ScanLimit must be at least 1");

  std::size_t low = 0;
  std::size_t high = keys.size();
  while (high - low > ScanLimit) {
    const std::size_t midpoint = low + (high - low) / 2;
    const auto cmp = compare_keys(comp, keys[midpoint], key);
    if (cmp == std::weak_ordering::less) {
      low = midpoint + 1;
    } else if (cmp == std::weak_ordering::greater) {
      high = midpoint;
    } else {
      return locate_result::found(midpoint);
    }
  }

  for (std::size_t i = low; i < high; ++i) {
    const auto cmp = compare_keys(comp, keys[i], key);
    if (cmp == std::weak_ordering::less) {
      continue;
    }
    if (cmp == std::weak_ordering::equivalent) {
      return locate_result::found(i);
    }
    return locate_result::insert_at(i);
  }
  return locate_result::insert_at(high);
}

/**
 * Locate a key using the configured search mode.
 *
 * @tparam SearchModeT Binary, Linear or Hybrid
 * @tparam ScanLimit Scan window for Hybrid (ignored by the other modes)
 * @param keys Sorted, duplicate-free keys
 * @param key The key to search for
 * @param comp Strict weak ordering the keys are sorted by
 */
template <SearchMode SearchModeT, std::size_t ScanLimit, typename Key,
          typename K, typename Compare>
constexpr locate_result locate(std::span<const Key> keys, const K& key,
                               const Compare& comp) {
  if constexpr (SearchModeT == SearchMode::Binary) {
    return binary_locate(keys, key, comp);
  } else if constexpr (SearchModeT == SearchMode::Linear) {
    return linear_locate(keys, key, comp);
  } else if constexpr (SearchModeT == SearchMode::Hybrid) {
    return hybrid_locate<ScanLimit>(keys, key, comp);
  } else {
    static_assert(SearchModeT == SearchMode::Binary ||
                      SearchModeT == SearchMode::Linear ||
                      SearchModeT == SearchMode::Hybrid,
                  "Invalid SearchMode");
  }
}

}  // namespace kressler::sorted_containers
