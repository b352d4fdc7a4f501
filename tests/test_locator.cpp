// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <compare>
#include <cstdint>
#include <functional>
#include <random>
#include <sorted_containers/locator.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace kressler::sorted_containers;

namespace {

struct Bytes16 {
  std::int64_t a;
  std::int64_t b;
  auto operator<=>(const Bytes16&) const = default;
};

struct Bytes32 {
  std::int64_t parts[4];
  auto operator<=>(const Bytes32&) const = default;
};

struct Bytes64 {
  std::int64_t parts[8];
  auto operator<=>(const Bytes64&) const = default;
};

// Even keys 0, 2, ..., 2 * (n - 1), so every odd key is absent
std::vector<int> even_keys(int n) {
  std::vector<int> keys;
  keys.reserve(n);
  for (int i = 0; i < n; ++i) {
    keys.push_back(2 * i);
  }
  return keys;
}

template <std::size_t ScanLimit>
void check_hybrid_matches_binary(int max_size) {
  for (int n = 0; n <= max_size; ++n) {
    const std::vector<int> keys = even_keys(n);
    const std::span<const int> view(keys);
    for (int key = -1; key <= 2 * n + 1; ++key) {
      const locate_result expected = binary_locate(view, key, std::less<int>());
      const locate_result actual =
          hybrid_locate<ScanLimit>(view, key, std::less<int>());
      INFO("size=" << n << " key=" << key << " limit=" << ScanLimit);
      REQUIRE(actual == expected);
    }
  }
}

}  // namespace

TEST_CASE("default_scan_limit targets two cache lines", "[locator]") {
  STATIC_REQUIRE(default_scan_limit<char>() == 16);
  STATIC_REQUIRE(default_scan_limit<std::int32_t>() == 16);
  STATIC_REQUIRE(default_scan_limit<std::int64_t>() == 16);
  STATIC_REQUIRE(default_scan_limit<Bytes16>() == 8);
  STATIC_REQUIRE(default_scan_limit<Bytes32>() == 4);
  // Keys larger than a cache line still get the minimum scan
  STATIC_REQUIRE(default_scan_limit<Bytes64>() == 4);
}

TEST_CASE("locate_result distinguishes found from insertion point",
          "[locator]") {
  REQUIRE(locate_result::found(3).is_found());
  REQUIRE_FALSE(locate_result::insert_at(3).is_found());
  REQUIRE(locate_result::found(3).index() == 3);
  REQUIRE(locate_result::insert_at(3).index() == 3);
  REQUIRE(locate_result::found(3) != locate_result::insert_at(3));
}

TEST_CASE("binary_locate on small arrays", "[locator]") {
  const std::vector<int> keys = {10, 20, 30, 40};
  const std::span<const int> view(keys);
  const std::less<int> less;

  SECTION("Present keys") {
    REQUIRE(binary_locate(view, 10, less) == locate_result::found(0));
    REQUIRE(binary_locate(view, 30, less) == locate_result::found(2));
    REQUIRE(binary_locate(view, 40, less) == locate_result::found(3));
  }

  SECTION("Absent keys") {
    REQUIRE(binary_locate(view, 5, less) == locate_result::insert_at(0));
    REQUIRE(binary_locate(view, 25, less) == locate_result::insert_at(2));
    REQUIRE(binary_locate(view, 50, less) == locate_result::insert_at(4));
  }

  SECTION("Empty array") {
    const std::vector<int> empty;
    REQUIRE(binary_locate(std::span<const int>(empty), 1, less) ==
            locate_result::insert_at(0));
  }
}

TEST_CASE("hybrid_locate matches binary_locate for every key and size",
          "[locator][hybrid]") {
  SECTION("Scan limit 1") { check_hybrid_matches_binary<1>(70); }
  SECTION("Scan limit 2") { check_hybrid_matches_binary<2>(70); }
  SECTION("Scan limit 4") { check_hybrid_matches_binary<4>(70); }
  SECTION("Scan limit 16") { check_hybrid_matches_binary<16>(70); }
  SECTION("Scan limit larger than the array") {
    check_hybrid_matches_binary<128>(70);
  }
}

TEST_CASE("linear_locate matches binary_locate", "[locator][linear]") {
  for (int n = 0; n <= 40; ++n) {
    const std::vector<int> keys = even_keys(n);
    const std::span<const int> view(keys);
    for (int key = -1; key <= 2 * n + 1; ++key) {
      INFO("size=" << n << " key=" << key);
      REQUIRE(linear_locate(view, key, std::less<int>()) ==
              binary_locate(view, key, std::less<int>()));
    }
  }
}

TEST_CASE("hybrid_locate matches binary_locate on random arrays",
          "[locator][hybrid]") {
  std::mt19937 rng(12345);
  std::uniform_int_distribution<int> value_dist(-1000, 1000);
  std::uniform_int_distribution<int> size_dist(0, 300);

  for (int round = 0; round < 200; ++round) {
    std::vector<int> keys(size_dist(rng));
    for (int& key : keys) {
      key = value_dist(rng);
    }
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    const std::span<const int> view(keys);

    for (int probe = 0; probe < 50; ++probe) {
      const int key = value_dist(rng);
      REQUIRE(hybrid_locate<default_scan_limit<int>()>(view, key,
                                                       std::less<int>()) ==
              binary_locate(view, key, std::less<int>()));
    }
  }
}

TEST_CASE("locate honours a custom comparator", "[locator]") {
  // Descending order
  const std::vector<int> keys = {50, 40, 30, 20, 10};
  const std::span<const int> view(keys);
  const std::greater<int> greater;

  REQUIRE(locate<SearchMode::Hybrid, 2>(view, 30, greater) ==
          locate_result::found(2));
  REQUIRE(locate<SearchMode::Hybrid, 2>(view, 35, greater) ==
          locate_result::insert_at(2));
  REQUIRE(locate<SearchMode::Linear, 2>(view, 5, greater) ==
          locate_result::insert_at(5));
  REQUIRE(locate<SearchMode::Binary, 2>(view, 60, greater) ==
          locate_result::insert_at(0));
}

TEST_CASE("locate supports heterogeneous lookup with std::less<>",
          "[locator]") {
  const std::vector<std::string> keys = {"apple", "banana", "cherry", "date"};
  const std::span<const std::string> view(keys);
  const std::less<> less;

  REQUIRE(locate<SearchMode::Hybrid, 4>(view, std::string_view("cherry"),
                                        less) == locate_result::found(2));
  REQUIRE(locate<SearchMode::Binary, 4>(view, std::string_view("blueberry"),
                                        less) == locate_result::insert_at(2));
  REQUIRE(locate<SearchMode::Linear, 4>(view, std::string_view("zucchini"),
                                        less) == locate_result::insert_at(4));
}

TEST_CASE("compare_keys orders keys three ways", "[locator]") {
  REQUIRE(compare_keys(std::less<int>(), 1, 2) == std::weak_ordering::less);
  REQUIRE(compare_keys(std::less<int>(), 2, 2) ==
          std::weak_ordering::equivalent);
  REQUIRE(compare_keys(std::greater<int>(), 1, 2) ==
          std::weak_ordering::greater);
}
