// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <functional>
#include <map>
#include <random>
#include <sorted_containers/sorted_map.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace kressler::sorted_containers;

// Helper types for testing different SearchModes
struct BinarySearchMode {
  static constexpr SearchMode value = SearchMode::Binary;
};
struct LinearSearchMode {
  static constexpr SearchMode value = SearchMode::Linear;
};
struct HybridSearchMode {
  static constexpr SearchMode value = SearchMode::Hybrid;
};

namespace {

// Key whose equivalence ignores the tag, so replacement is observable
struct TaggedKey {
  int id;
  int tag;

  bool operator<(const TaggedKey& other) const { return id < other.id; }
};

template <typename Map>
std::vector<typename Map::key_type> keys_of(const Map& map) {
  return {map.keys().begin(), map.keys().end()};
}

}  // namespace

TEMPLATE_TEST_CASE("sorted_map basic insert, get and remove",
                   "[sorted_map][basic]", BinarySearchMode, LinearSearchMode,
                   HybridSearchMode) {
  constexpr SearchMode Mode = TestType::value;
  sorted_map<int, std::string, std::less<int>, Mode> map;

  REQUIRE(map.empty());
  REQUIRE(map.get(1) == nullptr);

  SECTION("Fields are kept in key order regardless of insertion order") {
    REQUIRE_FALSE(map.insert(5, "e").has_value());
    REQUIRE_FALSE(map.insert(1, "a").has_value());
    REQUIRE_FALSE(map.insert(3, "c").has_value());

    REQUIRE(map.size() == 3);
    REQUIRE(keys_of(map) == std::vector<int>{1, 3, 5});
    REQUIRE(*map.get(3) == "c");

    auto previous = map.insert(3, "z");
    REQUIRE(previous.has_value());
    REQUIRE(previous->key() == 3);
    REQUIRE(previous->value == "c");
    REQUIRE(*map.get(3) == "z");
    REQUIRE(map.size() == 3);
  }

  SECTION("Remove returns the owned field") {
    map.insert(1, "a");
    map.insert(2, "b");

    auto removed = map.remove(1);
    REQUIRE(removed.has_value());
    REQUIRE(removed->key() == 1);
    REQUIRE(removed->value == "a");
    REQUIRE_FALSE(map.contains(1));
    REQUIRE_FALSE(map.remove(1).has_value());
    REQUIRE(map.size() == 1);
  }

  SECTION("Insert then remove restores the previous contents") {
    map.insert(10, "x");
    map.insert(20, "y");
    const auto before = map;

    map.insert(15, "new");
    REQUIRE(map.remove(15).has_value());
    REQUIRE(map == before);
  }

  SECTION("get_mut modifies in place") {
    map.insert(7, "seven");
    *map.get_mut(7) += "!";
    REQUIRE(*map.get(7) == "seven!");
    REQUIRE(map.get_mut(8) == nullptr);
  }
}

TEMPLATE_TEST_CASE("sorted_map insert replaces the stored key",
                   "[sorted_map][insert]", BinarySearchMode, LinearSearchMode,
                   HybridSearchMode) {
  constexpr SearchMode Mode = TestType::value;
  sorted_map<TaggedKey, int, std::less<TaggedKey>, Mode> map;

  map.insert(TaggedKey{1, 100}, 10);
  auto previous = map.insert(TaggedKey{1, 200}, 20);

  REQUIRE(previous.has_value());
  REQUIRE(previous->key().tag == 100);
  REQUIRE(previous->value == 10);
  REQUIRE(map.keys()[0].tag == 200);
  REQUIRE(map.values()[0] == 20);
}

TEMPLATE_TEST_CASE("sorted_map insert_with only builds values for new keys",
                   "[sorted_map][insert]", BinarySearchMode, LinearSearchMode,
                   HybridSearchMode) {
  constexpr SearchMode Mode = TestType::value;
  sorted_map<std::string, int, std::less<std::string>, Mode> map;
  int calls = 0;
  auto make_value = [&calls] {
    ++calls;
    return 42;
  };

  REQUIRE_FALSE(map.insert_with("a", make_value).has_value());
  REQUIRE(calls == 1);
  REQUIRE(*map.get("a") == 42);

  auto rejected = map.insert_with("a", make_value);
  REQUIRE(rejected.has_value());
  REQUIRE(*rejected == "a");
  REQUIRE(calls == 1);
  REQUIRE(map.size() == 1);
}

TEMPLATE_TEST_CASE("sorted_map binary search extremes", "[sorted_map][search]",
                   BinarySearchMode, LinearSearchMode, HybridSearchMode) {
  constexpr SearchMode Mode = TestType::value;
  sorted_map<int, int, std::less<int>, Mode> map;

  for (int i = 0; i < 100; i += 2) {
    map.insert(i, i);
  }
  for (int i = 1; i < 100; i += 2) {
    map.insert(i, i);
  }

  REQUIRE(map.size() == 100);
  for (int i = 0; i < 100; ++i) {
    REQUIRE(map.keys()[i] == i);
    REQUIRE(*map.get(i) == i);
  }
  REQUIRE(map.get(-1) == nullptr);
  REQUIRE(map.get(100) == nullptr);
}

TEMPLATE_TEST_CASE("sorted_map agrees with std::map on random operations",
                   "[sorted_map][random]", BinarySearchMode, LinearSearchMode,
                   HybridSearchMode) {
  constexpr SearchMode Mode = TestType::value;
  sorted_map<int, int, std::less<int>, Mode> map;
  std::map<int, int> reference;

  std::mt19937 rng(2024);
  std::uniform_int_distribution<int> key_dist(0, 300);
  std::uniform_int_distribution<int> op_dist(0, 2);

  for (int step = 0; step < 5000; ++step) {
    const int key = key_dist(rng);
    switch (op_dist(rng)) {
      case 0: {
        auto previous = map.insert(key, step);
        auto it = reference.find(key);
        REQUIRE(previous.has_value() == (it != reference.end()));
        if (previous) {
          REQUIRE(previous->value == it->second);
        }
        reference[key] = step;
        break;
      }
      case 1: {
        auto removed = map.remove(key);
        REQUIRE(removed.has_value() == (reference.erase(key) == 1));
        break;
      }
      default: {
        const int* value = map.get(key);
        auto it = reference.find(key);
        REQUIRE((value != nullptr) == (it != reference.end()));
        if (value != nullptr) {
          REQUIRE(*value == it->second);
        }
        break;
      }
    }
  }

  REQUIRE(map.size() == reference.size());
  auto it = reference.begin();
  for (auto [key, value] : std::as_const(map)) {
    REQUIRE(key == it->first);
    REQUIRE(value == it->second);
    ++it;
  }
}

TEST_CASE("sorted_map construction", "[sorted_map][constructor]") {
  SECTION("Initializer list keeps the last duplicate") {
    sorted_map<int, std::string> map = {{3, "c"}, {1, "a"}, {3, "z"}};
    REQUIRE(map.size() == 2);
    REQUIRE(*map.get(3) == "z");
    REQUIRE(keys_of(map) == std::vector<int>{1, 3});
  }

  SECTION("Iterator range") {
    std::vector<std::pair<int, int>> pairs = {{5, 50}, {2, 20}, {8, 80}};
    sorted_map<int, int> map(pairs.begin(), pairs.end());
    REQUIRE(keys_of(map) == std::vector<int>{2, 5, 8});
    REQUIRE(map.at(8) == 80);
  }

  SECTION("Copy is independent") {
    sorted_map<int, int> original = {{1, 1}, {2, 2}};
    sorted_map<int, int> copy(original);
    copy.insert(3, 3);
    REQUIRE(original.size() == 2);
    REQUIRE(copy.size() == 3);
  }

  SECTION("Move leaves the source usable") {
    sorted_map<int, int> original = {{1, 1}, {2, 2}};
    sorted_map<int, int> moved(std::move(original));
    REQUIRE(moved.size() == 2);
    original.clear();
    original.insert(9, 9);
    REQUIRE(original.size() == 1);
  }
}

TEST_CASE("sorted_map element access", "[sorted_map][access]") {
  sorted_map<int, std::string> map = {{1, "a"}, {2, "b"}, {3, "c"}};

  SECTION("at throws for missing keys") {
    REQUIRE(map.at(2) == "b");
    REQUIRE_THROWS_AS(map.at(4), std::out_of_range);
    REQUIRE_THROWS_AS(std::as_const(map).at(0), std::out_of_range);
  }

  SECTION("operator[] inserts a default value") {
    REQUIRE(map[2] == "b");
    map[4] += "d";
    REQUIRE(map.size() == 4);
    REQUIRE(*map.get(4) == "d");
  }

  SECTION("field by index") {
    auto second = map.field(1);
    REQUIRE(second.has_value());
    REQUIRE(second->first == 2);
    REQUIRE(second->second == "b");
    REQUIRE_FALSE(map.field(3).has_value());

    auto first = map.field_mut(0);
    REQUIRE(first.has_value());
    first->second = "A";
    REQUIRE(*map.get(1) == "A");
  }

  SECTION("get_field returns the stored key and value") {
    auto found = map.get_field(3);
    REQUIRE(found.has_value());
    REQUIRE(found->first == 3);
    REQUIRE(found->second == "c");
    REQUIRE_FALSE(map.get_field(7).has_value());
  }

  SECTION("find returns an iterator to the field") {
    auto it = map.find(2);
    REQUIRE(it != map.end());
    REQUIRE(it->second == "b");
    REQUIRE(map.find(9) == map.end());
  }

  SECTION("remove_by_index") {
    auto removed = map.remove_by_index(0);
    REQUIRE(removed.key() == 1);
    REQUIRE(keys_of(map) == std::vector<int>{2, 3});
    REQUIRE_THROWS_AS(map.remove_by_index(2), std::out_of_range);
  }
}

TEST_CASE("sorted_map views and iteration", "[sorted_map][iterator]") {
  sorted_map<int, int> map = {{3, 30}, {1, 10}, {2, 20}};

  SECTION("keys and values are parallel spans") {
    REQUIRE(keys_of(map) == std::vector<int>{1, 2, 3});
    std::vector<int> values(map.values().begin(), map.values().end());
    REQUIRE(values == std::vector<int>{10, 20, 30});
  }

  SECTION("values_mut") {
    for (int& value : map.values_mut()) {
      value += 1;
    }
    REQUIRE(map.at(3) == 31);
  }

  SECTION("Mutable iteration updates values") {
    for (auto [key, value] : map) {
      value = key * 100;
    }
    REQUIRE(map.at(2) == 200);
  }

  SECTION("Reverse iteration") {
    std::vector<int> keys;
    for (auto it = map.rbegin(); it != map.rend(); ++it) {
      keys.push_back(it->first);
    }
    REQUIRE(keys == std::vector<int>{3, 2, 1});
  }
}

TEST_CASE("sorted_map comparison", "[sorted_map][compare]") {
  sorted_map<int, int> a = {{1, 1}, {2, 2}};
  sorted_map<int, int> b = {{2, 2}, {1, 1}};
  sorted_map<int, int> c = {{1, 1}, {2, 3}};
  sorted_map<int, int> d = {{1, 1}};

  REQUIRE(a == b);
  REQUIRE(a != c);
  REQUIRE(a < c);
  REQUIRE(d < a);
  REQUIRE((a <=> b) == 0);
}

TEST_CASE("sorted_map capacity", "[sorted_map][capacity]") {
  SECTION("with_capacity reserves without inserting") {
    auto map = sorted_map<int, int>::with_capacity(1);
    REQUIRE(map.capacity() == 1);
    REQUIRE(map.empty());
    map.insert(1, 1);
    REQUIRE(map.capacity() == 1);
  }

  SECTION("clear keeps capacity, shrink releases it") {
    auto map = sorted_map<int, int>::with_capacity(10);
    map.insert(1, 1);
    REQUIRE(map.capacity() == 10);

    map.shrink_to(0);
    REQUIRE(map.capacity() == 1);
    REQUIRE(map.at(1) == 1);

    map.clear();
    REQUIRE(map.empty());
    REQUIRE(map.capacity() == 1);
    map.shrink_to_fit();
    REQUIRE(map.capacity() == 0);
  }
}

TEST_CASE("sorted_map heterogeneous lookup", "[sorted_map][transparent]") {
  sorted_map<std::string, int, std::less<>> map;
  map.insert("banana", 2);
  map.insert("apple", 1);

  REQUIRE(map.contains(std::string_view("apple")));
  REQUIRE(*map.get(std::string_view("banana")) == 2);
  REQUIRE(map.get("cherry") == nullptr);
  REQUIRE(map.remove(std::string_view("apple")).has_value());
  REQUIRE(map.size() == 1);
}

TEST_CASE("sorted_map with a descending comparator",
          "[sorted_map][comparator]") {
  sorted_map<int, int, std::greater<int>> map = {{1, 1}, {3, 3}, {2, 2}};
  REQUIRE(keys_of(map) == std::vector<int>{3, 2, 1});
  REQUIRE(map.contains(2));
}

TEST_CASE("sorted_map drain", "[sorted_map][drain]") {
  sorted_map<int, std::string> map = {{1, "a"}, {2, "b"}, {3, "c"}, {4, "d"}};

  SECTION("Full drain empties the map in order") {
    std::vector<int> drained;
    {
      auto drain = map.drain();
      for (auto& removed : drain) {
        drained.push_back(removed.key());
      }
    }
    REQUIRE(drained == std::vector<int>{1, 2, 3, 4});
    REQUIRE(map.empty());
  }

  SECTION("Partial drain leaves the unconsumed suffix") {
    {
      auto drain = map.drain();
      auto first = drain.next();
      auto second = drain.next();
      REQUIRE(first->key() == 1);
      REQUIRE(second->value == "b");
      REQUIRE(drain.remaining() == 2);
    }
    REQUIRE(keys_of(map) == std::vector<int>{3, 4});
    REQUIRE(*map.get(3) == "c");
  }

  SECTION("Unused drain removes nothing") {
    { auto drain = map.drain(); }
    REQUIRE(map.size() == 4);
  }
}

TEST_CASE("sorted_map set algebra", "[sorted_map][algebra]") {
  sorted_map<int, int> left = {{1, 10}, {2, 20}, {4, 40}};
  sorted_map<int, int> right = {{2, 200}, {3, 300}, {4, 400}};

  SECTION("Union tags each key with its origin") {
    std::vector<std::pair<int, int>> merged;
    std::vector<union_origin> origins;
    auto sequence = left.union_with(right);
    for (const auto& item : sequence) {
      origins.push_back(item.origin());
      merged.push_back(
          item.map_both([](int a, int b) { return a + b; }));
    }
    REQUIRE(merged == std::vector<std::pair<int, int>>{
                          {1, 10}, {2, 220}, {3, 300}, {4, 440}});
    REQUIRE(origins ==
            std::vector<union_origin>{union_origin::left, union_origin::both,
                                      union_origin::right, union_origin::both});
  }

  SECTION("Intersection pairs both values") {
    std::vector<int> sums;
    auto sequence = left.intersection(right);
    for (const auto& item : sequence) {
      sums.push_back(item.left() + item.right());
    }
    REQUIRE(sums == std::vector<int>{220, 440});
  }

  SECTION("Difference keeps left-only keys") {
    std::vector<int> keys;
    auto sequence = left.difference(right);
    for (const auto& item : sequence) {
      keys.push_back(item.key());
      REQUIRE(item.value() == 10);
    }
    REQUIRE(keys == std::vector<int>{1});
  }

  SECTION("Sequences can stop early") {
    auto sequence = left.union_with(right);
    auto first = sequence.next();
    REQUIRE(first.has_value());
    REQUIRE(first->key() == 1);
    REQUIRE(first->right() == nullptr);
  }
}
