#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <lyra/lyra.hpp>
#include <map>
#include <random>
#include <set>
#include <sorted_containers/sorted_map.hpp>
#include <sorted_containers/sorted_set.hpp>
#include <string>
#include <utility>

using namespace kressler::sorted_containers;

namespace {

template <SearchMode Mode>
void run_iteration(uint64_t seed, size_t operations, int key_range) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> key_dist(0, key_range);
  std::uniform_int_distribution<int> value_dist(0, 1000);
  std::uniform_int_distribution<int> op_dist(0, 99);

  sorted_map<int, int, std::less<int>, Mode> map;
  std::map<int, int> ordered_map;
  sorted_set<int, std::less<int>, Mode> set;
  std::set<int> ordered_set;

  auto fail = [&](const char* what) {
    std::cout << "Mismatch (" << what << "), seed " << seed << std::endl;
    exit(1);
  };

  auto validate = [&]() -> void {
    if (map.size() != ordered_map.size()) {
      fail("map size");
    }
    auto it = ordered_map.begin();
    for (auto [key, value] : std::as_const(map)) {
      if (key != it->first || value != it->second) {
        std::cout << "Mismatch at key " << it->first << " != " << key
                  << std::endl;
        fail("map contents");
      }
      ++it;
    }

    if (set.size() != ordered_set.size()) {
      fail("set size");
    }
    auto set_it = ordered_set.begin();
    for (int member : set) {
      if (member != *set_it) {
        fail("set contents");
      }
      ++set_it;
    }
  };

  for (size_t op = 0; op < operations; ++op) {
    const int key = key_dist(rng);
    const int value = value_dist(rng);
    const int choice = op_dist(rng);

    if (choice < 30) {
      auto previous = map.insert(key, value);
      auto [pos, inserted] = ordered_map.insert_or_assign(key, value);
      if (previous.has_value() == inserted) {
        fail("insert");
      }
      if (set.insert(key) != ordered_set.insert(key).second) {
        fail("set insert");
      }
    } else if (choice < 50) {
      auto removed = map.remove(key);
      auto pos = ordered_map.find(key);
      if (removed.has_value() != (pos != ordered_map.end())) {
        fail("remove");
      }
      if (removed && removed->value != pos->second) {
        fail("removed value");
      }
      if (removed) {
        ordered_map.erase(pos);
      }
      if (set.remove(key).has_value() != (ordered_set.erase(key) == 1)) {
        fail("set remove");
      }
    } else if (choice < 75) {
      map.entry(key).and_modify([value](int& v) { v += value; }).or_insert(
          value);
      auto [pos, inserted] = ordered_map.try_emplace(key, value);
      if (!inserted) {
        pos->second += value;
      }
    } else if (choice < 85) {
      const int* found = map.get(key);
      auto pos = ordered_map.find(key);
      if ((found != nullptr) != (pos != ordered_map.end()) ||
          (found != nullptr && *found != pos->second)) {
        fail("get");
      }
      if (set.contains(key) != ordered_set.contains(key)) {
        fail("set contains");
      }
    } else if (choice < 95) {
      // Merge in a small random batch, summing shared keys and dropping
      // shared keys that are multiples of seven
      sorted_map<int, int, std::less<int>, Mode> batch;
      for (int i = 0; i < 8; ++i) {
        batch.insert(key_dist(rng), value_dist(rng));
      }
      for (auto [batch_key, batch_value] : std::as_const(batch)) {
        auto pos = ordered_map.find(batch_key);
        if (pos == ordered_map.end()) {
          ordered_map.emplace(batch_key, batch_value);
        } else if (batch_key % 7 == 0) {
          ordered_map.erase(pos);
        } else {
          pos->second += batch_value;
        }
      }
      map.merge_with(std::move(batch),
                     [](const int& shared, int& mine, int&& theirs) {
                       if (shared % 7 == 0) {
                         return merge_action::drop;
                       }
                       mine += theirs;
                       return merge_action::keep;
                     });
    } else {
      // Drain a prefix of the set
      const size_t count = static_cast<size_t>(key) % (set.size() + 1);
      {
        auto drain = set.drain();
        for (size_t i = 0; i < count; ++i) {
          auto member = drain.next();
          if (!member || *member != *ordered_set.begin()) {
            fail("drain");
          }
          ordered_set.erase(ordered_set.begin());
        }
      }
    }
  }
  validate();
}

}  // namespace

int main(int argc, char** argv) {
  bool show_help = false;
  uint64_t seed =
      std::chrono::system_clock::now().time_since_epoch().count();
  size_t target_iterations = 100;
  size_t operations = 10000;
  int key_range = 500;
  std::string mode = "hybrid";

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(target_iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(operations, "operations")["-o"]["--operations"](
          "Random operations per iteration") |
      lyra::opt(key_range, "key_range")["-k"]["--key-range"](
          "Keys are drawn from [0, key_range]") |
      lyra::opt(mode, "mode")["-m"]["--mode"]("Search mode")
          .choices("binary", "linear", "hybrid");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    exit(1);
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  for (size_t iter = 0; iter < target_iterations; ++iter) {
    std::cout << "Iteration " << iter << " using " << mode << " search, seed "
              << iter + seed << std::endl;
    if (mode == "binary") {
      run_iteration<SearchMode::Binary>(iter + seed, operations, key_range);
    } else if (mode == "linear") {
      run_iteration<SearchMode::Linear>(iter + seed, operations, key_range);
    } else {
      run_iteration<SearchMode::Hybrid>(iter + seed, operations, key_range);
    }
  }
  return 0;
}
