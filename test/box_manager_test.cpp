#include <boxcollide/box.hpp>
#include <boxcollide/box_manager.hpp>
#include <boxcollide/collision.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <vector>

#include "collision_test_helper.hpp"

namespace boxcollide {

namespace {

PairSet expected_pairs(const BoxManager& manager) {
  CollisionCache cache;
  check_deduplicated(manager.get_boxes(), cache);
  return to_unordered_set(cache);
}

PairSet query_pairs(BoxManager& manager) {
  CollisionCache cache;
  REQUIRE(manager.test_collision(make_cache_visitor(cache)));
  return to_unordered_set(cache);
}

}  // namespace

TEST_CASE("manager registration", "[box_manager]") {
  BoxManager manager;
  auto moving = Box::try_make(0.0f, 0.0f, 1.0f, 1.0f);
  auto stationary = Box::try_make(0.0f, 0.0f, 1.0f, 1.0f, true);
  REQUIRE((moving && stationary));

  CHECK(manager.box_num() == 0);
  CHECK(manager.cache_state() == CacheState::Invalid);

  SECTION("add and remove lifecycle") {
    REQUIRE(manager.add(moving.get()));
    REQUIRE(manager.add(stationary.get()));
    CHECK(manager.box_num() == 2);
    CHECK(manager.stationary_count() == 1);
    CHECK(moving->get_manager() == &manager);
    CHECK(stationary->get_manager() == &manager);

    REQUIRE(manager.remove(moving.get()));
    CHECK(manager.box_num() == 1);
    CHECK(manager.stationary_count() == 1);
    CHECK(moving->get_manager() == nullptr);

    REQUIRE(manager.remove(stationary.get()));
    CHECK(manager.box_num() == 0);
    CHECK(manager.stationary_count() == 0);
    CHECK(stationary->get_manager() == nullptr);
  }

  SECTION("duplicate registration is rejected") {
    REQUIRE(manager.add(moving.get()));
    Result r = manager.add(moving.get());
    CHECK_FALSE(r);
    CHECK(r.code == ErrorCode::AlreadyRegistered);
    CHECK(manager.box_num() == 1);
  }

  SECTION("a box belongs to one manager at a time") {
    BoxManager other;
    REQUIRE(manager.add(stationary.get()));
    Result r = other.add(stationary.get());
    CHECK_FALSE(r);
    CHECK(r.code == ErrorCode::AlreadyRegistered);
    CHECK(other.box_num() == 0);
    CHECK(other.stationary_count() == 0);
    CHECK(stationary->get_manager() == &manager);

    REQUIRE(manager.remove(stationary.get()));
    REQUIRE(other.add(stationary.get()));
    CHECK(stationary->get_manager() == &other);
  }

  SECTION("removing an unknown box fails without change") {
    REQUIRE(manager.add(stationary.get()));
    Result r = manager.remove(moving.get());
    CHECK_FALSE(r);
    CHECK(r.code == ErrorCode::NotFound);
    CHECK(manager.box_num() == 1);
    CHECK(manager.stationary_count() == 1);

    BoxManager other;
    r = other.remove(stationary.get());
    CHECK(r.code == ErrorCode::NotFound);
    CHECK(stationary->get_manager() == &manager);
  }

  SECTION("null box") {
    CHECK(manager.add(nullptr).code == ErrorCode::InvalidHandle);
    CHECK(manager.remove(nullptr).code == ErrorCode::InvalidHandle);
  }

  SECTION("removal keeps other boxes reachable") {
    BoxList owned = generate_random_boxes({20, 1, 0.0f, 100.0f, 0.0f, 100.0f,
                                           0.5f, 20.0f, 0.5f, 20.0f, 0.5f});
    for (const auto& b : owned) {
      REQUIRE(manager.add(b.get()));
    }
    REQUIRE(manager.remove(owned[3].get()));
    REQUIRE(manager.remove(owned[0].get()));
    REQUIRE(manager.remove(owned[19].get()));
    REQUIRE(manager.box_num() == 17);

    int stationary_num = 0;
    for (int i = 0; i < 20; ++i) {
      bool is_removed = (i == 0 || i == 3 || i == 19);
      CHECK((owned[i]->get_manager() == nullptr) == is_removed);
      if (!is_removed && owned[i]->is_stationary()) {
        ++stationary_num;
      }
    }
    CHECK(manager.stationary_count() == stationary_num);

    // every remaining box can still be removed
    for (int i = 0; i < 20; ++i) {
      if (owned[i]->get_manager()) {
        REQUIRE(manager.remove(owned[i].get()));
      }
    }
    CHECK(manager.box_num() == 0);
    CHECK(manager.stationary_count() == 0);
  }

  SECTION("clear detaches everything") {
    REQUIRE(manager.add(moving.get()));
    REQUIRE(manager.add(stationary.get()));
    REQUIRE(manager.clear());
    CHECK(manager.box_num() == 0);
    CHECK(manager.stationary_count() == 0);
    CHECK(moving->get_manager() == nullptr);
    CHECK(stationary->get_manager() == nullptr);
    CHECK(manager.cache_state() == CacheState::Invalid);
  }
}

TEST_CASE("manager cache state machine", "[box_manager]") {
  BoxManager manager;
  auto s0 = Box::try_make(0.0f, 0.0f, 10.0f, 10.0f, true);
  auto s1 = Box::try_make(5.0f, 5.0f, 10.0f, 10.0f, true);
  auto s2 = Box::try_make(50.0f, 50.0f, 1.0f, 1.0f, true);
  auto m0 = Box::try_make(8.0f, 8.0f, 1.0f, 1.0f);
  auto m1 = Box::try_make(51.0f, 51.0f, 1.0f, 1.0f);
  REQUIRE((s0 && s1 && s2 && m0 && m1));

  for (Box* b : {s0.get(), s1.get(), s2.get(), m0.get(), m1.get()}) {
    REQUIRE(manager.add(b));
  }
  REQUIRE(manager.cache_state() == CacheState::Invalid);

  // rebuild then serve from cache
  PairSet first = query_pairs(manager);
  CHECK(first == expected_pairs(manager));
  REQUIRE(manager.cache_state() == CacheState::Valid);
  REQUIRE(manager.get_stationary_cache().size() == 1);
  CHECK(count_pair(manager.get_stationary_cache(), s0.get(), s1.get()) == 1);

  PairSet second = query_pairs(manager);
  CHECK(second == first);
  CHECK(manager.is_stationary_cache_valid());

  SECTION("moving a non-stationary box keeps the cache") {
    REQUIRE(m0->move(60.0f, 60.0f));
    CHECK(manager.is_stationary_cache_valid());
    CHECK(query_pairs(manager) == expected_pairs(manager));
  }

  SECTION("adding a non-stationary box keeps the cache") {
    auto m2 = Box::try_make(50.5f, 50.5f, 1.0f, 1.0f);
    REQUIRE(manager.add(m2.get()));
    CHECK(manager.is_stationary_cache_valid());

    CollisionCache cache;
    manager.test_collision(cache);
    CHECK(to_unordered_set(cache) == expected_pairs(manager));
    CHECK(count_pair(cache, m2.get(), s2.get()) >= 1);
  }

  SECTION("moving a stationary box invalidates") {
    REQUIRE(s2->move(7.0f, 7.0f));
    CHECK(manager.cache_state() == CacheState::Invalid);

    CHECK(query_pairs(manager) == expected_pairs(manager));
    CHECK(manager.is_stationary_cache_valid());
    CHECK(query_pairs(manager) == expected_pairs(manager));
  }

  SECTION("adding a stationary box invalidates") {
    auto s3 = Box::try_make(0.0f, 0.0f, 1.0f, 1.0f, true);
    REQUIRE(manager.add(s3.get()));
    CHECK(manager.cache_state() == CacheState::Invalid);
    CHECK(manager.stationary_count() == 4);

    CHECK(query_pairs(manager) == expected_pairs(manager));
    CHECK(query_pairs(manager) == expected_pairs(manager));
  }

  SECTION("removing a stationary box invalidates") {
    REQUIRE(manager.remove(s1.get()));
    CHECK(manager.cache_state() == CacheState::Invalid);
    CHECK(manager.stationary_count() == 2);

    CHECK(query_pairs(manager) == expected_pairs(manager));
    CHECK(manager.get_stationary_cache().empty());
  }

  SECTION("removing a non-stationary box keeps the cache") {
    REQUIRE(manager.remove(m0.get()));
    CHECK(manager.is_stationary_cache_valid());
    CHECK(query_pairs(manager) == expected_pairs(manager));
  }

  SECTION("explicit invalidation") {
    manager.invalidate_stationary_cache();
    CHECK(manager.cache_state() == CacheState::Invalid);
    CHECK(query_pairs(manager) == expected_pairs(manager));
    CHECK(manager.is_stationary_cache_valid());
  }

  SECTION("changing the config keeps results") {
    PartitionConfig config;
    config.partition_size = 1;
    config.max_iterations = 4;
    config.min_moving_per_leaf = 1;
    REQUIRE(manager.set_config(config));
    CHECK(manager.get_config().partition_size == 1);
    CHECK(query_pairs(manager) == expected_pairs(manager));
  }

  SECTION("invalid config is rejected") {
    PartitionConfig config;
    config.partition_size = 0;
    Result r = manager.set_config(config);
    CHECK(r.code == ErrorCode::InvalidConfig);
    CHECK(manager.get_config().partition_size == 10);
  }
}

TEST_CASE("manager without stationary boxes bypasses the cache",
          "[box_manager]") {
  BoxManager manager;
  BoxList owned = generate_random_boxes({60, 2});
  for (const auto& b : owned) {
    REQUIRE(manager.add(b.get()));
  }
  REQUIRE(manager.stationary_count() == 0);

  CHECK(query_pairs(manager) == expected_pairs(manager));
  CHECK(manager.cache_state() == CacheState::Invalid);
  CHECK(manager.get_stationary_cache().empty());
}

TEST_CASE("manager with only stationary boxes serves the cache",
          "[box_manager]") {
  BoxManager manager;
  BoxList owned = generate_random_boxes(
      {60, 4, 0.0f, 100.0f, 0.0f, 100.0f, 0.5f, 20.0f, 0.5f, 20.0f, 1.0f});
  for (const auto& b : owned) {
    REQUIRE(b->is_stationary());
    REQUIRE(manager.add(b.get()));
  }

  CollisionCache rebuild;
  manager.test_collision(rebuild);
  REQUIRE(manager.is_stationary_cache_valid());
  CHECK(to_unordered_set(rebuild) == expected_pairs(manager));

  // nothing beyond the cache is reported
  CollisionCache cached;
  manager.test_collision(cached);
  CHECK(cached == manager.get_stationary_cache());
  CHECK(cached == rebuild);
}

TEST_CASE("manager query can stop early", "[box_manager]") {
  BoxManager manager;
  BoxList owned;
  for (int i = 0; i < 6; ++i) {
    owned.push_back(Box::try_make(0.0f, 0.0f, 1.0f, 1.0f, i % 2 == 0));
  }
  for (const auto& b : owned) {
    REQUIRE(manager.add(b.get()));
  }

  int visited = 0;
  auto stop_after_two = [&visited](Box&, Box&) -> bool {
    ++visited;
    return visited < 2;
  };

  SECTION("a stopped rebuild leaves the cache invalid") {
    CHECK_FALSE(manager.test_collision(stop_after_two));
    CHECK(visited == 2);
    CHECK(manager.cache_state() == CacheState::Invalid);
    CHECK(manager.get_stationary_cache().empty());

    CHECK(query_pairs(manager) == expected_pairs(manager));
    CHECK(manager.is_stationary_cache_valid());
  }

  SECTION("a stopped cached query keeps the cache") {
    CHECK(query_pairs(manager) == expected_pairs(manager));
    REQUIRE(manager.is_stationary_cache_valid());

    CHECK_FALSE(manager.test_collision(stop_after_two));
    CHECK(visited == 2);
    CHECK(manager.is_stationary_cache_valid());
  }
}

TEST_CASE("manager guards against mutation during a query",
          "[box_manager]") {
  BoxManager manager;
  auto s0 = Box::try_make(0.0f, 0.0f, 10.0f, 10.0f, true);
  auto s1 = Box::try_make(5.0f, 5.0f, 10.0f, 10.0f, true);
  auto m0 = Box::try_make(1.0f, 1.0f, 1.0f, 1.0f);
  auto extra = Box::try_make(1.0f, 1.0f, 1.0f, 1.0f);
  REQUIRE(manager.add(s0.get()));
  REQUIRE(manager.add(s1.get()));
  REQUIRE(manager.add(m0.get()));

  SECTION("add and remove are rejected") {
    bool is_checked = false;
    auto visitor = [&](Box&, Box&) -> bool {
      if (!is_checked) {
        is_checked = true;
        CHECK(manager.add(extra.get()).code == ErrorCode::QueryInProgress);
        CHECK(manager.remove(m0.get()).code == ErrorCode::QueryInProgress);
      }
      return true;
    };
    CHECK(manager.test_collision(visitor));
    CHECK(is_checked);
    CHECK(manager.box_num() == 3);
    CHECK(extra->get_manager() == nullptr);

    // the guard is released after the query
    CHECK(manager.add(extra.get()));
  }

  SECTION("clear is rejected") {
    BoxList owned;
    for (int i = 0; i < 30; ++i) {
      owned.push_back(Box::try_make(0.5f * i, 0.0f, 4.0f, 4.0f, i % 3 == 0));
      REQUIRE(manager.add(owned.back().get()));
    }
    PairSet expected = expected_pairs(manager);

    bool is_checked = false;
    CollisionCache cache;
    auto visitor = [&](Box& a, Box& b) -> bool {
      if (!is_checked) {
        is_checked = true;
        CHECK(manager.clear().code == ErrorCode::QueryInProgress);
      }
      cache.emplace_back(&a, &b);
      return true;
    };
    CHECK(manager.test_collision(visitor));
    CHECK(is_checked);
    CHECK(manager.box_num() == 33);
    CHECK(to_unordered_set(cache) == expected);
    for (Box* b : manager.get_boxes()) {
      CHECK(b->get_manager() == &manager);
    }

    REQUIRE(manager.clear());
    CHECK(manager.box_num() == 0);
  }

  SECTION("nested query is rejected") {
    bool is_nested_rejected = false;
    auto visitor = [&](Box&, Box&) -> bool {
      is_nested_rejected =
          !manager.test_collision([](Box&, Box&) -> bool { return true; });
      return true;
    };
    CHECK(manager.test_collision(visitor));
    CHECK(is_nested_rejected);
  }

  SECTION("moving a stationary box during a rebuild discards the rebuild") {
    bool is_moved = false;
    auto visitor = [&](Box&, Box&) -> bool {
      if (!is_moved) {
        is_moved = true;
        CHECK(s1->move(100.0f, 100.0f));
      }
      return true;
    };
    CHECK(manager.test_collision(visitor));
    CHECK(is_moved);
    CHECK(manager.cache_state() == CacheState::Invalid);

    CHECK(query_pairs(manager) == expected_pairs(manager));
    CHECK(manager.is_stationary_cache_valid());
    CHECK(query_pairs(manager) == expected_pairs(manager));
  }
}

TEST_CASE("partition optimized skips stationary pairs", "[box_manager]") {
  for (uint32_t seed = 0; seed < 200; ++seed) {
    RandomBoxConfig config;
    config.n = 1 + static_cast<int>(seed % 150);
    config.seed = seed;
    config.stationary_probability = 0.1f * static_cast<float>(seed % 10);
    BoxList owned = generate_random_boxes(config);
    std::vector<Box*> boxes = to_pointers(owned);

    int stationary_count = 0;
    for (Box* b : boxes) {
      stationary_count += b->is_stationary() ? 1 : 0;
    }
    if (stationary_count == config.n) {
      continue;
    }

    // reference: every pair with at least one non-stationary box
    CollisionCache all;
    check_deduplicated(boxes, all);
    PairSet expected;
    for (const CollisionPair& pair : to_unordered_set(all)) {
      if (!pair.first->is_stationary() || !pair.second->is_stationary()) {
        expected.insert(pair);
      }
    }

    CollisionCache optimized;
    REQUIRE(check_partition_optimized(boxes, stationary_count,
                                      PartitionConfig{},
                                      make_cache_visitor(optimized)));

    INFO("seed " << seed << ", " << stationary_count << " of " << config.n
                 << " stationary");
    CHECK(to_unordered_set(optimized) == expected);
    for (const CollisionPair& pair : optimized) {
      CHECK_FALSE((pair.first->is_stationary() &&
                   pair.second->is_stationary()));
    }
  }
}

TEST_CASE("partition optimized with a huge leaf target", "[box_manager]") {
  BoxList owned = generate_random_boxes(
      {40, 9, 0.0f, 100.0f, 0.0f, 100.0f, 0.5f, 20.0f, 0.5f, 20.0f, 0.0f});
  // half of the boxes stationary, scaled leaf size overflows int
  BoxList stationary = generate_random_boxes(
      {40, 10, 0.0f, 100.0f, 0.0f, 100.0f, 0.5f, 20.0f, 0.5f, 20.0f, 1.0f});
  std::vector<Box*> boxes = to_pointers(owned);
  for (Box* b : to_pointers(stationary)) {
    boxes.push_back(b);
  }

  PartitionConfig config;
  config.min_moving_per_leaf = 2'000'000'000;
  REQUIRE(validate_partition_config(config));

  CollisionCache all;
  check_deduplicated(boxes, all);
  PairSet expected;
  for (const CollisionPair& pair : to_unordered_set(all)) {
    if (!pair.first->is_stationary() || !pair.second->is_stationary()) {
      expected.insert(pair);
    }
  }

  CollisionCache optimized;
  REQUIRE(check_partition_optimized(boxes, 40, config,
                                    make_cache_visitor(optimized)));
  CHECK(to_unordered_set(optimized) == expected);

  BoxManager manager;
  REQUIRE(manager.set_config(config));
  for (Box* b : boxes) {
    REQUIRE(manager.add(b));
  }
  CollisionCache first;
  manager.test_collision(first);
  CollisionCache second;
  manager.test_collision(second);
  CHECK(to_unordered_set(second) == to_unordered_set(all));
}

}  // namespace boxcollide
