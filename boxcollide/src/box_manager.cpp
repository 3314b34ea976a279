#include <pdqsort.h>

#include <algorithm>
#include <boxcollide/box_manager.hpp>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <utility>
#include <vector>

#include "logger.hpp"

namespace boxcollide {

namespace {

// Marks the manager busy for the lifetime of a query.
class QueryScope {
 private:
  bool& is_querying_;

 public:
  explicit QueryScope(bool& is_querying) : is_querying_(is_querying) {
    is_querying_ = true;
  }
  ~QueryScope() { is_querying_ = false; }

  QueryScope(const QueryScope&) = delete;
  QueryScope& operator=(const QueryScope&) = delete;
};

}  // namespace

BoxManager::~BoxManager() {
  for (Box* box : boxes_) {
    box->manager_ = nullptr;
    box->manager_slot_ = -1;
  }
}

Result BoxManager::set_config(PartitionConfig config) {
  Result r = validate_partition_config(config);
  if (!r) {
    return r;
  }

  config_ = config;
  return Result::ok();
}

Result BoxManager::add(Box* box) {
  if (!box) {
    return Result::error(ErrorCode::InvalidHandle, "null box");
  }
  if (is_querying_) {
    return Result::error(ErrorCode::QueryInProgress);
  }
  if (box->manager_) {
    return Result::error(ErrorCode::AlreadyRegistered,
                         box->manager_ == this ? "registered with this manager"
                                               : "owned by another manager");
  }

  box->manager_ = this;
  box->manager_slot_ = static_cast<int>(boxes_.size());
  boxes_.push_back(box);

  if (box->is_stationary()) {
    ++stationary_count_;
    invalidate_stationary_cache();
  }

  SPDLOG_DEBUG("Add {} at slot {}.", *box, box->manager_slot_);
  return Result::ok();
}

Result BoxManager::remove(Box* box) {
  if (!box) {
    return Result::error(ErrorCode::InvalidHandle, "null box");
  }
  if (is_querying_) {
    return Result::error(ErrorCode::QueryInProgress);
  }
  if (box->manager_ != this) {
    return Result::error(ErrorCode::NotFound, box->to_string());
  }

  unlink(box);
  return Result::ok();
}

void BoxManager::unlink(Box* box) {
  assert((box->manager_ == this));
  assert((box->manager_slot_ >= 0 && box->manager_slot_ < box_num()));

  SPDLOG_DEBUG("Remove {} from slot {}.", *box, box->manager_slot_);

  // Swap-and-pop: move last box into the gap, keeping the array dense.
  int slot = box->manager_slot_;
  Box* last = boxes_.back();
  boxes_[slot] = last;
  last->manager_slot_ = slot;
  boxes_.pop_back();

  box->manager_ = nullptr;
  box->manager_slot_ = -1;

  if (box->is_stationary()) {
    invalidate_stationary_cache();
    // cached pairs may reference the removed box
    stationary_cache_.clear();
    --stationary_count_;
  }
}

Result BoxManager::clear() {
  if (is_querying_) {
    return Result::error(ErrorCode::QueryInProgress);
  }

  for (Box* box : boxes_) {
    box->manager_ = nullptr;
    box->manager_slot_ = -1;
  }
  boxes_.clear();
  stationary_count_ = 0;
  stationary_cache_.clear();
  invalidate_stationary_cache();

  return Result::ok();
}

void BoxManager::invalidate_stationary_cache() {
  if (cache_state_ == CacheState::Valid) {
    SPDLOG_DEBUG("Invalidate stationary cache of {} pairs.",
                 stationary_cache_.size());
  }

  cache_state_ = CacheState::Invalid;
  ++invalidation_epoch_;
}

bool BoxManager::test_collision(const CollisionVisitor& visitor) {
  if (is_querying_) {
    spdlog::error("Ignore collision query. Reason: nested query.");
    return false;
  }

  QueryScope scope{is_querying_};

  // Nothing can be cached without stationary boxes.
  if (stationary_count_ == 0) {
    return check_partitioned(boxes_, config_, visitor);
  }

  if (cache_state_ == CacheState::Invalid) {
    return rebuild_and_test(visitor);
  }

  for (const CollisionPair& pair : stationary_cache_) {
    if (!visitor(*pair.first, *pair.second)) {
      return false;
    }
  }

  // All boxes stationary, every collision is already in the cache.
  if (box_num() == stationary_count_) {
    return true;
  }

  return check_partition_optimized(boxes_, stationary_count_, config_,
                                   visitor);
}

void BoxManager::test_collision(CollisionCache& cache) {
  if (!test_collision(make_cache_visitor(cache))) {
    spdlog::error("Collision query did not complete.");
  }
}

bool BoxManager::rebuild_and_test(const CollisionVisitor& visitor) {
  uint64_t epoch = invalidation_epoch_;
  stationary_cache_.clear();

  // Collect into a scratch cache so a partial scan is never observable.
  CollisionCache cache;
  auto rebuild_visitor = [&cache, &visitor](Box& a, Box& b) -> bool {
    if (a.is_stationary() && b.is_stationary()) {
      cache.emplace_back(&a, &b);
    }
    return visitor(a, b);
  };

  if (!check_partitioned(boxes_, config_, rebuild_visitor)) {
    SPDLOG_DEBUG("Abandon stationary cache rebuild. Reason: query stopped.");
    return false;
  }

  if (epoch != invalidation_epoch_) {
    SPDLOG_DEBUG(
        "Abandon stationary cache rebuild. Reason: invalidated during scan.");
    return true;
  }

  stationary_cache_ = std::move(cache);
  cache_state_ = CacheState::Valid;
  SPDLOG_DEBUG("Rebuild stationary cache with {} pairs.",
               stationary_cache_.size());

  return true;
}

bool check_partition_optimized(const std::vector<Box*>& boxes,
                               int stationary_count,
                               const PartitionConfig& config,
                               const CollisionVisitor& visitor) {
  if (boxes.empty()) {
    return true;
  }

  int box_num = static_cast<int>(boxes.size());
  assert((stationary_count >= 0 && stationary_count < box_num));

  // Stationary boxes take room in a leaf without adding work, so grow the
  // leaf until it holds about min_moving_per_leaf non-stationary boxes.
  double moving_ratio = 1.0 - static_cast<double>(stationary_count) /
                                   static_cast<double>(box_num);
  int min_moving = config.min_moving_per_leaf;
  // A leaf never holds more than every box, cap before narrowing to int.
  double scaled_size = std::min(std::ceil(min_moving / moving_ratio),
                                static_cast<double>(box_num));
  int partition_size =
      std::max(min_moving, static_cast<int>(scaled_size));

  auto is_moving_first = [&boxes](int a, int b) -> bool {
    return !boxes[a]->is_stationary() && boxes[b]->is_stationary();
  };

  auto leaf_visitor = [&boxes, &visitor, &is_moving_first](
                          int* proxies, int proxy_num) -> bool {
    pdqsort_branchless(proxies, proxies + proxy_num, is_moving_first);

    for (int i = 0; i < proxy_num; ++i) {
      Box& a = *boxes[proxies[i]];
      // only stationary-stationary pairs remain, those are cached
      if (a.is_stationary()) {
        break;
      }

      for (int j = i + 1; j < proxy_num; ++j) {
        Box& b = *boxes[proxies[j]];
        if (is_overlapping(a, b) && !visitor(a, b)) {
          return false;
        }
      }
    }

    return true;
  };

  std::vector<int> proxies(box_num);
  std::iota(proxies.begin(), proxies.end(), 0);
  return partition(boxes, proxies.data(), box_num, partition_size,
                   config.max_iterations, 0, leaf_visitor);
}

}  // namespace boxcollide
