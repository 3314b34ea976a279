#pragma once

#include <boxcollide/box.hpp>
#include <boxcollide/collision.hpp>
#include <boxcollide/partitioner.hpp>
#include <boxcollide/result.hpp>
#include <cstdint>
#include <vector>

namespace boxcollide {

enum class CacheState { Invalid, Valid };

/**
 * @brief Box collection with a cache of stationary-stationary collisions.
 *
 * Collisions between two stationary boxes cannot change until a stationary box
 * is added, removed or moved. The manager records them during a full scan and
 * serves them from the cache on later queries, only computing pairs that
 * involve at least one non-stationary box.
 *
 * Cache state machine
 * - Invalid: the next query runs a full partitioned scan, rebuilding the
 *   cache from every reported pair whose boxes are both stationary. The cache
 *   is committed and the state becomes Valid only if the scan ran to
 *   completion and nothing invalidated it meanwhile.
 * - Valid: the next query reports the cached pairs followed by the pairs found
 *   by `check_partition_optimized`.
 * - Adding, removing or moving a stationary box forces Invalid. Non-stationary
 *   boxes never touch the cache.
 *
 * When no stationary box is registered the cache is bypassed and queries are a
 * plain `check_partitioned`.
 *
 * The manager does not own boxes. Registered boxes point back to it, so the
 * manager is neither copyable nor movable, and destroying it detaches every
 * box. Boxes must not be added, removed or destroyed from inside a query
 * visitor.
 */
class BoxManager {
 private:
  // Dense array of registered boxes. Each box stores its slot for O(1)
  // swap-and-pop removal.
  std::vector<Box*> boxes_;
  int stationary_count_ = 0;

  CacheState cache_state_ = CacheState::Invalid;
  CollisionCache stationary_cache_;
  // Bumped on every invalidation so a rebuild can tell whether it went stale.
  uint64_t invalidation_epoch_ = 0;
  bool is_querying_ = false;

  PartitionConfig config_;

 public:
  BoxManager() = default;
  ~BoxManager();

  BoxManager(const BoxManager&) = delete;
  BoxManager(BoxManager&&) = delete;
  BoxManager& operator=(const BoxManager&) = delete;
  BoxManager& operator=(BoxManager&&) = delete;

  [[nodiscard]] Result set_config(PartitionConfig config);
  const PartitionConfig& get_config() const { return config_; }

  /**
   * @brief Register a box.
   *
   * @return AlreadyRegistered if the box belongs to any manager already,
   * InvalidHandle for nullptr, QueryInProgress when called from a query
   * visitor.
   */
  [[nodiscard]] Result add(Box* box);

  /**
   * @brief Unregister a box and clear its manager pointer.
   *
   * @return NotFound if the box is not registered with this manager,
   * InvalidHandle for nullptr, QueryInProgress when called from a query
   * visitor. Nothing changes on failure.
   */
  [[nodiscard]] Result remove(Box* box);

  /**
   * @brief Detach all boxes and reset the cache.
   *
   * @return QueryInProgress when called from a query visitor, nothing changes
   * in that case.
   */
  [[nodiscard]] Result clear();

  void invalidate_stationary_cache();

  /**
   * @brief Report every colliding pair among registered boxes.
   *
   * A pair may be reported more than once. Returns false if the visitor
   * stopped the query early or if called from inside another query.
   */
  bool test_collision(const CollisionVisitor& visitor);
  void test_collision(CollisionCache& cache);

  const std::vector<Box*>& get_boxes() const { return boxes_; }
  int box_num() const { return static_cast<int>(boxes_.size()); }
  int stationary_count() const { return stationary_count_; }
  CacheState cache_state() const { return cache_state_; }
  bool is_stationary_cache_valid() const {
    return cache_state_ == CacheState::Valid;
  }
  const CollisionCache& get_stationary_cache() const {
    return stationary_cache_;
  }

 private:
  friend class Box;

  // Unconditional removal used by Box destructor.
  void unlink(Box* box);

  bool rebuild_and_test(const CollisionVisitor& visitor);
};

/**
 * Partitioned scan that skips stationary-stationary pairs, assuming they are
 * served from a cache.
 *
 * Leaf size is scaled up so each leaf holds about `min_moving_per_leaf`
 * non-stationary boxes. Inside a leaf, stationary boxes are sorted behind
 * non-stationary ones and the outer loop of the pair scan stops at the first
 * stationary box, since every remaining pair is stationary-stationary.
 *
 * @param stationary_count Number of stationary boxes in `boxes`, must be less
 * than the box count.
 */
bool check_partition_optimized(const std::vector<Box*>& boxes,
                               int stationary_count,
                               const PartitionConfig& config,
                               const CollisionVisitor& visitor);

}  // namespace boxcollide
