#pragma once

#include <Eigen/Core>
#include <array>
#include <boxcollide/box.hpp>
#include <boxcollide/collision.hpp>
#include <boxcollide/result.hpp>
#include <functional>
#include <vector>

namespace boxcollide {

/**
 * Recursive quadrant partitioning.
 *
 * Overview
 * - A group of boxes is split into four quadrants around the mean of the box
 *   centers. A box joins every quadrant its extent reaches, so a box lying on
 *   a split line lands in two or four quadrants. Quadrants are therefore not
 *   disjoint and their sizes may sum to more than the group size.
 * - Quadrants larger than `partition_size` are split again until
 *   `max_iterations` levels are reached. A quadrant that did not shrink is
 *   never split again, even when it is larger than `partition_size`; this
 *   stops the recursion on heavily overlapping clusters.
 * - Groups are proxy arrays: indices into one shared box array that must not
 *   change while partitioning runs.
 *
 * Because of the duplicated membership, `check_partitioned` may report the
 * same pair once per leaf that holds both boxes. Callers that need each pair
 * exactly once must deduplicate.
 */

struct PartitionConfig {
  int partition_size = 10;  // leaf size that stops subdivision
  int max_iterations = 2;   // recursion depth floor
  // Target count of non-stationary boxes per leaf for cached manager queries.
  int min_moving_per_leaf = 10;
};

[[nodiscard]] Result validate_partition_config(const PartitionConfig& config);

enum Quadrant {
  BottomLeft = 0,
  UpperLeft = 1,
  BottomRight = 2,
  UpperRight = 3
};

using QuadrantProxies = std::array<std::vector<int>, 4>;

// Called once per leaf group. Leaf proxies may be reordered by the visitor.
// Return false to stop partitioning.
using LeafVisitor = std::function<bool(int* proxies, int proxy_num)>;

/** Mean of box centers over a non-empty proxy subset. */
Eigen::Vector2f estimate_center(const std::vector<Box*>& boxes,
                                const int* proxies, int proxy_num);
Eigen::Vector2f estimate_center(const std::vector<Box*>& boxes);

/**
 * Split a non-empty proxy subset into bottom-left, upper-left, bottom-right
 * and upper-right groups around its estimated center. Left membership is
 * `x <= cx`, right is `x2 >= cx`, bottom is `y <= cy`, upper is `y2 >= cy`.
 */
QuadrantProxies partition_quadrants(const std::vector<Box*>& boxes,
                                    const int* proxies, int proxy_num);
QuadrantProxies partition_quadrants(const std::vector<Box*>& boxes);

/**
 * Recursively subdivide `proxies` and hand every leaf group to `visitor`.
 *
 * @return false if the visitor stopped the traversal.
 */
bool partition(const std::vector<Box*>& boxes, int* proxies, int proxy_num,
               int partition_size, int max_iterations, int iteration,
               const LeafVisitor& visitor);

/// Partition the whole box array. An empty array yields no leaf.
bool partition(const std::vector<Box*>& boxes, const PartitionConfig& config,
               const LeafVisitor& visitor);

/**
 * Run `check_deduplicated` on every leaf group of the partition. The same
 * pair may be reported more than once.
 */
bool check_partitioned(const std::vector<Box*>& boxes,
                       const PartitionConfig& config,
                       const CollisionVisitor& visitor);
bool check_partitioned(const std::vector<Box*>& boxes,
                       const CollisionVisitor& visitor);
void check_partitioned(const std::vector<Box*>& boxes, CollisionCache& cache);

}  // namespace boxcollide
