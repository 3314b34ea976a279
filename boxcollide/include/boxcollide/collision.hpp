#pragma once

#include <boxcollide/bbox.hpp>
#include <boxcollide/box.hpp>
#include <functional>
#include <utility>
#include <vector>

namespace boxcollide {

/**
 * Base all-pairs overlap checks.
 *
 * Every producer in the library reports collision pairs through a
 * `CollisionVisitor` as soon as they are found. A visitor returning false
 * stops the traversal at once and the producer returns false to signal it
 * did not run to completion. Nothing past the rejected pair is computed.
 *
 * Pairs are identity based and unordered: (a, b) and (b, a) describe the same
 * collision.
 */

using CollisionPair = std::pair<Box*, Box*>;

// vector of colliding pairs
using CollisionCache = std::vector<CollisionPair>;

// return false to stop the traversal
using CollisionVisitor = std::function<bool(Box&, Box&)>;

/// Visitor that appends every pair to `cache` and never stops.
CollisionVisitor make_cache_visitor(CollisionCache& cache);

/**
 * Two distinct boxes overlap iff their center distance on both axes is no
 * larger than the sum of their half extents. Touching counts as overlap.
 */
inline bool is_overlapping(const Box& a, const Box& b) {
  return &a != &b && Bbox::is_colliding(a.bbox(), b.bbox());
}

/**
 * Test every ordered pair. Each collision is reported twice, once per
 * ordering. Quadratic with no pruning, meant as ground truth for testing.
 */
bool check_exhaustive(const std::vector<Box*>& boxes,
                      const CollisionVisitor& visitor);
void check_exhaustive(const std::vector<Box*>& boxes, CollisionCache& cache);

/**
 * Test each index i only against indices j > i, reporting each collision
 * exactly once.
 */
bool check_deduplicated(const std::vector<Box*>& boxes,
                        const CollisionVisitor& visitor);
void check_deduplicated(const std::vector<Box*>& boxes, CollisionCache& cache);

/// Same as above on a subset given as proxies (indices into `boxes`).
bool check_deduplicated(const std::vector<Box*>& boxes, const int* proxies,
                        int proxy_num, const CollisionVisitor& visitor);

}  // namespace boxcollide
