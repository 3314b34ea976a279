#include <Eigen/Core>
#include <boxcollide/partitioner.hpp>
#include <cassert>
#include <numeric>
#include <vector>

#include "logger.hpp"

namespace boxcollide {

Result validate_partition_config(const PartitionConfig& config) {
  if (config.partition_size < 1) {
    return Result::error(
        ErrorCode::InvalidConfig,
        fmt::format("partition_size {} < 1", config.partition_size));
  }
  if (config.max_iterations < 0) {
    return Result::error(
        ErrorCode::InvalidConfig,
        fmt::format("max_iterations {} < 0", config.max_iterations));
  }
  if (config.min_moving_per_leaf < 1) {
    return Result::error(
        ErrorCode::InvalidConfig,
        fmt::format("min_moving_per_leaf {} < 1", config.min_moving_per_leaf));
  }

  return Result::ok();
}

Eigen::Vector2f estimate_center(const std::vector<Box*>& boxes,
                                const int* proxies, int proxy_num) {
  assert((proxy_num > 0));

  Eigen::Vector2f center = Eigen::Vector2f::Zero();
  for (int i = 0; i < proxy_num; ++i) {
    center += boxes[proxies[i]]->center();
  }
  return center / proxy_num;
}

Eigen::Vector2f estimate_center(const std::vector<Box*>& boxes) {
  std::vector<int> proxies(boxes.size());
  std::iota(proxies.begin(), proxies.end(), 0);
  return estimate_center(boxes, proxies.data(),
                         static_cast<int>(proxies.size()));
}

QuadrantProxies partition_quadrants(const std::vector<Box*>& boxes,
                                    const int* proxies, int proxy_num) {
  Eigen::Vector2f center = estimate_center(boxes, proxies, proxy_num);

  QuadrantProxies quadrants;
  for (int i = 0; i < proxy_num; ++i) {
    int p = proxies[i];
    const Box& b = *boxes[p];

    // a box touching or crossing a split line belongs to both sides
    if (b.x() <= center(0)) {
      if (b.y() <= center(1)) {
        quadrants[BottomLeft].push_back(p);
      }
      if (b.y2() >= center(1)) {
        quadrants[UpperLeft].push_back(p);
      }
    }
    if (b.x2() >= center(0)) {
      if (b.y() <= center(1)) {
        quadrants[BottomRight].push_back(p);
      }
      if (b.y2() >= center(1)) {
        quadrants[UpperRight].push_back(p);
      }
    }
  }

  SPDLOG_DEBUG("split {} proxies at {}: bl {} ul {} br {} ur {}", proxy_num,
               center.transpose(), quadrants[BottomLeft].size(),
               quadrants[UpperLeft].size(), quadrants[BottomRight].size(),
               quadrants[UpperRight].size());

  return quadrants;
}

QuadrantProxies partition_quadrants(const std::vector<Box*>& boxes) {
  std::vector<int> proxies(boxes.size());
  std::iota(proxies.begin(), proxies.end(), 0);
  return partition_quadrants(boxes, proxies.data(),
                             static_cast<int>(proxies.size()));
}

bool partition(const std::vector<Box*>& boxes, int* proxies, int proxy_num,
               int partition_size, int max_iterations, int iteration,
               const LeafVisitor& visitor) {
  if (iteration == max_iterations) {
    return visitor(proxies, proxy_num);
  }

  QuadrantProxies quadrants = partition_quadrants(boxes, proxies, proxy_num);
  for (std::vector<int>& q : quadrants) {
    int q_num = static_cast<int>(q.size());

    // A quadrant that did not shrink is unlikely to shrink on further splits.
    if (q_num <= partition_size || q_num == proxy_num) {
      if (!visitor(q.data(), q_num)) {
        return false;
      }
      continue;
    }

    if (!partition(boxes, q.data(), q_num, partition_size, max_iterations,
                   iteration + 1, visitor)) {
      return false;
    }
  }

  return true;
}

bool partition(const std::vector<Box*>& boxes, const PartitionConfig& config,
               const LeafVisitor& visitor) {
  if (boxes.empty()) {
    return true;
  }

  std::vector<int> proxies(boxes.size());
  std::iota(proxies.begin(), proxies.end(), 0);
  return partition(boxes, proxies.data(), static_cast<int>(proxies.size()),
                   config.partition_size, config.max_iterations, 0, visitor);
}

bool check_partitioned(const std::vector<Box*>& boxes,
                       const PartitionConfig& config,
                       const CollisionVisitor& visitor) {
  auto leaf_visitor = [&boxes, &visitor](int* proxies,
                                         int proxy_num) -> bool {
    return check_deduplicated(boxes, proxies, proxy_num, visitor);
  };
  return partition(boxes, config, leaf_visitor);
}

bool check_partitioned(const std::vector<Box*>& boxes,
                       const CollisionVisitor& visitor) {
  return check_partitioned(boxes, PartitionConfig{}, visitor);
}

void check_partitioned(const std::vector<Box*>& boxes, CollisionCache& cache) {
  [[maybe_unused]] bool is_complete =
      check_partitioned(boxes, PartitionConfig{}, make_cache_visitor(cache));
  assert(is_complete);
}

}  // namespace boxcollide
