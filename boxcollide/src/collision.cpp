#include <boxcollide/collision.hpp>
#include <cassert>
#include <vector>

namespace boxcollide {

CollisionVisitor make_cache_visitor(CollisionCache& cache) {
  return [&cache](Box& a, Box& b) -> bool {
    cache.emplace_back(&a, &b);
    return true;
  };
}

bool check_exhaustive(const std::vector<Box*>& boxes,
                      const CollisionVisitor& visitor) {
  for (Box* a : boxes) {
    for (Box* b : boxes) {
      if (is_overlapping(*a, *b) && !visitor(*a, *b)) {
        return false;
      }
    }
  }

  return true;
}

void check_exhaustive(const std::vector<Box*>& boxes, CollisionCache& cache) {
  [[maybe_unused]] bool is_complete =
      check_exhaustive(boxes, make_cache_visitor(cache));
  assert(is_complete);
}

bool check_deduplicated(const std::vector<Box*>& boxes,
                        const CollisionVisitor& visitor) {
  int box_num = static_cast<int>(boxes.size());
  for (int i = 0; i < box_num; ++i) {
    Box& a = *boxes[i];
    for (int j = i + 1; j < box_num; ++j) {
      Box& b = *boxes[j];
      if (is_overlapping(a, b) && !visitor(a, b)) {
        return false;
      }
    }
  }

  return true;
}

void check_deduplicated(const std::vector<Box*>& boxes, CollisionCache& cache) {
  [[maybe_unused]] bool is_complete =
      check_deduplicated(boxes, make_cache_visitor(cache));
  assert(is_complete);
}

bool check_deduplicated(const std::vector<Box*>& boxes, const int* proxies,
                        int proxy_num, const CollisionVisitor& visitor) {
  assert((proxy_num >= 0));

  for (int i = 0; i < proxy_num; ++i) {
    Box& a = *boxes[proxies[i]];
    for (int j = i + 1; j < proxy_num; ++j) {
      Box& b = *boxes[proxies[j]];
      if (is_overlapping(a, b) && !visitor(a, b)) {
        return false;
      }
    }
  }

  return true;
}

}  // namespace boxcollide
