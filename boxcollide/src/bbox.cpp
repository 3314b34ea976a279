#include <Eigen/Core>
#include <boxcollide/bbox.hpp>
#include <cassert>

namespace boxcollide {

Bbox Bbox::merge(const Bbox& a, const Bbox& b) {
  return {a.min.cwiseMin(b.min), a.max.cwiseMax(b.max)};
}

Bbox Bbox::pad(const Bbox& bbox, float padding) {
  assert((padding > 0));
  return {(bbox.min.array() - padding).matrix(),
          (bbox.max.array() + padding).matrix()};
}

bool Bbox::is_colliding(const Bbox& a, const Bbox& b) {
  // Corner containment misses two thin boxes crossing each other, compare
  // center distance against half extents instead.
  Eigen::Vector2f center_delta = (a.center() - b.center()).cwiseAbs();
  Eigen::Vector2f half_sum = a.half_extent() + b.half_extent();
  return (center_delta.array() <= half_sum.array()).all();
}

Eigen::Vector2f Bbox::center() const { return (min + max) / 2; }

Eigen::Vector2f Bbox::half_extent() const { return (max - min) / 2; }

void Bbox::merge_inplace(const Bbox& other) {
  min = min.cwiseMin(other.min);
  max = max.cwiseMax(other.max);
}

void Bbox::pad_inplace(float padding) {
  assert((padding > 0));

  min = min.array() - padding;
  max = max.array() + padding;
}

}  // namespace boxcollide
