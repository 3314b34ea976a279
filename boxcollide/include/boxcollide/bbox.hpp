#pragma once

#include <Eigen/Core>

namespace boxcollide {

/// 2D axis-aligned bounding box. `min` is the bottom-left corner and `max` the
/// top-right corner.
struct Bbox {
  Eigen::Vector2f min;
  Eigen::Vector2f max;

  /// Smallest bbox enclosing both `a` and `b`.
  static Bbox merge(const Bbox& a, const Bbox& b);
  static Bbox pad(const Bbox& bbox, float padding);
  /// Center-distance overlap test, touching boundaries count as colliding.
  static bool is_colliding(const Bbox& a, const Bbox& b);

  Eigen::Vector2f center() const;
  Eigen::Vector2f half_extent() const;
  void merge_inplace(const Bbox& other);
  void pad_inplace(float padding);
};

}  // namespace boxcollide
