#pragma once

#include <Eigen/Core>
#include <boxcollide/bbox.hpp>
#include <boxcollide/result.hpp>
#include <memory>
#include <string>

namespace boxcollide {

class BoxManager;

/**
 * @brief Axis-aligned 2D rectangle with cached derived geometry.
 *
 * A Box is an entity: two boxes with identical geometry are still different
 * boxes, so Box is neither copyable nor movable and is always referred to by
 * address. Position is the bottom-left corner. Top-right corner, center and
 * half extents are recomputed on every move.
 *
 * A Box may be registered with at most one BoxManager. The box keeps a
 * non-owning pointer back to it so a move of a stationary box can invalidate
 * the manager's stationary cache. Destroying a registered box removes it from
 * its manager.
 */
class Box {
  friend class BoxManager;

 private:
  Bbox bbox_;
  Eigen::Vector2f size_;
  Eigen::Vector2f half_size_;
  Eigen::Vector2f center_;
  bool is_stationary_ = false;
  void* user_data_ = nullptr;

  // Owning manager and our slot in its dense box array. Only BoxManager
  // touches these.
  BoxManager* manager_ = nullptr;
  int manager_slot_ = -1;

  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  /**
   * @brief Create a box from its bottom-left corner and size.
   *
   * @return The new box, or nullptr if width/height is not positive or any
   * value, including the derived corner and center, is not finite.
   */
  static std::unique_ptr<Box> try_make(float x, float y, float width,
                                       float height, bool is_stationary = false,
                                       void* user_data = nullptr);

  /// Create a box covering `bbox`. Same failure conditions as above.
  static std::unique_ptr<Box> try_make(const Bbox& bbox,
                                       bool is_stationary = false,
                                       void* user_data = nullptr);

  // Public for std::make_unique, only reachable through try_make.
  Box(PrivateTag, const Eigen::Vector2f& position, const Eigen::Vector2f& size,
      bool is_stationary, void* user_data);
  ~Box();

  Box(const Box&) = delete;
  Box(Box&&) = delete;
  Box& operator=(const Box&) = delete;
  Box& operator=(Box&&) = delete;

  /**
   * @brief Move the bottom-left corner to (x, y).
   *
   * Moving a stationary box that is registered invalidates the manager's
   * stationary cache.
   *
   * @return InvalidGeometry if a coordinate or the resulting corner is not
   * finite. The box is left untouched in that case.
   */
  [[nodiscard]] Result move(float x, float y);

  float x() const { return bbox_.min(0); }
  float y() const { return bbox_.min(1); }
  float x2() const { return bbox_.max(0); }
  float y2() const { return bbox_.max(1); }
  float width() const { return size_(0); }
  float height() const { return size_(1); }
  float half_width() const { return half_size_(0); }
  float half_height() const { return half_size_(1); }
  float cx() const { return center_(0); }
  float cy() const { return center_(1); }

  const Bbox& bbox() const { return bbox_; }
  const Eigen::Vector2f& size() const { return size_; }
  const Eigen::Vector2f& half_size() const { return half_size_; }
  const Eigen::Vector2f& center() const { return center_; }

  bool is_stationary() const { return is_stationary_; }

  void* get_user_data() const { return user_data_; }
  void set_user_data(void* user_data) { user_data_ = user_data; }

  /// Owning manager or nullptr.
  BoxManager* get_manager() const { return manager_; }

  std::string to_string() const;

 private:
  void update_derived();
};

}  // namespace boxcollide
