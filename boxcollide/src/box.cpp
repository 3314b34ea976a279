#include <Eigen/Core>
#include <boxcollide/box.hpp>
#include <boxcollide/box_manager.hpp>
#include <cmath>
#include <memory>
#include <string>

#include "logger.hpp"

namespace boxcollide {

namespace {

// Top-right corner and center must stay representable too.
bool is_finite_extent(const Eigen::Vector2f& position,
                      const Eigen::Vector2f& size) {
  return (position + size).allFinite() && (position + size / 2).allFinite();
}

}  // namespace

std::unique_ptr<Box> Box::try_make(float x, float y, float width, float height,
                                   bool is_stationary, void* user_data) {
  if (!std::isfinite(x) || !std::isfinite(y)) {
    spdlog::error("Fail to make box. Reason: non-finite position ({}, {}).", x,
                  y);
    return nullptr;
  }
  // negated comparison also rejects NaN
  if (!(width > 0.0f) || !(height > 0.0f) || !std::isfinite(width) ||
      !std::isfinite(height)) {
    spdlog::error("Fail to make box. Reason: invalid size {} x {}.", width,
                  height);
    return nullptr;
  }

  Eigen::Vector2f position{x, y};
  Eigen::Vector2f size{width, height};
  if (!is_finite_extent(position, size)) {
    spdlog::error(
        "Fail to make box. Reason: corner of ({}, {}) + {} x {} overflows.", x,
        y, width, height);
    return nullptr;
  }

  return std::make_unique<Box>(PrivateTag{}, position, size, is_stationary,
                               user_data);
}

std::unique_ptr<Box> Box::try_make(const Bbox& bbox, bool is_stationary,
                                   void* user_data) {
  Eigen::Vector2f size = bbox.max - bbox.min;
  return try_make(bbox.min(0), bbox.min(1), size(0), size(1), is_stationary,
                  user_data);
}

Box::Box(PrivateTag, const Eigen::Vector2f& position,
         const Eigen::Vector2f& size, bool is_stationary, void* user_data)
    : size_(size), is_stationary_(is_stationary), user_data_(user_data) {
  bbox_.min = position;
  half_size_ = size_ / 2;
  update_derived();
}

Box::~Box() {
  if (manager_) {
    manager_->unlink(this);
  }
}

Result Box::move(float x, float y) {
  if (!std::isfinite(x) || !std::isfinite(y)) {
    return Result::error(ErrorCode::InvalidGeometry,
                         fmt::format("non-finite position ({}, {})", x, y));
  }
  Eigen::Vector2f position{x, y};
  if (!is_finite_extent(position, size_)) {
    return Result::error(
        ErrorCode::InvalidGeometry,
        fmt::format("corner of ({}, {}) overflows for size {} x {}", x, y,
                    width(), height()));
  }

  bbox_.min = position;
  update_derived();

  if (manager_ && is_stationary_) {
    manager_->invalidate_stationary_cache();
  }

  return Result::ok();
}

std::string Box::to_string() const {
  return fmt::format("Box(x={}, y={}, width={}, height={}, stationary={})",
                     x(), y(), width(), height(), is_stationary_);
}

void Box::update_derived() {
  bbox_.max = bbox_.min + size_;
  center_ = bbox_.min + half_size_;
}

}  // namespace boxcollide
