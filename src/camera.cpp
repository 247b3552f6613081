#include <vclimb/camera.hpp>
#include <algorithm>

namespace vclimb {

void Camera::reset(double top) {
  top_ = top;
  auto_scroll_ = false;
}

void Camera::update(double dt_sec, double player_y) {
  double target = player_y - view_height_ * kFollowFraction;
  if (auto_scroll_ && dt_sec > 0.0 && auto_scroll_speed_ > 0.0) {
    target = std::min(target, top_ - auto_scroll_speed_ * dt_sec);
  }
  top_ = std::min(top_, target);
}

} // namespace vclimb
