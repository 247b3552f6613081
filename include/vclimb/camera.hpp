#pragma once
#include <vclimb/config.hpp>

namespace vclimb {

// Vertical-only camera. Follows new heights, auto-scrolls once enabled,
// never descends.
class Camera {
public:
  Camera(const WorldConfig& world, double auto_scroll_speed)
    : view_height_(world.view_height), auto_scroll_speed_(auto_scroll_speed) {}

  void reset(double top);
  void update(double dt_sec, double player_y);

  void enable_auto_scroll() { auto_scroll_ = true; }
  bool auto_scrolling() const { return auto_scroll_; }

  double top() const { return top_; }
  double bottom() const { return top_ + view_height_; }
  double view_height() const { return view_height_; }

  // Player's top edge sits this fraction down the view when following.
  static constexpr double kFollowFraction = 0.3;

private:
  double view_height_;
  double auto_scroll_speed_;
  double top_{0.0};
  bool auto_scroll_{false};
};

} // namespace vclimb
