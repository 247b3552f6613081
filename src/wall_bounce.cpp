#include <vclimb/wall_bounce.hpp>
#include <algorithm>

namespace vclimb {

const char* to_string(BounceQuality q) {
  switch (q) {
    case BounceQuality::Perfect: return "PERFECT";
    case BounceQuality::Good:    return "GOOD";
    case BounceQuality::Late:    return "LATE";
    case BounceQuality::Missed:  return "MISSED";
  }
  return "?";
}

bool WallBounceMachine::on_contact(const WallContactEvent& e) {
  if (state_ == WindowState::Open) return false;

  const double toward = e.side == WallSide::Left ? -e.velocity.x : e.velocity.x;
  if (toward < cfg_.min_speed_for_bounce) return false;

  state_ = WindowState::Open;
  open_ms_ = e.timestamp_ms;
  contact_ = e;
  return true;
}

BounceQuality WallBounceMachine::classify(double elapsed_ms) const {
  if (elapsed_ms <= cfg_.perfect_ms) return BounceQuality::Perfect;
  if (elapsed_ms <= cfg_.good_ms)    return BounceQuality::Good;
  return BounceQuality::Late;
}

double WallBounceMachine::multiplier_for(BounceQuality q) const {
  switch (q) {
    case BounceQuality::Perfect: return cfg_.perfect_multiplier;
    case BounceQuality::Good:    return cfg_.good_multiplier;
    case BounceQuality::Late:    return cfg_.late_multiplier;
    case BounceQuality::Missed:  return 1.0;
  }
  return 1.0;
}

double WallBounceMachine::points_for(BounceQuality q) const {
  switch (q) {
    case BounceQuality::Perfect: return cfg_.perfect_points;
    case BounceQuality::Good:    return cfg_.good_points;
    case BounceQuality::Late:    return cfg_.late_points;
    case BounceQuality::Missed:  return 0.0;
  }
  return 0.0;
}

void WallBounceMachine::count_(BounceQuality q) {
  switch (q) {
    case BounceQuality::Perfect: ++counters_.perfect; ++counters_.total; break;
    case BounceQuality::Good:    ++counters_.good;    ++counters_.total; break;
    case BounceQuality::Late:    ++counters_.late;    ++counters_.total; break;
    case BounceQuality::Missed:  ++counters_.missed; break;
  }
}

std::optional<BounceOutcome> WallBounceMachine::on_bounce_input(double now_ms,
                                                                PlayerKinematics& player) {
  if (state_ != WindowState::Open) return std::nullopt;
  const double elapsed = std::max(0.0, now_ms - open_ms_);
  if (elapsed > cfg_.window_ms) return std::nullopt;   // timeout wins

  BounceOutcome o;
  o.quality = classify(elapsed);
  o.multiplier = multiplier_for(o.quality);
  o.elapsed_ms = elapsed;
  o.side = contact_.side;
  o.points = points_for(o.quality);

  player.vel.x = -contact_.velocity.x * o.multiplier;
  player.facing = player.vel.x >= 0.0 ? 1 : -1;
  o.velocity = player.vel;
  o.position = player.pos;

  state_ = WindowState::Closed;
  count_(o.quality);
  return o;
}

std::optional<BounceOutcome> WallBounceMachine::update(double now_ms,
                                                       const PlayerKinematics& player) {
  if (state_ != WindowState::Open) return std::nullopt;
  const double elapsed = now_ms - open_ms_;
  if (elapsed <= cfg_.window_ms) return std::nullopt;

  BounceOutcome o;
  o.quality = BounceQuality::Missed;
  o.elapsed_ms = elapsed;
  o.side = contact_.side;
  o.velocity = player.vel;
  o.position = player.pos;

  state_ = WindowState::Closed;
  count_(o.quality);
  return o;
}

void WallBounceMachine::reset() {
  state_ = WindowState::Closed;
  open_ms_ = 0.0;
  contact_ = WallContactEvent{};
  counters_ = BounceCounters{};
}

double WallBounceMachine::window_progress(double now_ms) const {
  if (state_ != WindowState::Open || cfg_.window_ms <= 0.0) return 0.0;
  return clamp01((now_ms - open_ms_) / cfg_.window_ms);
}

} // namespace vclimb
