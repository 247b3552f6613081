#include <vclimb/sim.hpp>
#include <algorithm>
#include <cmath>

namespace vclimb {

TowerSim::TowerSim(const PhysicsConfig& physics, const WorldConfig& world, const PlayerConfig& player)
  : physics_(physics), world_(world) {
  player_.width = player.width;
  player_.height = player.height;
}

void TowerSim::reset(const Vec2& spawn, double now_ms) {
  player_.pos = spawn;
  player_.vel = Vec2{};
  player_.grounded = true;
  player_.facing = 1;
  last_grounded_ms_ = now_ms;
  takeoff_ms_ = now_ms;
  jump_buffer_until_ms_ = -1.0;
  jumped_since_grounded_ = false;
}

JumpMetrics TowerSim::jump_metrics(double horizontal_speed) const {
  // Conversion rate rises linearly from 1.0 at rest to 1.25 at max speed.
  const double speed = std::abs(horizontal_speed);
  const double pct = physics_.max_horizontal_speed > 0.0
                   ? std::min(speed / physics_.max_horizontal_speed, 1.0) : 0.0;
  const double conversion = 1.0 + 0.25 * pct;

  JumpMetrics m;
  m.momentum_boost = speed * conversion;
  m.vertical_speed = physics_.base_jump_speed + m.momentum_boost;
  m.horizontal_speed_after = horizontal_speed * physics_.horizontal_retention;
  if (physics_.gravity > 0.0) {
    m.flight_time_s = 2.0 * m.vertical_speed / physics_.gravity;
    m.max_height = (m.vertical_speed * m.vertical_speed) / (2.0 * physics_.gravity);
  }
  return m;
}

bool TowerSim::can_jump_(double now_ms) const {
  if (player_.grounded) return true;
  return !jumped_since_grounded_ && (now_ms - last_grounded_ms_) <= physics_.coyote_time_ms;
}

void TowerSim::perform_jump_(double now_ms) {
  const auto m = jump_metrics(player_.vel.x);
  player_.vel.y = -m.vertical_speed;
  player_.vel.x = m.horizontal_speed_after;
  if (player_.grounded) takeoff_ms_ = now_ms;
  player_.grounded = false;
  jumped_since_grounded_ = true;
  jump_buffer_until_ms_ = -1.0;
}

void TowerSim::resolve_walls_(double now_ms, StepResult& out) {
  const double lo = left_bound();
  const double hi = right_bound() - player_.width;

  if (player_.pos.x < lo) {
    if (player_.vel.x < 0.0) {
      out.wall_contact = WallContactEvent{WallSide::Left, Vec2{lo, player_.pos.y}, now_ms, player_.vel};
    }
    player_.pos.x = lo;
    player_.vel.x = 0.0;
  } else if (player_.pos.x > hi) {
    if (player_.vel.x > 0.0) {
      out.wall_contact = WallContactEvent{WallSide::Right, Vec2{hi, player_.pos.y}, now_ms, player_.vel};
    }
    player_.pos.x = hi;
    player_.vel.x = 0.0;
  }
}

// Highest platform whose top the feet crossed this step (falling only).
std::optional<Handle> TowerSim::find_landing_(double prev_feet,
                                              const SlotMap<Platform>& platforms) const {
  if (player_.vel.y < 0.0) return std::nullopt;
  const double feet = player_.feet_y();
  const double left = player_.pos.x;
  const double right = player_.pos.x + player_.width;

  std::optional<Handle> best;
  double best_top = 0.0;
  platforms.for_each([&](Handle h, const Platform& p) {
    const double top = p.rect.top();
    if (right <= p.rect.left() || left >= p.rect.right()) return;
    if (prev_feet > top + 0.5 || feet < top) return;
    if (!best || top < best_top) {
      best = h;
      best_top = top;
    }
  });
  return best;
}

StepResult TowerSim::step(double dt_sec, double now_ms, const MoveInput& in,
                          const SlotMap<Platform>& platforms) {
  StepResult out;
  if (dt_sec <= 0.0) return out;

  const bool was_grounded = player_.grounded;

  // Horizontal control
  const int dir = (in.right ? 1 : 0) - (in.left ? 1 : 0);
  if (dir != 0) {
    player_.vel.x += dir * physics_.horizontal_acceleration * dt_sec;
    player_.facing = dir;
  } else {
    const double drop = physics_.horizontal_drag * dt_sec;
    if (std::abs(player_.vel.x) <= drop) player_.vel.x = 0.0;
    else player_.vel.x -= (player_.vel.x > 0.0 ? drop : -drop);
  }
  player_.vel.x = std::clamp(player_.vel.x, -physics_.max_horizontal_speed,
                             physics_.max_horizontal_speed);

  // Jump (buffered, coyote)
  if (in.jump_pressed) jump_buffer_until_ms_ = now_ms + physics_.jump_buffer_ms;
  if (jump_buffer_until_ms_ >= now_ms && can_jump_(now_ms)) {
    perform_jump_(now_ms);
    out.jumped = true;
  }

  // Integrate
  player_.vel.y += physics_.gravity * dt_sec;
  const double prev_feet = player_.feet_y();
  player_.pos += player_.vel * dt_sec;

  resolve_walls_(now_ms, out);

  // Platforms
  player_.grounded = false;
  if (auto h = find_landing_(prev_feet, platforms)) {
    const Platform* p = platforms.get(*h);
    player_.pos.y = p->rect.top() - player_.height;
    player_.vel.y = 0.0;
    player_.grounded = true;
    out.landed_on = *h;
  }

  if (player_.grounded) {
    if (!was_grounded) {
      out.landed = true;
      out.air_time_ms = now_ms - takeoff_ms_;
    }
    last_grounded_ms_ = now_ms;
    jumped_since_grounded_ = false;
    // A press buffered in the air fires on the landing tick.
    if (out.landed && jump_buffer_until_ms_ >= now_ms) {
      perform_jump_(now_ms);
      out.jumped = true;
    }
  } else if (was_grounded) {
    out.took_off = true;
    takeoff_ms_ = now_ms;
  }
  return out;
}

} // namespace vclimb
