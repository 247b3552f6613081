#pragma once
#include <cstdint>
#include <optional>
#include <vclimb/config.hpp>
#include <vclimb/geom.hpp>
#include <vclimb/slot_map.hpp>

namespace vclimb {

// Player box, top-left anchored. Screen space: +y is down.
struct PlayerKinematics {
  Vec2 pos;                  // px
  Vec2 vel;                  // px/s
  double width = 56.0;
  double height = 70.0;
  bool grounded = false;
  int facing = 1;            // +1 right, -1 left

  Rect box() const { return Rect{pos.x, pos.y, width, height}; }
  Vec2 center() const { return Vec2{pos.x + width * 0.5, pos.y + height * 0.5}; }
  double feet_y() const { return pos.y + height; }
};

// One-way platform: solid only from above.
struct Platform {
  Rect rect;
  Handle magnet{};           // into MagneticField; default handle = plain platform
  bool spawned_by_item = false;
};

enum class WallSide { Left, Right };

struct WallContactEvent {
  WallSide side = WallSide::Left;
  Vec2 position;             // player top-left at contact
  double timestamp_ms = 0.0;
  Vec2 velocity;             // player velocity before the wall stopped it
};

struct MoveInput {
  bool left = false;
  bool right = false;
  bool jump_pressed = false; // transitioned to pressed this tick
};

struct JumpMetrics {
  double vertical_speed = 0.0;
  double horizontal_speed_after = 0.0;
  double momentum_boost = 0.0;
  double flight_time_s = 0.0;
  double max_height = 0.0;
};

// What happened during one integration step.
struct StepResult {
  std::optional<WallContactEvent> wall_contact;
  bool jumped = false;
  bool landed = false;
  bool took_off = false;
  Handle landed_on{};        // platform handle when landed
  double air_time_ms = 0.0;  // valid when landed
};

// Fixed-step player physics inside the tower shaft.
class TowerSim {
public:
  TowerSim(const PhysicsConfig& physics, const WorldConfig& world, const PlayerConfig& player);

  // Place the player standing at spawn (top-left) and forget jump/coyote state.
  void reset(const Vec2& spawn, double now_ms);

  StepResult step(double dt_sec, double now_ms, const MoveInput& in,
                  const SlotMap<Platform>& platforms);

  void add_velocity(const Vec2& dv) { player_.vel += dv; }

  const PlayerKinematics& player() const { return player_; }
  PlayerKinematics&       player()       { return player_; }

  JumpMetrics jump_metrics(double horizontal_speed) const;

  double left_bound() const  { return world_.wall_thickness; }
  double right_bound() const { return world_.width - world_.wall_thickness; }

private:
  bool can_jump_(double now_ms) const;
  void perform_jump_(double now_ms);
  void resolve_walls_(double now_ms, StepResult& out);
  std::optional<Handle> find_landing_(double prev_feet, const SlotMap<Platform>& platforms) const;

  PhysicsConfig physics_;
  WorldConfig world_;
  PlayerKinematics player_;

  double last_grounded_ms_{0.0};
  double takeoff_ms_{0.0};
  double jump_buffer_until_ms_{-1.0};
  bool jumped_since_grounded_{false};
};

} // namespace vclimb
