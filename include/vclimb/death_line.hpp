#pragma once
#include <optional>
#include <vclimb/config.hpp>
#include <vclimb/geom.hpp>
#include <vclimb/sim.hpp>

namespace vclimb {

enum class GameOverCause { DeathLine };

struct GameOverInfo {
  GameOverCause cause = GameOverCause::DeathLine;
  double survival_ms = 0.0;
  double final_height = 0.0;   // px climbed from the start, not raw y
  Vec2 position;
};

struct DeathLineWarning {
  double distance = 0.0;
  double urgency = 0.0;        // 0 at the band edge, 1 at contact
  Vec2 position;
};

struct DeathLineState {
  double y = 0.0;
  bool active = false;
  double activation_ms = 0.0;
  double session_start_ms = 0.0;
  double start_player_y = 0.0;     // activation baseline
  double highest_player_y = 0.0;   // smallest y seen
};

struct DeathLineTick {
  bool activated = false;
  std::optional<DeathLineWarning> warning;
  std::optional<GameOverInfo> game_over;
};

// Pursuing hazard. INACTIVE until either the start delay elapses or the
// player has climbed min_height, then ACTIVE for the rest of the session.
// Once active its y never moves away from the player.
class DeathLine {
public:
  explicit DeathLine(const DeathLineConfig& cfg) : cfg_(cfg) {}

  void reset(double now_ms, double start_player_y);

  // player may be null (no player this tick): contact, height and warning
  // checks are skipped and the tick is logged.
  DeathLineTick update(double now_ms, const PlayerKinematics* player, double camera_bottom);

  // Signed gap between the line and the player's feet (positive = safe).
  double distance(const PlayerKinematics& player) const;
  bool in_danger(const PlayerKinematics& player) const;

  const DeathLineState& state() const { return state_; }
  bool active() const { return state_.active; }
  bool triggered() const { return triggered_; }
  double y() const { return state_.y; }
  double height_climbed() const { return state_.start_player_y - state_.highest_player_y; }
  // Smallest gap seen while active; nullopt until the line activates.
  std::optional<double> closest_approach() const { return closest_; }

private:
  DeathLineConfig cfg_;
  DeathLineState state_{};
  bool triggered_{false};
  std::optional<double> last_warning_ms_;
  std::optional<double> closest_;
};

} // namespace vclimb
