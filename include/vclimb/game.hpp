#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include <vclimb/camera.hpp>
#include <vclimb/combo.hpp>
#include <vclimb/config.hpp>
#include <vclimb/death_line.hpp>
#include <vclimb/events.hpp>
#include <vclimb/inventory.hpp>
#include <vclimb/level.hpp>
#include <vclimb/magnetic.hpp>
#include <vclimb/score.hpp>
#include <vclimb/session.hpp>
#include <vclimb/sim.hpp>
#include <vclimb/snap.hpp>
#include <vclimb/wall_bounce.hpp>

namespace vclimb {

// Key transitions and held state for one tick.
struct InputState {
  bool left = false;
  bool right = false;
  bool jump_pressed = false;     // also the bounce input while a window is open
  bool item_q_pressed = false;
  bool item_e_pressed = false;
};

// Owns every gameplay component and advances them in a fixed order:
// timers, input, magnetic force, integration, landing, wall bounce,
// height record, combo, camera/level, death line.
class Game {
public:
  Game(const GameConfig& cfg, std::uint32_t seed, HighScoreRecord record = {});

  void step(double dt_sec, const InputState& in);

  // Reset sequence: the record is updated if this session has not been
  // applied yet, then every component returns to its initial state.
  void restart();
  void toggle_pause();

  NotificationBus& bus() { return bus_; }

  GameState state() const { return state_; }
  double now_ms() const { return now_ms_; }
  std::uint64_t tick_index() const { return tick_; }

  GameSnapshot snapshot() const;
  SessionStats current_stats() const;
  const std::optional<SessionStats>& final_stats() const { return final_stats_; }
  const HighScoreRecord& record() const { return record_; }
  const RecordFlags& last_record_flags() const { return last_flags_; }

  const PlayerKinematics& player() const { return sim_.player(); }
  PlayerKinematics& player_mut() { return sim_.player(); }
  const Level& level() const { return level_; }
  const MagneticField& field() const { return field_; }
  MagneticField& field_mut() { return field_; }
  const WallBounceMachine& wall_bounce() const { return wall_; }
  const ComboEngine& combo() const { return combo_; }
  const DeathLine& death_line() const { return death_; }
  const Camera& camera() const { return camera_; }
  const Inventory& inventory() const { return inventory_; }
  Inventory& inventory_mut() { return inventory_; }
  const GameConfig& config() const { return cfg_; }

private:
  void start_session_();
  void use_item_(InventorySlot slot);
  void on_landing_(const StepResult& r, std::vector<ComboEvent>& events);
  void on_height_record_(std::vector<ComboEvent>& events);
  void on_bounce_(const BounceOutcome& o, std::vector<ComboEvent>& events);
  void on_chain_completion_(const ChainCompletion& c, std::vector<ComboEvent>& events);
  void on_combo_chain_(const ChainSummary& s);
  void end_session_(const GameOverInfo& info);
  void apply_record_(const SessionStats& s);

  GameConfig cfg_;
  std::uint32_t seed_;
  NotificationBus bus_;

  MagneticField field_;
  Level level_;
  TowerSim sim_;
  WallBounceMachine wall_;
  ComboEngine combo_;
  DeathLine death_;
  Camera camera_;
  HeightScorer height_;
  Inventory inventory_;

  GameState state_{GameState::Playing};
  double now_ms_{0.0};
  double session_start_ms_{0.0};
  std::uint64_t tick_{0};
  std::size_t fields_affecting_{0};
  double last_landing_ms_{0.0};
  std::optional<double> last_speed_bonus_ms_;

  HighScoreRecord record_;
  RecordFlags last_flags_{};
  std::optional<SessionStats> final_stats_;
  bool record_applied_{false};
};

} // namespace vclimb
