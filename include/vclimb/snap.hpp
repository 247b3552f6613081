#pragma once
#include <cstddef>
#include <cstdint>
#include <vclimb/sim.hpp>

namespace vclimb {

enum class GameState { Playing, Paused, GameOver };

// Read-only view of one tick for the presentation layer.
struct GameSnapshot {
  std::uint64_t tick = 0;
  double now_ms = 0.0;
  GameState state = GameState::Playing;

  PlayerKinematics player;
  double camera_top = 0.0;
  double camera_bottom = 0.0;

  bool death_line_active = false;
  double death_line_y = 0.0;
  bool in_danger = false;

  double height = 0.0;              // px climbed
  double height_score = 0.0;
  double combo_score = 0.0;
  double total_score = 0.0;

  std::size_t combo_length = 0;
  double combo_multiplier = 1.0;
  double combo_time_remaining_ms = 0.0;

  bool bounce_window_open = false;
  double bounce_window_progress = 0.0;

  std::size_t magnetic_chain_length = 0;
  double magnetic_chain_charge = 0.0;
  std::size_t fields_affecting = 0;
};

} // namespace vclimb
