#pragma once
#include <string>
#include <vector>
#include <vclimb/events.hpp>
#include <vclimb/game.hpp>

namespace vclimb {

// RAII application that drives the game at a fixed step and renders it.
class ViewerApp {
public:
  ViewerApp(Game& game, std::string record_path);
  int run(); // returns 0 on normal exit

private:
  // Input & simulation
  InputState poll_input_();
  void advance_(double frame_dt);
  void on_notification_(const Notification& n);
  void save_record_();
  // Rendering
  void render_frame_();
  void draw_world_(const GameSnapshot& snap);
  void draw_hud_(const GameSnapshot& snap);
  void draw_game_over_();

  float to_screen_y_(double world_y, const GameSnapshot& snap) const;

  struct Toast {
    std::string text;
    double until_ms;
    int color_idx;
  };
  void toast_(std::string text, int color_idx);

  // Dependencies
  Game& game_;
  std::string record_path_;

  // Fixed-step accumulator
  double accum_{0.0};
  InputState pending_{};      // presses latched between sim steps

  std::vector<Toast> toasts_;
  bool record_dirty_{false};
};

} // namespace vclimb
