#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>
#include <vclimb/viewer/app.hpp>

namespace vclimb {

namespace {

static constexpr int kWinW = 800;
static constexpr int kWinH = 600;
static constexpr double kStepSec = 1.0 / 120.0;
static constexpr double kMaxFrameSec = 0.25;
static constexpr double kToastMs = 1200.0;

static const Color kToastPal[] = {
  {255, 215, 0, 255},    // gold
  {80, 220, 120, 255},   // green
  {200, 200, 210, 255},  // gray
  {231, 76, 60, 255},    // red
  {90, 160, 255, 255},   // blue
};

static Color polarityColor(const MagneticPlatform& m) {
  const float a = m.active ? 1.0f : 0.45f;
  const unsigned char glow = static_cast<unsigned char>(120 + 135 * (m.charge / kMaxCharge));
  if (m.polarity == Polarity::Attract) return Fade(Color{68, 136, glow, 255}, a);
  return Fade(Color{glow, 68, 136, 255}, a);
}

// Time formatting helper
static void fmt_time(double ms, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (ms < 0.0 || !std::isfinite(ms)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  const double s = ms / 1000.0;
  int minutes = (int)(s / 60.0);
  double rem  = s - minutes * 60.0;
  if (minutes > 0) std::snprintf(out, (size_t)cap, "%d:%04.1f", minutes, rem);
  else             std::snprintf(out, (size_t)cap, "%.1fs", rem);
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(Game& game, std::string record_path)
  : game_(game), record_path_(std::move(record_path)) {
  game_.bus().subscribe([this](const Notification& n){ on_notification_(n); });
}

float ViewerApp::to_screen_y_(double world_y, const GameSnapshot& snap) const {
  return static_cast<float>(world_y - snap.camera_top);
}

void ViewerApp::toast_(std::string text, int color_idx) {
  toasts_.push_back(Toast{std::move(text), game_.now_ms() + kToastMs, color_idx});
}

void ViewerApp::on_notification_(const Notification& n) {
  std::visit([&](const auto& e) {
    using T = std::decay_t<decltype(e)>;
    if constexpr (std::is_same_v<T, WallBounceNote>) {
      const int col = e.quality == BounceQuality::Perfect ? 0
                    : e.quality == BounceQuality::Missed  ? 3 : 1;
      toast_(to_string(e.quality), col);
    } else if constexpr (std::is_same_v<T, ChainCompletedNote>) {
      if (e.length > 1) toast_(TextFormat("COMBO x%d  +%.0f", (int)e.length, e.score_delta), 0);
    } else if constexpr (std::is_same_v<T, MagneticChainNote>) {
      toast_(TextFormat("CHAIN %d  charge %.0f", (int)e.chain_length, e.total_charge), 4);
    } else if constexpr (std::is_same_v<T, DeathLineActivatedNote>) {
      toast_("THE LINE IS RISING", 3);
    } else if constexpr (std::is_same_v<T, DeathLineWarningNote>) {
      if (e.urgency > 0.5) toast_("DANGER", 3);
    } else if constexpr (std::is_same_v<T, GameOverNote>) {
      record_dirty_ = true;
    }
  }, n);
}

void ViewerApp::save_record_() {
  if (!record_dirty_) return;
  if (save_high_score_csv(record_path_, game_.record())) {
    spdlog::info("viewer: record saved to '{}'", record_path_);
  }
  record_dirty_ = false;
}

int ViewerApp::run() {
  InitWindow(kWinW, kWinH, "vclimb");
  SetTargetFPS(144);

  while (!WindowShouldClose()) {
    const InputState in = poll_input_();
    pending_.left = in.left;
    pending_.right = in.right;
    pending_.jump_pressed   = pending_.jump_pressed   || in.jump_pressed;
    pending_.item_q_pressed = pending_.item_q_pressed || in.item_q_pressed;
    pending_.item_e_pressed = pending_.item_e_pressed || in.item_e_pressed;

    advance_(GetFrameTime());
    save_record_();
    render_frame_();
  }

  // A session still running at exit counts as played.
  if (game_.state() != GameState::GameOver) {
    game_.restart();
    record_dirty_ = true;
  }
  save_record_();
  CloseWindow();
  return 0;
}

InputState ViewerApp::poll_input_() {
  InputState in;
  in.left  = IsKeyDown(KEY_A) || IsKeyDown(KEY_LEFT);
  in.right = IsKeyDown(KEY_D) || IsKeyDown(KEY_RIGHT);
  in.jump_pressed = IsKeyPressed(KEY_SPACE) || IsKeyPressed(KEY_W) || IsKeyPressed(KEY_UP);
  in.item_q_pressed = IsKeyPressed(KEY_Q);
  in.item_e_pressed = IsKeyPressed(KEY_E);

  if (IsKeyPressed(KEY_P)) game_.toggle_pause();
  if (IsKeyPressed(KEY_R)) {
    const bool was_over = game_.state() == GameState::GameOver;
    game_.restart();
    if (!was_over) record_dirty_ = true;
    toasts_.clear();
    accum_ = 0.0;
  }
  return in;
}

void ViewerApp::advance_(double frame_dt) {
  accum_ += std::min(frame_dt, kMaxFrameSec);
  while (accum_ >= kStepSec) {
    game_.step(kStepSec, pending_);
    pending_.jump_pressed = false;
    pending_.item_q_pressed = false;
    pending_.item_e_pressed = false;
    accum_ -= kStepSec;
  }
  const double now = game_.now_ms();
  toasts_.erase(std::remove_if(toasts_.begin(), toasts_.end(),
                               [now](const Toast& t){ return t.until_ms < now; }),
                toasts_.end());
}

void ViewerApp::render_frame_() {
  const GameSnapshot snap = game_.snapshot();

  BeginDrawing();
  ClearBackground(Color{18, 20, 32, 255});
  draw_world_(snap);
  draw_hud_(snap);
  if (snap.state == GameState::GameOver) draw_game_over_();
  if (snap.state == GameState::Paused) {
    DrawRectangle(0, 0, kWinW, kWinH, Color{0, 0, 0, 120});
    DrawText("PAUSED", kWinW / 2 - 60, kWinH / 2 - 20, 40, RAYWHITE);
  }
  EndDrawing();
}

void ViewerApp::draw_world_(const GameSnapshot& snap) {
  const auto& cfg = game_.config();
  const float wall = static_cast<float>(cfg.world.wall_thickness);

  // Walls
  DrawRectangle(0, 0, (int)wall, kWinH, Color{52, 73, 94, 255});
  DrawRectangle(kWinW - (int)wall, 0, (int)wall, kWinH, Color{52, 73, 94, 255});
  if (snap.bounce_window_open) {
    const auto a = static_cast<float>(1.0 - snap.bounce_window_progress);
    const float x = snap.player.pos.x < kWinW * 0.5 ? wall - 4.0f : kWinW - wall;
    DrawRectangle((int)x, 0, 4, kWinH, Fade(Color{255, 215, 0, 255}, a));
  }

  // Magnetic fields under the platforms
  game_.field().for_each([&](Handle, const MagneticPlatform& m) {
    const float y = to_screen_y_(m.pos.y, snap);
    if (y < -200.0f || y > kWinH + 200.0f) return;
    DrawCircleLines((int)m.pos.x, (int)y, (float)m.radius, polarityColor(m));
  });

  // Platforms
  const auto& level = game_.level();
  level.platforms().for_each([&](Handle, const Platform& p) {
    const float y = to_screen_y_(p.rect.y, snap);
    if (y < -50.0f || y > kWinH + 50.0f) return;
    Color c = p.spawned_by_item ? Color{241, 196, 15, 255} : Color{127, 140, 141, 255};
    if (const MagneticPlatform* m = game_.field().get(p.magnet)) c = polarityColor(*m);
    DrawRectangle((int)p.rect.x, (int)y, (int)p.rect.w, (int)p.rect.h, c);
  });

  // Pickups
  level.pickups().for_each([&](Handle, const ItemPickup& it) {
    const float y = to_screen_y_(it.rect.y, snap);
    DrawRectangleLines((int)it.rect.x, (int)y, (int)it.rect.w, (int)it.rect.h, Color{241, 196, 15, 255});
  });

  // Player
  const auto& pl = snap.player;
  const float py = to_screen_y_(pl.pos.y, snap);
  DrawRectangle((int)pl.pos.x, (int)py, (int)pl.width, (int)pl.height, Color{46, 204, 113, 255});
  const float eye_x = static_cast<float>(pl.pos.x + pl.width * (pl.facing > 0 ? 0.7 : 0.3));
  DrawCircle((int)eye_x, (int)(py + pl.height * 0.25f), 4.0f, RAYWHITE);

  // Death line and warning band
  if (snap.death_line_active) {
    const float y = to_screen_y_(snap.death_line_y, snap);
    const float band = static_cast<float>(cfg.death_line.warning_distance);
    DrawRectangle(0, (int)(y - band), kWinW, (int)band, Fade(Color{231, 76, 60, 255}, snap.in_danger ? 0.18f : 0.06f));
    DrawRectangle(0, (int)y, kWinW, kWinH, Fade(Color{120, 20, 20, 255}, 0.85f));
    DrawLineEx({0.0f, y}, {(float)kWinW, y}, 3.0f, Color{231, 76, 60, 255});
  }
}

void ViewerApp::draw_hud_(const GameSnapshot& snap) {
  const int x0 = (int)game_.config().world.wall_thickness + 12;

  DrawText(TextFormat("score %.0f   height %.0fm", snap.total_score, snap.height / 10.0),
           x0, 14, 20, Color{220, 235, 220, 255});

  if (snap.combo_length > 0) {
    DrawText(TextFormat("combo x%d  (%.1fx)  %.1fs", (int)snap.combo_length, snap.combo_multiplier,
                        snap.combo_time_remaining_ms / 1000.0),
             x0, 40, 18, Color{255, 215, 0, 255});
  }
  if (snap.magnetic_chain_length > 0) {
    DrawText(TextFormat("magnetic chain %d  charge %.0f", (int)snap.magnetic_chain_length,
                        snap.magnetic_chain_charge),
             x0, 62, 16, Color{90, 160, 255, 255});
  }

  // Inventory slots
  const auto& inv = game_.inventory();
  const char* names[2] = {"Q", "E"};
  for (int i = 0; i < 2; ++i) {
    const auto& s = inv.slot(static_cast<InventorySlot>(i));
    const int bx = kWinW - (int)game_.config().world.wall_thickness - 130 + i * 62;
    DrawRectangleLines(bx, 14, 54, 54, Color{200, 200, 210, 255});
    DrawText(names[i], bx + 4, 16, 14, Color{200, 200, 210, 255});
    if (s) DrawText("KIT", bx + 14, 36, 16, Color{241, 196, 15, 255});
  }

  int ty = kWinH / 3;
  for (const auto& t : toasts_) {
    const int w = MeasureText(t.text.c_str(), 24);
    DrawText(t.text.c_str(), kWinW / 2 - w / 2, ty, 24, kToastPal[t.color_idx]);
    ty += 28;
  }

  DrawText("A/D: Move | Space: Jump/Bounce | Q/E: Items | P: Pause | R: Restart",
           x0, kWinH - 22, 14, Color{190, 205, 190, 255});
}

void ViewerApp::draw_game_over_() {
  const auto& fs = game_.final_stats();
  if (!fs) return;
  const auto& rec = game_.record();
  const auto& flags = game_.last_record_flags();

  const int w = 420, h = 250;
  const int x0 = kWinW / 2 - w / 2, y0 = kWinH / 2 - h / 2;
  DrawRectangle(x0 - 6, y0 - 6, w + 12, h + 12, Color{0, 0, 0, 80});
  DrawRectangle(x0, y0, w, h, Color{24, 24, 28, 230});
  DrawText("GAME OVER", x0 + 20, y0 + 16, 32, Color{231, 76, 60, 255});

  char surv[32], best_surv[32];
  fmt_time(fs->survival_ms, surv, sizeof(surv));
  fmt_time(rec.best_survival_ms, best_surv, sizeof(best_surv));

  const Color def = Color{200, 200, 210, 255};
  const Color gold = Color{255, 215, 0, 255};
  int y = y0 + 64;
  DrawText(TextFormat("Score    %.0f   (best %.0f)", fs->total_score, rec.best_score), x0 + 20, y, 18, flags.score ? gold : def); y += 24;
  DrawText(TextFormat("Height   %.0fm   (best %.0fm)", fs->final_height / 10.0, rec.best_height / 10.0), x0 + 20, y, 18, flags.height ? gold : def); y += 24;
  DrawText(TextFormat("Survived %s   (best %s)", surv, best_surv), x0 + 20, y, 18, flags.survival ? gold : def); y += 24;
  DrawText(TextFormat("Combo    x%u   (best x%.0f)", fs->longest_chain, rec.best_combo), x0 + 20, y, 18, flags.combo ? gold : def); y += 24;
  DrawText(TextFormat("Bounces  %u  (%u perfect)", fs->wall_bounces, fs->perfect_bounces), x0 + 20, y, 18, def); y += 24;
  DrawText(TextFormat("Games played %u", rec.total_games_played), x0 + 20, y, 18, def); y += 30;
  DrawText("R: play again", x0 + 20, y, 16, Color{190, 205, 190, 255});
}

} // namespace vclimb
