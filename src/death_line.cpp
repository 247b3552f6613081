#include <vclimb/death_line.hpp>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace vclimb {

void DeathLine::reset(double now_ms, double start_player_y) {
  state_ = DeathLineState{};
  state_.session_start_ms = now_ms;
  state_.start_player_y = start_player_y;
  state_.highest_player_y = start_player_y;
  triggered_ = false;
  last_warning_ms_.reset();
  closest_.reset();
}

double DeathLine::distance(const PlayerKinematics& player) const {
  return state_.y - player.feet_y();
}

bool DeathLine::in_danger(const PlayerKinematics& player) const {
  return state_.active && distance(player) <= cfg_.warning_distance;
}

DeathLineTick DeathLine::update(double now_ms, const PlayerKinematics* player, double camera_bottom) {
  DeathLineTick out;
  if (triggered_) return out;

  if (player) {
    state_.highest_player_y = std::min(state_.highest_player_y, player->pos.y);
  }

  if (!state_.active) {
    const double elapsed = now_ms - state_.session_start_ms;
    if (elapsed >= cfg_.start_delay_ms || height_climbed() >= cfg_.min_height) {
      state_.active = true;
      state_.activation_ms = now_ms;
      state_.y = camera_bottom + cfg_.offset;
      out.activated = true;
      spdlog::info("death line: active after {:.1f}s, {:.0f}px climbed",
                   elapsed / 1000.0, height_climbed());
    }
  } else if (cfg_.auto_scroll_speed > 0.0) {
    state_.y = std::min(state_.y, camera_bottom + cfg_.offset);
  }

  if (!state_.active) return out;

  if (!player) {
    spdlog::warn("death line: no player this tick, contact check skipped");
    return out;
  }

  const double gap = distance(*player);
  closest_ = closest_ ? std::min(*closest_, gap) : gap;

  if (player->feet_y() >= state_.y) {
    triggered_ = true;
    GameOverInfo info;
    info.survival_ms = now_ms - state_.session_start_ms;
    info.final_height = height_climbed();
    info.position = player->pos;
    out.game_over = info;
    spdlog::info("death line: contact at y={:.0f}, survived {:.1f}s, height {:.0f}px",
                 state_.y, info.survival_ms / 1000.0, info.final_height);
    return out;
  }

  if (gap <= cfg_.warning_distance
      && (!last_warning_ms_ || now_ms - *last_warning_ms_ >= cfg_.warning_interval_ms)) {
    last_warning_ms_ = now_ms;
    DeathLineWarning w;
    w.distance = gap;
    w.urgency = cfg_.warning_distance > 0.0 ? clamp01(1.0 - gap / cfg_.warning_distance) : 1.0;
    w.position = player->pos;
    out.warning = w;
  }
  return out;
}

} // namespace vclimb
