#include <vclimb/game.hpp>
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace vclimb {

// Ground sits this far above the bottom edge of the first view.
static constexpr double kGroundMargin = 100.0;

Game::Game(const GameConfig& cfg, std::uint32_t seed, HighScoreRecord record)
  : cfg_(cfg),
    seed_(seed),
    field_(cfg.magnetic),
    level_(cfg.world, field_, seed),
    sim_(cfg.physics, cfg.world, cfg.player),
    wall_(cfg.wall_bounce),
    combo_(cfg.combo),
    death_(cfg.death_line),
    camera_(cfg.world, cfg.death_line.auto_scroll_speed),
    height_(cfg.score),
    record_(record) {
  start_session_();
}

void Game::start_session_() {
  level_.reset(seed_);

  const Vec2 spawn{cfg_.world.width * 0.5 - cfg_.player.width * 0.5,
                   cfg_.world.ground_y - cfg_.player.height};
  sim_.reset(spawn, now_ms_);
  death_.reset(now_ms_, spawn.y);
  height_.reset(spawn.y);
  camera_.reset(cfg_.world.ground_y + kGroundMargin - cfg_.world.view_height);
  level_.update(camera_.top(), camera_.bottom());

  session_start_ms_ = now_ms_;
  state_ = GameState::Playing;
  fields_affecting_ = 0;
  last_landing_ms_ = now_ms_;
  last_speed_bonus_ms_.reset();
  record_applied_ = false;
  final_stats_.reset();
}

void Game::restart() {
  if (!record_applied_) apply_record_(current_stats());

  if (auto dropped = combo_.cancel_for_reset()) on_combo_chain_(*dropped);
  wall_.reset();
  field_.reset();
  inventory_.clear();
  start_session_();
  spdlog::info("game: restart (games played {})", record_.total_games_played);
}

void Game::toggle_pause() {
  if (state_ == GameState::Playing) state_ = GameState::Paused;
  else if (state_ == GameState::Paused) state_ = GameState::Playing;
}

void Game::use_item_(InventorySlot slot) {
  const auto out = inventory_.use_item(slot, now_ms_);
  if (out.result != UseResult::Used || !out.used) return;

  switch (*out.used) {
    case ItemType::PlatformSpawner: {
      const auto& p = sim_.player();
      const double w = cfg_.inventory.spawner_platform_width;
      level_.spawn_platform(Rect{p.center().x - w * 0.5, p.feet_y() + cfg_.inventory.spawner_drop,
                                 w, cfg_.world.platform_height});
      break;
    }
  }
}

void Game::on_landing_(const StepResult& r, std::vector<ComboEvent>& events) {
  const auto& cc = cfg_.combo;
  if (r.air_time_ms >= cc.air_time_min_ms) {
    events.push_back(ComboEvent{now_ms_, cc.air_time_points, true, ComboSource::AirTime});
  }
  // A long flight after a settled landing passed over at least one platform.
  if (now_ms_ - last_landing_ms_ > cc.multi_jump_min_gap_ms && r.air_time_ms >= cc.multi_jump_air_ms) {
    events.push_back(ComboEvent{now_ms_, cc.multi_jump_points, true, ComboSource::MultiPlatformJump});
  }
  last_landing_ms_ = now_ms_;

  if (const Platform* p = level_.platform(r.landed_on)) {
    const auto lo = field_.on_landing(p->magnet, now_ms_);
    if (lo.completed) on_chain_completion_(*lo.completed, events);
    if (lo.extended) {
      const auto& ext = *lo.extended;
      bus_.publish(MagneticChainNote{ext.from, ext.to, ext.chain_length, ext.total_charge});
      events.push_back(ComboEvent{now_ms_, ext.points, true, ComboSource::MagneticLink});
    }
  }
}

void Game::on_height_record_(std::vector<ComboEvent>& events) {
  const auto& cc = cfg_.combo;
  if (std::abs(sim_.player().vel.x) <= cc.speed_bonus_min_speed) return;
  if (last_speed_bonus_ms_ && now_ms_ - *last_speed_bonus_ms_ < cc.speed_bonus_cooldown_ms) return;
  last_speed_bonus_ms_ = now_ms_;
  events.push_back(ComboEvent{now_ms_, cc.speed_bonus_points, true, ComboSource::SpeedBonus});
}

void Game::on_bounce_(const BounceOutcome& o, std::vector<ComboEvent>& events) {
  bus_.publish(WallBounceNote{o.quality, o.velocity, o.position});
  if (o.quality == BounceQuality::Missed) return;
  events.push_back(ComboEvent{now_ms_, o.points, true, ComboSource::WallBounce});
}

void Game::on_chain_completion_(const ChainCompletion& c, std::vector<ComboEvent>& events) {
  if (c.bonus_points > 0.0) {
    events.push_back(ComboEvent{now_ms_, c.bonus_points, false, ComboSource::MagneticCompletion});
  }
}

void Game::on_combo_chain_(const ChainSummary& s) {
  if (s.end == ChainEnd::Reset) bus_.publish(ChainBrokenNote{s.length, 0.0});
  else bus_.publish(ChainCompletedNote{s.length, s.score});
}

void Game::step(double dt_sec, const InputState& in) {
  if (state_ != GameState::Playing || dt_sec <= 0.0) return;
  now_ms_ += dt_sec * 1000.0;
  ++tick_;

  std::vector<ComboEvent> events;

  // Timers and magnetic chain timeout
  if (auto c = field_.update(now_ms_)) on_chain_completion_(*c, events);

  // Input
  if (in.item_q_pressed) use_item_(InventorySlot::Q);
  if (in.item_e_pressed) use_item_(InventorySlot::E);

  MoveInput mv{in.left, in.right, false};
  bool bounce_pressed = false;
  if (in.jump_pressed) {
    if (wall_.is_open()) bounce_pressed = true;
    else mv.jump_pressed = true;
  }

  // Magnetic force, then integration
  const auto fs = field_.total_force(sim_.player().center());
  fields_affecting_ = fs.field_count;
  if (fs.field_count > 0) sim_.add_velocity(fs.force * (cfg_.magnetic.field_gain * dt_sec));

  const auto r = sim_.step(dt_sec, now_ms_, mv, level_.platforms());

  if (r.landed) on_landing_(r, events);

  // Wall bounce: contact, then input, then timeout
  if (r.wall_contact) wall_.on_contact(*r.wall_contact);
  if (bounce_pressed) {
    if (auto o = wall_.on_bounce_input(now_ms_, sim_.player())) on_bounce_(*o, events);
  }
  if (auto o = wall_.update(now_ms_, sim_.player())) on_bounce_(*o, events);

  const auto& pl = sim_.player();
  if (height_.update(pl.pos.y).new_record) on_height_record_(events);

  // Combo
  for (const auto& e : events) {
    if (auto s = combo_.record_event(e)) on_combo_chain_(*s);
  }
  if (auto s = combo_.update(now_ms_)) on_combo_chain_(*s);

  // Camera, level
  camera_.update(dt_sec, pl.pos.y);
  level_.update(camera_.top(), camera_.bottom());
  field_.cleanup_below(pl.pos.y);
  if (auto item = level_.collect_pickup(pl.box())) inventory_.add_item(make_item(*item));

  // Death line
  const auto d = death_.update(now_ms_, &sim_.player(), camera_.bottom());
  if (d.activated) {
    camera_.enable_auto_scroll();
    bus_.publish(DeathLineActivatedNote{death_.y(), now_ms_});
  }
  if (d.warning) bus_.publish(DeathLineWarningNote{d.warning->distance, d.warning->urgency, d.warning->position});
  if (d.game_over) end_session_(*d.game_over);
}

SessionStats Game::current_stats() const {
  const auto cs = combo_.get_stats();
  const auto& bc = wall_.counters();

  SessionStats s;
  s.final_height = std::max(0.0, death_.height_climbed());
  s.survival_ms = now_ms_ - session_start_ms_;
  s.height_score = height_.score();
  s.combo_score = cs.total_score;
  s.total_score = s.height_score + s.combo_score;
  s.longest_chain = static_cast<std::uint32_t>(cs.longest_chain);
  s.total_chains = static_cast<std::uint32_t>(cs.total_chains);
  s.wall_bounces = bc.total;
  s.perfect_bounces = bc.perfect;
  s.closest_call = death_.closest_approach();
  return s;
}

void Game::apply_record_(const SessionStats& s) {
  last_flags_ = apply_session(record_, s);
  final_stats_ = s;
  record_applied_ = true;
}

void Game::end_session_(const GameOverInfo& info) {
  state_ = GameState::GameOver;
  if (auto s = combo_.finish_session()) on_combo_chain_(*s);

  SessionStats s = current_stats();
  s.final_height = info.final_height;
  s.survival_ms = info.survival_ms;
  apply_record_(s);

  bus_.publish(GameOverNote{info.cause, info.survival_ms, info.final_height, info.position});
  spdlog::info("game: over, score {:.0f}, height {:.0f}px, longest chain {}{}",
               s.total_score, s.final_height, s.longest_chain,
               last_flags_.any() ? " (new record)" : "");
}

GameSnapshot Game::snapshot() const {
  GameSnapshot g;
  g.tick = tick_;
  g.now_ms = now_ms_;
  g.state = state_;
  g.player = sim_.player();
  g.camera_top = camera_.top();
  g.camera_bottom = camera_.bottom();
  g.death_line_active = death_.active();
  g.death_line_y = death_.y();
  g.in_danger = death_.in_danger(sim_.player());
  g.height = height_.highest_height();
  g.height_score = height_.score();
  g.combo_score = combo_.get_stats().total_score;
  g.total_score = g.height_score + g.combo_score;
  g.combo_length = combo_.current_length();
  g.combo_multiplier = combo_.current_multiplier();
  g.combo_time_remaining_ms = combo_.time_remaining(now_ms_);
  g.bounce_window_open = wall_.is_open();
  g.bounce_window_progress = wall_.window_progress(now_ms_);
  g.magnetic_chain_length = field_.chain_length();
  g.magnetic_chain_charge = field_.chain_charge();
  g.fields_affecting = fields_affecting_;
  return g;
}

} // namespace vclimb
