#include <vclimb/config.hpp>
#include <algorithm>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>
#include <vclimb/csv.hpp>

namespace vclimb {

static double* double_field(GameConfig& c, const std::string& key) {
  struct Entry { const char* key; double* field; };
  const Entry table[] = {
    {"physics.base_jump_speed",          &c.physics.base_jump_speed},
    {"physics.horizontal_retention",     &c.physics.horizontal_retention},
    {"physics.gravity",                  &c.physics.gravity},
    {"physics.horizontal_acceleration",  &c.physics.horizontal_acceleration},
    {"physics.max_horizontal_speed",     &c.physics.max_horizontal_speed},
    {"physics.horizontal_drag",          &c.physics.horizontal_drag},
    {"physics.coyote_time_ms",           &c.physics.coyote_time_ms},
    {"physics.jump_buffer_ms",           &c.physics.jump_buffer_ms},

    {"world.width",                      &c.world.width},
    {"world.view_height",                &c.world.view_height},
    {"world.wall_thickness",             &c.world.wall_thickness},
    {"world.ground_y",                   &c.world.ground_y},
    {"world.platform_width",             &c.world.platform_width},
    {"world.platform_height",            &c.world.platform_height},
    {"world.vertical_spacing_min",       &c.world.vertical_spacing_min},
    {"world.vertical_spacing_max",       &c.world.vertical_spacing_max},
    {"world.generate_distance",          &c.world.generate_distance},
    {"world.cleanup_distance",           &c.world.cleanup_distance},
    {"world.item_spawn_chance",          &c.world.item_spawn_chance},

    {"player.width",                     &c.player.width},
    {"player.height",                    &c.player.height},

    {"wall_bounce.window_ms",            &c.wall_bounce.window_ms},
    {"wall_bounce.perfect_ms",           &c.wall_bounce.perfect_ms},
    {"wall_bounce.good_ms",              &c.wall_bounce.good_ms},
    {"wall_bounce.perfect_multiplier",   &c.wall_bounce.perfect_multiplier},
    {"wall_bounce.good_multiplier",      &c.wall_bounce.good_multiplier},
    {"wall_bounce.late_multiplier",      &c.wall_bounce.late_multiplier},
    {"wall_bounce.min_speed_for_bounce", &c.wall_bounce.min_speed_for_bounce},
    {"wall_bounce.perfect_points",       &c.wall_bounce.perfect_points},
    {"wall_bounce.good_points",          &c.wall_bounce.good_points},
    {"wall_bounce.late_points",          &c.wall_bounce.late_points},

    {"combo.window_ms",                  &c.combo.window_ms},
    {"combo.step",                       &c.combo.step},
    {"combo.max_multiplier",             &c.combo.max_multiplier},
    {"combo.air_time_min_ms",            &c.combo.air_time_min_ms},
    {"combo.air_time_points",            &c.combo.air_time_points},
    {"combo.multi_jump_min_gap_ms",      &c.combo.multi_jump_min_gap_ms},
    {"combo.multi_jump_air_ms",          &c.combo.multi_jump_air_ms},
    {"combo.multi_jump_points",          &c.combo.multi_jump_points},
    {"combo.speed_bonus_min_speed",      &c.combo.speed_bonus_min_speed},
    {"combo.speed_bonus_cooldown_ms",    &c.combo.speed_bonus_cooldown_ms},
    {"combo.speed_bonus_points",         &c.combo.speed_bonus_points},

    {"magnetic.chain_window_ms",         &c.magnetic.chain_window_ms},
    {"magnetic.chain_timeout_ms",        &c.magnetic.chain_timeout_ms},
    {"magnetic.min_chain_distance",      &c.magnetic.min_chain_distance},
    {"magnetic.max_chain_distance",      &c.magnetic.max_chain_distance},
    {"magnetic.landing_charge",          &c.magnetic.landing_charge},
    {"magnetic.reactivate_delay_ms",     &c.magnetic.reactivate_delay_ms},
    {"magnetic.field_gain",              &c.magnetic.field_gain},
    {"magnetic.cleanup_distance",        &c.magnetic.cleanup_distance},
    {"magnetic.spawn_chance",            &c.magnetic.spawn_chance},
    {"magnetic.strength_min",            &c.magnetic.strength_min},
    {"magnetic.strength_max",            &c.magnetic.strength_max},
    {"magnetic.radius_min",              &c.magnetic.radius_min},
    {"magnetic.radius_max",              &c.magnetic.radius_max},
    {"magnetic.completion_bonus_per_platform", &c.magnetic.completion_bonus_per_platform},

    {"death_line.start_delay_ms",        &c.death_line.start_delay_ms},
    {"death_line.min_height",            &c.death_line.min_height},
    {"death_line.warning_distance",      &c.death_line.warning_distance},
    {"death_line.warning_interval_ms",   &c.death_line.warning_interval_ms},
    {"death_line.auto_scroll_speed",     &c.death_line.auto_scroll_speed},
    {"death_line.offset",                &c.death_line.offset},

    {"score.height_interval",            &c.score.height_interval},
    {"score.height_point_value",         &c.score.height_point_value},

    {"inventory.spawner_platform_width", &c.inventory.spawner_platform_width},
    {"inventory.spawner_drop",           &c.inventory.spawner_drop},
  };
  for (const auto& e : table) {
    if (key == e.key) return e.field;
  }
  return nullptr;
}

GameConfig default_config() {
  return GameConfig{};
}

GameConfig preset_config(Preset p) {
  GameConfig c = default_config();
  switch (p) {
    case Preset::Beginner:
      c.wall_bounce.perfect_multiplier = 1.15;
      c.wall_bounce.good_multiplier = 1.0;
      c.wall_bounce.late_multiplier = 0.9;
      c.wall_bounce.min_speed_for_bounce = 30.0;
      c.wall_bounce.window_ms = 320.0;
      c.physics.horizontal_retention = 0.8;
      c.physics.max_horizontal_speed = 600.0;
      break;
    case Preset::Classic:
      break;
    case Preset::Expert:
      c.wall_bounce.perfect_multiplier = 1.3;
      c.wall_bounce.good_multiplier = 0.95;
      c.wall_bounce.late_multiplier = 0.75;
      c.wall_bounce.min_speed_for_bounce = 60.0;
      c.wall_bounce.window_ms = 200.0;
      c.wall_bounce.perfect_ms = 70.0;
      c.wall_bounce.good_ms = 140.0;
      c.physics.horizontal_retention = 0.05;
      c.physics.max_horizontal_speed = 800.0;
      break;
    case Preset::Speedrun:
      c.wall_bounce.perfect_multiplier = 1.4;
      c.wall_bounce.good_multiplier = 1.0;
      c.wall_bounce.late_multiplier = 0.8;
      c.wall_bounce.min_speed_for_bounce = 50.0;
      c.physics.horizontal_retention = 0.0;
      c.physics.max_horizontal_speed = 1000.0;
      c.physics.gravity = 900.0;
      break;
  }
  return c;
}

std::optional<Preset> preset_from_name(const std::string& name) {
  const auto n = to_lower(trim(name));
  if (n == "beginner") return Preset::Beginner;
  if (n == "classic")  return Preset::Classic;
  if (n == "expert")   return Preset::Expert;
  if (n == "speedrun") return Preset::Speedrun;
  return std::nullopt;
}

std::optional<std::string> config_problem(const GameConfig& c) {
  struct Rule { bool ok; const char* what; };
  const auto& p = c.physics;
  const auto& w = c.world;
  const auto& b = c.wall_bounce;
  const auto& k = c.combo;
  const auto& m = c.magnetic;
  const auto& d = c.death_line;
  const auto& s = c.score;
  const Rule rules[] = {
    {p.gravity > 0.0,                               "physics.gravity <= 0"},
    {p.base_jump_speed >= 0.0,                      "physics.base_jump_speed < 0"},
    {p.horizontal_retention >= 0.0 && p.horizontal_retention <= 1.0,
                                                    "physics.horizontal_retention outside [0,1]"},
    {p.horizontal_acceleration >= 0.0,              "physics.horizontal_acceleration < 0"},
    {p.max_horizontal_speed > 0.0,                  "physics.max_horizontal_speed <= 0"},
    {p.horizontal_drag >= 0.0,                      "physics.horizontal_drag < 0"},
    {p.coyote_time_ms >= 0.0 && p.jump_buffer_ms >= 0.0,
                                                    "physics coyote/buffer time < 0"},

    {w.wall_thickness >= 0.0,                       "world.wall_thickness < 0"},
    {w.width > 2.0 * w.wall_thickness,              "world.width leaves no shaft between the walls"},
    {w.view_height > 0.0,                           "world.view_height <= 0"},
    {w.platform_width > 0.0 && w.platform_width <= w.width - 2.0 * w.wall_thickness,
                                                    "world.platform_width does not fit the shaft"},
    {w.platform_height > 0.0,                       "world.platform_height <= 0"},
    {w.vertical_spacing_min > 0.0,                  "world.vertical_spacing_min <= 0"},
    {w.vertical_spacing_min <= w.vertical_spacing_max,
                                                    "world.vertical_spacing_min > vertical_spacing_max"},
    {w.generate_distance >= 0.0 && w.cleanup_distance >= 0.0,
                                                    "world generate/cleanup distance < 0"},
    {w.item_spawn_chance >= 0.0 && w.item_spawn_chance <= 1.0,
                                                    "world.item_spawn_chance outside [0,1]"},

    {c.player.width > 0.0 && c.player.height > 0.0, "player size <= 0"},

    {b.window_ms > 0.0,                             "wall_bounce.window_ms <= 0"},
    {b.perfect_ms >= 0.0,                           "wall_bounce.perfect_ms < 0"},
    {b.perfect_ms <= b.good_ms,                     "wall_bounce.perfect_ms > good_ms"},
    {b.good_ms <= b.window_ms,                      "wall_bounce.good_ms > window_ms"},
    {b.perfect_multiplier >= 0.0 && b.good_multiplier >= 0.0 && b.late_multiplier >= 0.0,
                                                    "wall_bounce multiplier < 0"},
    {b.min_speed_for_bounce >= 0.0,                 "wall_bounce.min_speed_for_bounce < 0"},
    {b.perfect_points >= 0.0 && b.good_points >= 0.0 && b.late_points >= 0.0,
                                                    "wall_bounce points < 0"},

    {k.window_ms > 0.0,                             "combo.window_ms <= 0"},
    {k.step >= 0.0,                                 "combo.step < 0"},
    {k.max_multiplier >= 1.0,                       "combo.max_multiplier < 1"},
    {k.air_time_min_ms >= 0.0 && k.multi_jump_min_gap_ms >= 0.0 &&
     k.multi_jump_air_ms >= 0.0 && k.speed_bonus_cooldown_ms >= 0.0,
                                                    "combo trigger time < 0"},
    {k.speed_bonus_min_speed >= 0.0,                "combo.speed_bonus_min_speed < 0"},
    {k.air_time_points >= 0.0 && k.multi_jump_points >= 0.0 && k.speed_bonus_points >= 0.0,
                                                    "combo points < 0"},

    {m.chain_window_ms > 0.0,                       "magnetic.chain_window_ms <= 0"},
    {m.chain_timeout_ms > 0.0,                      "magnetic.chain_timeout_ms <= 0"},
    {m.min_chain_distance >= 0.0,                   "magnetic.min_chain_distance < 0"},
    {m.min_chain_distance <= m.max_chain_distance,  "magnetic.min_chain_distance > max_chain_distance"},
    {m.landing_charge >= 0.0,                       "magnetic.landing_charge < 0"},
    {m.reactivate_delay_ms >= 0.0,                  "magnetic.reactivate_delay_ms < 0"},
    {m.field_gain >= 0.0,                           "magnetic.field_gain < 0"},
    {m.cleanup_distance >= 0.0,                     "magnetic.cleanup_distance < 0"},
    {m.spawn_interval >= 1,                         "magnetic.spawn_interval < 1"},
    {m.spawn_chance >= 0.0 && m.spawn_chance <= 1.0,
                                                    "magnetic.spawn_chance outside [0,1]"},
    {m.strength_min >= 0.0,                         "magnetic.strength_min < 0"},
    {m.strength_min <= m.strength_max,              "magnetic.strength_min > strength_max"},
    {m.radius_min > 0.0,                            "magnetic.radius_min <= 0"},
    {m.radius_min <= m.radius_max,                  "magnetic.radius_min > radius_max"},
    {m.completion_bonus_per_platform >= 0.0,        "magnetic.completion_bonus_per_platform < 0"},

    {d.start_delay_ms >= 0.0,                       "death_line.start_delay_ms < 0"},
    {d.min_height >= 0.0,                           "death_line.min_height < 0"},
    {d.warning_distance >= 0.0,                     "death_line.warning_distance < 0"},
    {d.warning_interval_ms > 0.0,                   "death_line.warning_interval_ms <= 0"},
    {d.auto_scroll_speed >= 0.0,                    "death_line.auto_scroll_speed < 0"},

    {s.height_interval > 0.0,                       "score.height_interval <= 0"},
    {s.height_point_value >= 0.0,                   "score.height_point_value < 0"},
    {std::all_of(s.milestones.begin(), s.milestones.end(), [](double v) { return v >= 0.0; }),
                                                    "score.milestones has a negative entry"},

    {c.inventory.spawner_platform_width > 0.0,      "inventory.spawner_platform_width <= 0"},
    {c.inventory.spawner_drop >= 0.0,               "inventory.spawner_drop < 0"},
  };
  for (const auto& r : rules) {
    if (!r.ok) return std::string(r.what);
  }
  return std::nullopt;
}

// Parse and store one value into a copy; nullopt when the key is unknown or
// the value does not parse.
static std::optional<GameConfig> with_value(const GameConfig& cfg, const std::string& k,
                                            const std::string& v) {
  GameConfig out = cfg;
  if (k == "magnetic.spawn_interval") {
    const auto d = parse_double(v);
    if (!d || *d < 1.0 || *d > static_cast<double>(std::numeric_limits<int>::max())) {
      return std::nullopt;
    }
    out.magnetic.spawn_interval = static_cast<int>(*d);
    return out;
  }
  if (k == "score.milestones") {
    // Semicolon-separated list, e.g. "100;250;500"
    std::vector<double> ms;
    for (const auto& part : split_fields(v, ';')) {
      if (part.empty()) continue;
      const auto d = parse_double(part);
      if (!d) return std::nullopt;
      ms.push_back(*d);
    }
    std::sort(ms.begin(), ms.end());
    out.score.milestones = std::move(ms);
    return out;
  }

  double* field = double_field(out, k);
  if (!field) return std::nullopt;
  const auto d = parse_double(v);
  if (!d) return std::nullopt;
  *field = *d;
  return out;
}

bool apply_config_value(GameConfig& cfg, const std::string& key, const std::string& value) {
  const std::string k = to_lower(trim(key));
  auto next = with_value(cfg, k, trim(value));
  if (!next) return false;
  if (auto problem = config_problem(*next)) {
    spdlog::warn("config: '{}' rejected ({})", k, *problem);
    return false;
  }
  cfg = std::move(*next);
  return true;
}

GameConfig game_config_from_csv_stream(std::istream& in, GameConfig base) {
  std::string line;
  bool header_consumed = false;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_fields(raw, ',');
    if (!header_consumed && cols.size() >= 2 && to_lower(cols[0]) == "key") {
      header_consumed = true;
      continue;
    }
    if (cols.size() < 2 || cols[0].empty()) {
      spdlog::warn("config: line {} skipped (expected key,value)", line_no);
      continue;
    }
    if (!apply_config_value(base, cols[0], cols[1])) {
      spdlog::warn("config: line {} skipped (unknown key or bad value '{}')", line_no, cols[0]);
    }
  }
  return base;
}

std::optional<GameConfig> load_game_config_csv(const std::string& path, GameConfig base) {
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("config: cannot open '{}'", path);
    return std::nullopt;
  }
  spdlog::info("config: loading overrides from '{}'", path);
  return game_config_from_csv_stream(f, std::move(base));
}

} // namespace vclimb
