#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace vclimb {

// All distances are pixels, speeds px/s, accelerations px/s^2, times ms.

struct PhysicsConfig {
  double base_jump_speed = 450.0;
  double horizontal_retention = 0.6;   // fraction of vx kept on jump
  double gravity = 800.0;
  double horizontal_acceleration = 600.0;
  double max_horizontal_speed = 1350.0;
  double horizontal_drag = 300.0;
  double coyote_time_ms = 100.0;
  double jump_buffer_ms = 100.0;
};

struct WorldConfig {
  double width = 800.0;
  double view_height = 600.0;
  double wall_thickness = 64.0;
  double ground_y = 500.0;              // top surface of the ground platform
  double platform_width = 200.0;
  double platform_height = 16.0;
  double vertical_spacing_min = 100.0;
  double vertical_spacing_max = 160.0;
  double generate_distance = 1500.0;    // keep platforms this far above the camera top
  double cleanup_distance = 1000.0;     // drop platforms this far below the camera bottom
  double item_spawn_chance = 0.05;
};

struct PlayerConfig {
  double width = 56.0;
  double height = 70.0;
};

struct WallBounceConfig {
  double window_ms = 250.0;
  double perfect_ms = 100.0;
  double good_ms = 200.0;
  double perfect_multiplier = 1.3;
  double good_multiplier = 1.05;
  double late_multiplier = 0.8;
  double min_speed_for_bounce = 20.0;
  double perfect_points = 150.0;
  double good_points = 50.0;
  double late_points = 25.0;
};

struct ComboConfig {
  double window_ms = 2500.0;
  double step = 0.2;
  double max_multiplier = 5.0;
  double air_time_min_ms = 1000.0;
  double air_time_points = 25.0;
  double multi_jump_min_gap_ms = 500.0;  // since the previous landing
  double multi_jump_air_ms = 500.0;      // airborne at least this long
  double multi_jump_points = 75.0;
  double speed_bonus_min_speed = 400.0;  // |vx| on a new height record
  double speed_bonus_cooldown_ms = 1000.0;
  double speed_bonus_points = 100.0;
};

struct MagneticConfig {
  double chain_window_ms = 2000.0;
  double chain_timeout_ms = 3000.0;
  double min_chain_distance = 200.0;
  double max_chain_distance = 400.0;
  double landing_charge = 25.0;
  double reactivate_delay_ms = 3000.0;
  double field_gain = 18.0;             // velocity change per unit force per second
  double cleanup_distance = 1000.0;     // below the player
  int    spawn_interval = 15;           // platforms between magnetic spawns
  double spawn_chance = 0.3;
  double strength_min = 120.0;
  double strength_max = 180.0;
  double radius_min = 100.0;
  double radius_max = 140.0;
  double completion_bonus_per_platform = 500.0;
};

struct DeathLineConfig {
  double start_delay_ms = 30000.0;
  double min_height = 300.0;
  double warning_distance = 300.0;
  double warning_interval_ms = 2000.0;
  double auto_scroll_speed = 50.0;      // px/s, 0 = stationary line
  double offset = 50.0;                 // below the camera bottom edge
};

struct ScoreConfig {
  double height_interval = 10.0;        // px per height point
  double height_point_value = 1.0;
  std::vector<double> milestones{100.0, 250.0, 500.0, 1000.0, 2000.0, 5000.0, 10000.0};
};

struct InventoryConfig {
  double spawner_platform_width = 3.0 * 64.0;
  double spawner_drop = 20.0;           // gap between player feet and spawned platform
};

struct GameConfig {
  PhysicsConfig physics;
  WorldConfig world;
  PlayerConfig player;
  WallBounceConfig wall_bounce;
  ComboConfig combo;
  MagneticConfig magnetic;
  DeathLineConfig death_line;
  ScoreConfig score;
  InventoryConfig inventory;
};

enum class Preset { Beginner, Classic, Expert, Speedrun };

GameConfig default_config();
GameConfig preset_config(Preset p);
std::optional<Preset> preset_from_name(const std::string& name);

// First broken range or ordering rule (e.g. "combo.step < 0"), if any.
std::optional<std::string> config_problem(const GameConfig& cfg);

// Apply one "section.field" override. Returns false for unknown keys,
// unparsable values, or values that would leave cfg with a config_problem
// (cfg untouched). Rules are checked against the fields already set, so
// an override that widens a range must come before the one relying on it.
bool apply_config_value(GameConfig& cfg, const std::string& key, const std::string& value);

// Stream-based override loader (test-friendly; no filesystem required).
// Rows are "key,value"; optional "key,value" header, '#' comments and blank
// lines are ignored, whitespace around fields is trimmed, bad rows skipped.
GameConfig game_config_from_csv_stream(std::istream& in, GameConfig base = default_config());

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<GameConfig> load_game_config_csv(const std::string& path,
                                               GameConfig base = default_config());

} // namespace vclimb
