#include <random>
#include <string>
#include <spdlog/spdlog.h>
#include <vclimb/config.hpp>
#include <vclimb/game.hpp>
#include <vclimb/session.hpp>
#include <vclimb/viewer/app.hpp>

using namespace vclimb;

// Usage: vclimb_viewer [preset] [overrides.csv]
int main(int argc, char** argv) {
  GameConfig cfg = default_config();
  if (argc > 1) {
    if (auto p = preset_from_name(argv[1])) cfg = preset_config(*p);
    else spdlog::warn("unknown preset '{}', using classic", argv[1]);
  }
  if (argc > 2) {
    if (auto c = load_game_config_csv(argv[2], cfg)) cfg = *c;
  }

  const std::string record_path = "vclimb_record.csv";
  HighScoreRecord record = load_high_score_csv(record_path).value_or(HighScoreRecord{});

  std::random_device rd;
  Game game(cfg, rd(), record);

  ViewerApp app(game, record_path);
  return app.run();
}
