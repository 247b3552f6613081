#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace vclimb {

// Final totals of one session, computed once at game end.
struct SessionStats {
  double final_height = 0.0;       // px
  double survival_ms = 0.0;
  double total_score = 0.0;
  double height_score = 0.0;
  double combo_score = 0.0;
  std::uint32_t longest_chain = 0;
  std::uint32_t total_chains = 0;
  std::uint32_t wall_bounces = 0;
  std::uint32_t perfect_bounces = 0;
  std::optional<double> closest_call; // smallest death-line gap, if it ever activated
};

// Persisted personal bests.
struct HighScoreRecord {
  double best_height = 0.0;
  double best_score = 0.0;
  double best_survival_ms = 0.0;
  double best_combo = 0.0;
  std::uint32_t total_games_played = 0;
};

struct RecordFlags {
  bool height = false;
  bool score = false;
  bool survival = false;
  bool combo = false;

  bool any() const { return height || score || survival || combo; }
};

// Field-wise maximum; total_games_played always +1.
RecordFlags apply_session(HighScoreRecord& rec, const SessionStats& s);

// Flat "key,value" rows: bestHeight, bestScore, bestSurvivalTime, bestCombo,
// totalGamesPlayed. Unknown keys and bad values are skipped.
HighScoreRecord high_score_from_csv_stream(std::istream& in);
void write_high_score_csv(std::ostream& out, const HighScoreRecord& rec);

// Filesystem wrappers; load returns nullopt if the file cannot be opened.
std::optional<HighScoreRecord> load_high_score_csv(const std::string& path);
bool save_high_score_csv(const std::string& path, const HighScoreRecord& rec);

} // namespace vclimb
