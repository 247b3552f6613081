#include <vclimb/session.hpp>
#include <cmath>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>
#include <vclimb/csv.hpp>

namespace vclimb {

RecordFlags apply_session(HighScoreRecord& rec, const SessionStats& s) {
  RecordFlags f;
  if (s.final_height > rec.best_height)    { rec.best_height = s.final_height; f.height = true; }
  if (s.total_score > rec.best_score)      { rec.best_score = s.total_score; f.score = true; }
  if (s.survival_ms > rec.best_survival_ms){ rec.best_survival_ms = s.survival_ms; f.survival = true; }
  const double chain = static_cast<double>(s.longest_chain);
  if (chain > rec.best_combo)              { rec.best_combo = chain; f.combo = true; }
  ++rec.total_games_played;
  return f;
}

HighScoreRecord high_score_from_csv_stream(std::istream& in) {
  HighScoreRecord rec;
  std::string line;
  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split_fields(raw, ',');
    if (cols.size() < 2) continue;
    const auto v = parse_double(cols[1]);
    if (!v || *v < 0.0) continue;   // also skips a "key,value" header

    const std::string& k = cols[0];
    if (k == "bestHeight")            rec.best_height = *v;
    else if (k == "bestScore")        rec.best_score = *v;
    else if (k == "bestSurvivalTime") rec.best_survival_ms = *v;
    else if (k == "bestCombo")        rec.best_combo = *v;
    else if (k == "totalGamesPlayed") {
      if (*v > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) continue;
      rec.total_games_played = static_cast<std::uint32_t>(std::floor(*v));
    }
  }
  return rec;
}

void write_high_score_csv(std::ostream& out, const HighScoreRecord& rec) {
  out << "key,value\n";
  out << "bestHeight," << rec.best_height << "\n";
  out << "bestScore," << rec.best_score << "\n";
  out << "bestSurvivalTime," << rec.best_survival_ms << "\n";
  out << "bestCombo," << rec.best_combo << "\n";
  out << "totalGamesPlayed," << rec.total_games_played << "\n";
}

std::optional<HighScoreRecord> load_high_score_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return high_score_from_csv_stream(f);
}

bool save_high_score_csv(const std::string& path, const HighScoreRecord& rec) {
  std::ofstream f(path, std::ios::trunc);
  if (!f) {
    spdlog::warn("high score: cannot write '{}'", path);
    return false;
  }
  f.precision(17);
  write_high_score_csv(f, rec);
  return static_cast<bool>(f);
}

} // namespace vclimb
