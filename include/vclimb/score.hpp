#pragma once
#include <cstddef>
#include <vector>
#include <vclimb/config.hpp>

namespace vclimb {

struct HeightScoreUpdate {
  double points = 0.0;                  // height points + milestone bonuses this call
  std::vector<double> milestones;       // reached this call
  bool new_record = false;              // player_y set a new best height
};

// Height component of the session score: height_point_value per
// height_interval px of new height, plus each milestone's value once.
class HeightScorer {
public:
  explicit HeightScorer(const ScoreConfig& cfg) : cfg_(cfg) {}

  void reset(double start_y);
  HeightScoreUpdate update(double player_y);

  double highest_height() const { return highest_height_; }
  double score() const { return score_; }
  std::size_t milestones_reached() const { return next_milestone_; }

private:
  ScoreConfig cfg_;
  double start_y_{0.0};
  double highest_height_{0.0};
  double last_scored_height_{0.0};
  double score_{0.0};
  std::size_t next_milestone_{0};
};

} // namespace vclimb
