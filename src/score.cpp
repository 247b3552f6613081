#include <vclimb/score.hpp>
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace vclimb {

void HeightScorer::reset(double start_y) {
  start_y_ = start_y;
  highest_height_ = 0.0;
  last_scored_height_ = 0.0;
  score_ = 0.0;
  next_milestone_ = 0;
  std::sort(cfg_.milestones.begin(), cfg_.milestones.end());
}

HeightScoreUpdate HeightScorer::update(double player_y) {
  HeightScoreUpdate out;
  const double height = start_y_ - player_y;
  if (height <= highest_height_) return out;
  highest_height_ = height;
  out.new_record = true;

  if (cfg_.height_interval > 0.0) {
    const double threshold = std::floor(height / cfg_.height_interval) * cfg_.height_interval;
    if (threshold > last_scored_height_) {
      out.points += (threshold - last_scored_height_) / cfg_.height_interval * cfg_.height_point_value;
      last_scored_height_ = threshold;
    }
  }

  while (next_milestone_ < cfg_.milestones.size() && height >= cfg_.milestones[next_milestone_]) {
    const double m = cfg_.milestones[next_milestone_++];
    out.milestones.push_back(m);
    out.points += m;
    spdlog::info("score: height milestone {:.0f}px", m);
  }

  score_ += out.points;
  return out;
}

} // namespace vclimb
