#include <vclimb/combo.hpp>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace vclimb {

double combo_multiplier(std::size_t length, const ComboConfig& cfg) {
  if (length == 0) return 1.0;
  const double m = 1.0 + static_cast<double>(length - 1) * cfg.step;
  return std::min(cfg.max_multiplier, m);
}

ChainSummary ComboEngine::finalize_(ChainEnd end) {
  ChainSummary s;
  s.length = chain_.size();
  s.multiplier = combo_multiplier(chain_.size(), cfg_);
  s.score = running_total_;
  s.end = end;

  stats_.chain_score += running_total_;
  stats_.total_score += running_total_;
  stats_.longest_chain = std::max(stats_.longest_chain, chain_.size());
  ++stats_.total_chains;

  spdlog::debug("combo: chain x{} closed, {:.0f} points", s.length, s.score);
  chain_.clear();
  running_total_ = 0.0;
  return s;
}

std::optional<ChainSummary> ComboEngine::record_event(const ComboEvent& e) {
  if (!e.chain_eligible) {
    stats_.bonus_score += e.base_value;
    stats_.total_score += e.base_value;
    return std::nullopt;
  }

  std::optional<ChainSummary> closed;
  if (!chain_.empty() && e.timestamp_ms - last_event_ms_ > cfg_.window_ms) {
    closed = finalize_(ChainEnd::Lapsed);
  }

  chain_.push_back(e);
  running_total_ += e.base_value * combo_multiplier(chain_.size(), cfg_);
  last_event_ms_ = e.timestamp_ms;
  return closed;
}

std::optional<ChainSummary> ComboEngine::update(double now_ms) {
  if (chain_.empty() || now_ms - last_event_ms_ <= cfg_.window_ms) return std::nullopt;
  return finalize_(ChainEnd::Lapsed);
}

std::optional<ChainSummary> ComboEngine::finish_session() {
  if (chain_.empty()) return std::nullopt;
  return finalize_(ChainEnd::SessionEnd);
}

std::optional<ChainSummary> ComboEngine::cancel_for_reset() {
  std::optional<ChainSummary> dropped;
  if (!chain_.empty()) {
    ChainSummary s;
    s.length = chain_.size();
    s.multiplier = combo_multiplier(chain_.size(), cfg_);
    s.score = 0.0;
    s.end = ChainEnd::Reset;
    dropped = s;
  }
  chain_.clear();
  running_total_ = 0.0;
  last_event_ms_ = 0.0;
  stats_ = ComboStats{};
  return dropped;
}

double ComboEngine::time_remaining(double now_ms) const {
  if (chain_.empty()) return 0.0;
  return std::max(0.0, cfg_.window_ms - (now_ms - last_event_ms_));
}

} // namespace vclimb
