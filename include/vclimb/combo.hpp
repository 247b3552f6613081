#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <vclimb/config.hpp>

namespace vclimb {

enum class ComboSource {
  WallBounce, AirTime, MultiPlatformJump, SpeedBonus, MagneticLink, MagneticCompletion, Other
};

struct ComboEvent {
  double timestamp_ms = 0.0;
  double base_value = 0.0;
  bool chain_eligible = true;
  ComboSource source = ComboSource::Other;
};

enum class ChainEnd { Lapsed, SessionEnd, Reset };

// A finalized chain. For ChainEnd::Reset the score was not credited.
struct ChainSummary {
  std::size_t length = 0;
  double multiplier = 1.0;
  double score = 0.0;
  ChainEnd end = ChainEnd::Lapsed;
};

struct ComboStats {
  double total_score = 0.0;    // committed chains + face-value events
  double chain_score = 0.0;
  double bonus_score = 0.0;    // non-chain-eligible events
  std::size_t longest_chain = 0;
  std::size_t total_chains = 0;
};

// min(max_multiplier, 1 + (length - 1) * step); 1.0 for length 0.
double combo_multiplier(std::size_t length, const ComboConfig& cfg);

// Folds scoring events into time-windowed chains. A chain closes only on a
// lapse of the window (seen on the next event or an idle check) or at
// session end.
class ComboEngine {
public:
  explicit ComboEngine(const ComboConfig& cfg) : cfg_(cfg) {}

  // Returns the chain this event finalized, if any.
  std::optional<ChainSummary> record_event(const ComboEvent& e);

  // Idle check.
  std::optional<ChainSummary> update(double now_ms);

  // Commit the open chain (session end).
  std::optional<ChainSummary> finish_session();

  // Drop the open chain without crediting it and clear all stats.
  std::optional<ChainSummary> cancel_for_reset();

  ComboStats get_stats() const { return stats_; }

  bool has_open_chain() const { return !chain_.empty(); }
  std::size_t current_length() const { return chain_.size(); }
  double current_multiplier() const { return combo_multiplier(chain_.size(), cfg_); }
  double current_chain_total() const { return running_total_; }
  double time_remaining(double now_ms) const;

private:
  ChainSummary finalize_(ChainEnd end);

  ComboConfig cfg_;
  std::vector<ComboEvent> chain_;
  double running_total_{0.0};
  double last_event_ms_{0.0};
  ComboStats stats_{};
};

} // namespace vclimb
