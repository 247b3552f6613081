#pragma once
#include <cstdint>
#include <optional>
#include <vclimb/config.hpp>
#include <vclimb/sim.hpp>

namespace vclimb {

enum class WindowState { Closed, Open };
enum class BounceQuality { Perfect, Good, Late, Missed };

const char* to_string(BounceQuality q);

struct BounceOutcome {
  BounceQuality quality = BounceQuality::Missed;
  double multiplier = 1.0;     // 1.0 for Missed (no velocity change)
  double elapsed_ms = 0.0;
  WallSide side = WallSide::Left;
  Vec2 velocity;               // player velocity after the outcome
  Vec2 position;
  double points = 0.0;         // 0 for Missed
};

struct BounceCounters {
  std::uint32_t total = 0;     // non-missed bounces
  std::uint32_t perfect = 0;
  std::uint32_t good = 0;
  std::uint32_t late = 0;
  std::uint32_t missed = 0;
};

// Timing window opened by a wall contact and closed by either a bounce input
// or a timeout. Exactly one outcome per opening.
class WallBounceMachine {
public:
  explicit WallBounceMachine(const WallBounceConfig& cfg) : cfg_(cfg) {}

  // Opens a window when CLOSED and the contact moves into the wall fast
  // enough. Returns false when the contact was ignored.
  bool on_contact(const WallContactEvent& e);

  // Bounce input transitioned to pressed. Reflects player.vel.x by the tier
  // multiplier. No-op (nullopt) when CLOSED or already past the window.
  std::optional<BounceOutcome> on_bounce_input(double now_ms, PlayerKinematics& player);

  // Level-triggered timeout check. Produces Missed once the window has
  // been open longer than its duration.
  std::optional<BounceOutcome> update(double now_ms, const PlayerKinematics& player);

  // Close without an outcome.
  void reset();

  WindowState state() const { return state_; }
  bool is_open() const { return state_ == WindowState::Open; }
  double open_since_ms() const { return open_ms_; }
  // Fraction of the window already consumed, 0 when CLOSED.
  double window_progress(double now_ms) const;

  const BounceCounters& counters() const { return counters_; }

  BounceQuality classify(double elapsed_ms) const;
  double multiplier_for(BounceQuality q) const;
  double points_for(BounceQuality q) const;

private:
  void count_(BounceQuality q);

  WallBounceConfig cfg_;
  WindowState state_{WindowState::Closed};
  double open_ms_{0.0};
  WallContactEvent contact_{};
  BounceCounters counters_{};
};

} // namespace vclimb
