#pragma once
#include <cstddef>
#include <optional>
#include <random>
#include <utility>
#include <vector>
#include <vclimb/config.hpp>
#include <vclimb/geom.hpp>
#include <vclimb/slot_map.hpp>
#include <vclimb/timer_queue.hpp>

namespace vclimb {

enum class Polarity { Attract, Repel };

inline constexpr double kMaxCharge = 100.0;

struct MagneticPlatform {
  Vec2 pos;                                // field center (px)
  Polarity polarity = Polarity::Attract;
  double strength = 150.0;
  double radius = 120.0;
  double charge = 0.0;                     // [0, kMaxCharge]
  std::optional<double> last_chain_ms;     // unset until first charged
  bool active = true;
};

struct FieldForce {
  Vec2 force;
  bool in_field = false;
};

// strength * (1 - (d/r)^2) toward the platform for Attract, away for Repel.
// Zero (and in_field=false) outside the radius, for r <= 0, or when inactive.
FieldForce force_at(const MagneticPlatform& p, const Vec2& player_pos);

// Rejects negative or non-finite amounts (returns false, platform untouched).
// Charge is clamped to kMaxCharge and the chain timestamp stamped with now.
bool add_charge(MagneticPlatform& p, double amount, double now_ms);

// True when either platform was charged within window_ms of now.
bool can_chain_with(const MagneticPlatform& a, const MagneticPlatform& b,
                    double now_ms, double window_ms);

// Resets charge to zero and returns the prior value.
double discharge(MagneticPlatform& p);

struct FieldSample {
  Vec2 force;                  // plain vector sum, no cap
  std::size_t field_count = 0;
};

struct ChainExtension {
  Handle from{};
  Handle to{};
  std::size_t chain_length = 0;
  double total_charge = 0.0;
  double points = 0.0;
};

struct ChainCompletion {
  std::size_t chain_length = 0;
  double charge_released = 0.0;
  double bonus_points = 0.0;   // 0 for chains shorter than 3
};

struct LandingOutcome {
  bool magnetic = false;       // false if the handle no longer resolves
  std::optional<ChainCompletion> completed;
  std::optional<ChainExtension> extended;
};

// Owns every magnetic platform of the session plus the running magnetic chain.
// Platforms are addressed by generation-checked handles; delayed reactivations
// go through a timer queue and no-op once their platform is gone.
class MagneticField {
public:
  explicit MagneticField(const MagneticConfig& cfg) : cfg_(cfg) {}

  Handle spawn(const MagneticPlatform& p);

  // Spawn policy hook called for every generated platform. Returns the new
  // magnetic handle when this platform turns magnetic.
  std::optional<Handle> offer_platform(const Vec2& center, std::mt19937& rng);

  bool remove(Handle h);

  FieldSample total_force(const Vec2& player_pos) const;

  LandingOutcome on_landing(Handle h, double now_ms);

  // Fire due reactivations, then complete the chain if it timed out.
  std::optional<ChainCompletion> update(double now_ms);

  // Destroy platforms more than cleanup_distance below player_y.
  std::size_t cleanup_below(double player_y);

  // Zero every charge, drop the chain and invalidate pending timers.
  void reset();
  // Destroy every platform (generations survive).
  void clear_platforms();

  const MagneticPlatform* get(Handle h) const { return platforms_.get(h); }
  MagneticPlatform*       get(Handle h)       { return platforms_.get(h); }

  template <class F>
  void for_each(F&& f) const { platforms_.for_each(std::forward<F>(f)); }

  std::size_t platform_count() const { return platforms_.size(); }
  std::size_t active_count() const;
  std::size_t chain_length() const { return chain_.size(); }
  double chain_charge() const { return chain_total_charge_; }
  std::size_t pending_reactivations() const { return reactivations_.size(); }

private:
  ChainCompletion complete_chain_(double now_ms);

  MagneticConfig cfg_;
  SlotMap<MagneticPlatform> platforms_;
  TimerQueue<Handle> reactivations_;

  std::vector<Handle> chain_;
  double chain_total_charge_{0.0};
  double chain_last_link_ms_{0.0};

  std::size_t offered_{0};
  std::size_t last_spawn_at_{0};
};

} // namespace vclimb
