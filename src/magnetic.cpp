#include <vclimb/magnetic.hpp>
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace vclimb {

FieldForce force_at(const MagneticPlatform& p, const Vec2& player_pos) {
  if (!p.active || !(p.radius > 0.0)) return {};

  const Vec2 to_platform = p.pos - player_pos;
  const double d = to_platform.length();
  if (d > p.radius) return {};

  const double ratio = d / p.radius;
  const double magnitude = p.strength * (1.0 - ratio * ratio);
  const Vec2 dir = d > 0.0 ? to_platform * (1.0 / d) : Vec2{};
  const double sign = p.polarity == Polarity::Attract ? 1.0 : -1.0;

  return FieldForce{dir * (magnitude * sign), true};
}

bool add_charge(MagneticPlatform& p, double amount, double now_ms) {
  if (!std::isfinite(amount) || amount < 0.0) return false;
  p.charge = std::clamp(p.charge + amount, 0.0, kMaxCharge);
  p.last_chain_ms = now_ms;
  return true;
}

bool can_chain_with(const MagneticPlatform& a, const MagneticPlatform& b,
                    double now_ms, double window_ms) {
  auto recent = [&](const MagneticPlatform& p) {
    return p.last_chain_ms.has_value() && (now_ms - *p.last_chain_ms) <= window_ms;
  };
  return recent(a) || recent(b);
}

double discharge(MagneticPlatform& p) {
  const double released = p.charge;
  p.charge = 0.0;
  return released;
}

// ---------------------------------------------------------------------------

Handle MagneticField::spawn(const MagneticPlatform& p) {
  MagneticPlatform copy = p;
  copy.charge = std::clamp(copy.charge, 0.0, kMaxCharge);
  return platforms_.insert(copy);
}

std::optional<Handle> MagneticField::offer_platform(const Vec2& center, std::mt19937& rng) {
  ++offered_;
  std::uniform_real_distribution<double> U(0.0, 1.0);

  const bool interval_reached =
      offered_ - last_spawn_at_ >= static_cast<std::size_t>(std::max(cfg_.spawn_interval, 1));
  const double stage_bonus = std::min(0.2, static_cast<double>(offered_) / 1000.0);
  const double roll = U(rng);
  const double bonus_roll = U(rng);
  if (!interval_reached || !(roll < cfg_.spawn_chance || bonus_roll < stage_bonus)) {
    return std::nullopt;
  }

  std::size_t attract = 0, repel = 0;
  platforms_.for_each([&](Handle, const MagneticPlatform& m) {
    if (!m.active) return;
    if (m.polarity == Polarity::Attract) ++attract; else ++repel;
  });

  MagneticPlatform mp;
  mp.pos = center;
  mp.polarity = (attract <= repel + 1 && U(rng) < 0.6) ? Polarity::Attract : Polarity::Repel;
  mp.strength = cfg_.strength_min + U(rng) * (cfg_.strength_max - cfg_.strength_min);
  mp.radius = cfg_.radius_min + U(rng) * (cfg_.radius_max - cfg_.radius_min);

  last_spawn_at_ = offered_;
  const Handle h = platforms_.insert(mp);
  spdlog::debug("magnetic: spawned {} platform at ({:.0f}, {:.0f}) strength {:.0f} radius {:.0f}",
                mp.polarity == Polarity::Attract ? "attract" : "repel",
                center.x, center.y, mp.strength, mp.radius);
  return h;
}

bool MagneticField::remove(Handle h) {
  if (!platforms_.erase(h)) return false;
  chain_.erase(std::remove(chain_.begin(), chain_.end(), h), chain_.end());
  return true;
}

FieldSample MagneticField::total_force(const Vec2& player_pos) const {
  FieldSample s;
  platforms_.for_each([&](Handle, const MagneticPlatform& p) {
    const auto f = force_at(p, player_pos);
    if (!f.in_field) return;
    s.force += f.force;
    ++s.field_count;
  });
  return s;
}

LandingOutcome MagneticField::on_landing(Handle h, double now_ms) {
  LandingOutcome out;
  MagneticPlatform* p = platforms_.get(h);
  if (!p) return out;
  out.magnetic = true;

  // Linkability is judged against the previous platform before the new one
  // picks up its own charge.
  bool link = false;
  Handle prev{};
  if (!chain_.empty()) {
    prev = chain_.back();
    const MagneticPlatform* last = platforms_.get(prev);
    if (last && prev != h) {
      const double d = distance(last->pos, p->pos);
      link = can_chain_with(*last, *p, now_ms, cfg_.chain_window_ms)
          && d >= cfg_.min_chain_distance && d <= cfg_.max_chain_distance;
    }
  }

  if (!link && !chain_.empty()) out.completed = complete_chain_(now_ms);

  p->active = true;
  add_charge(*p, cfg_.landing_charge, now_ms);

  if (link) {
    chain_.push_back(h);
    chain_total_charge_ += p->charge;
    chain_last_link_ms_ = now_ms;

    ChainExtension ext;
    ext.from = prev;
    ext.to = h;
    ext.chain_length = chain_.size();
    ext.total_charge = chain_total_charge_;
    ext.points = std::floor(std::pow(static_cast<double>(chain_.size()), 1.8) * 100.0
                            * (1.0 + chain_total_charge_ / 100.0));
    out.extended = ext;
    return out;
  }

  chain_.push_back(h);
  chain_total_charge_ = p->charge;
  chain_last_link_ms_ = now_ms;
  return out;
}

std::optional<ChainCompletion> MagneticField::update(double now_ms) {
  reactivations_.poll(now_ms, [&](const Handle& h) {
    if (MagneticPlatform* p = platforms_.get(h)) p->active = true;
  });

  if (!chain_.empty() && now_ms - chain_last_link_ms_ > cfg_.chain_timeout_ms) {
    return complete_chain_(now_ms);
  }
  return std::nullopt;
}

ChainCompletion MagneticField::complete_chain_(double now_ms) {
  ChainCompletion c;
  c.chain_length = chain_.size();
  for (Handle h : chain_) {
    MagneticPlatform* p = platforms_.get(h);
    if (!p) continue;
    c.charge_released += discharge(*p);
    p->active = false;
    reactivations_.schedule(now_ms + cfg_.reactivate_delay_ms, h);
  }
  if (c.chain_length >= 3) {
    c.bonus_points = static_cast<double>(c.chain_length) * cfg_.completion_bonus_per_platform;
    spdlog::info("magnetic: chain of {} complete, +{:.0f} bonus", c.chain_length, c.bonus_points);
  }
  chain_.clear();
  chain_total_charge_ = 0.0;
  return c;
}

std::size_t MagneticField::cleanup_below(double player_y) {
  std::vector<Handle> doomed;
  platforms_.for_each([&](Handle h, const MagneticPlatform& p) {
    if (p.pos.y > player_y + cfg_.cleanup_distance) doomed.push_back(h);
  });
  for (Handle h : doomed) remove(h);
  return doomed.size();
}

void MagneticField::reset() {
  platforms_.for_each([](Handle, MagneticPlatform& p) {
    p.charge = 0.0;
    p.last_chain_ms.reset();
    p.active = true;
  });
  reactivations_.clear();
  chain_.clear();
  chain_total_charge_ = 0.0;
  chain_last_link_ms_ = 0.0;
  offered_ = 0;
  last_spawn_at_ = 0;
}

void MagneticField::clear_platforms() {
  platforms_.clear();
  chain_.clear();
  chain_total_charge_ = 0.0;
}

std::size_t MagneticField::active_count() const {
  std::size_t n = 0;
  platforms_.for_each([&](Handle, const MagneticPlatform& p) { if (p.active) ++n; });
  return n;
}

} // namespace vclimb
