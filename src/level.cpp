#include <vclimb/level.hpp>
#include <algorithm>
#include <vector>
#include <spdlog/spdlog.h>

namespace vclimb {

static constexpr double kPickupSize = 28.0;

Level::Level(const WorldConfig& world, MagneticField& field, std::uint32_t seed)
  : world_(world), field_(field), rng_(seed) {
  reset(seed);
}

void Level::reset(std::uint32_t seed) {
  rng_.seed(seed);
  platforms_.clear();
  pickups_.clear();
  field_.clear_platforms();
  generated_ = 0;

  Platform ground;
  ground.rect = Rect{0.0, world_.ground_y, world_.width, world_.platform_height};
  ground_ = platforms_.insert(ground);
  next_y_ = world_.ground_y - world_.vertical_spacing_min;
}

void Level::generate_next_() {
  std::uniform_real_distribution<double> U(0.0, 1.0);

  const double lo = world_.wall_thickness;
  const double hi = std::max(lo, world_.width - world_.wall_thickness - world_.platform_width);
  const double x = lo + U(rng_) * (hi - lo);

  Platform p;
  p.rect = Rect{x, next_y_, world_.platform_width, world_.platform_height};
  if (auto m = field_.offer_platform(Vec2{p.rect.center().x, p.rect.top()}, rng_)) {
    p.magnet = *m;
  }
  platforms_.insert(p);

  if (p.magnet == Handle{} && U(rng_) < world_.item_spawn_chance) {
    ItemPickup pick;
    pick.rect = Rect{p.rect.center().x - kPickupSize * 0.5, p.rect.top() - kPickupSize - 4.0,
                     kPickupSize, kPickupSize};
    pickups_.insert(pick);
  }

  ++generated_;
  const double gap = world_.vertical_spacing_min
                   + U(rng_) * (world_.vertical_spacing_max - world_.vertical_spacing_min);
  next_y_ -= gap;
}

std::size_t Level::update(double camera_top, double camera_bottom) {
  std::size_t made = 0;
  while (next_y_ > camera_top - world_.generate_distance) {
    generate_next_();
    ++made;
  }

  const double cutoff = camera_bottom + world_.cleanup_distance;
  std::vector<Handle> doomed;
  platforms_.for_each([&](Handle h, const Platform& p) {
    if (p.rect.top() > cutoff) doomed.push_back(h);
  });
  for (Handle h : doomed) {
    if (const Platform* p = platforms_.get(h)) field_.remove(p->magnet);
    platforms_.erase(h);
  }

  std::vector<Handle> stale;
  pickups_.for_each([&](Handle h, const ItemPickup& it) {
    if (it.rect.top() > cutoff) stale.push_back(h);
  });
  for (Handle h : stale) pickups_.erase(h);

  if (!doomed.empty()) spdlog::debug("level: cleaned {} platforms below y={:.0f}", doomed.size(), cutoff);
  return made;
}

Handle Level::spawn_platform(const Rect& rect) {
  Platform p;
  p.rect = rect;
  p.rect.x = std::clamp(rect.x, world_.wall_thickness,
                        std::max(world_.wall_thickness, world_.width - world_.wall_thickness - rect.w));
  p.spawned_by_item = true;
  return platforms_.insert(p);
}

std::optional<ItemType> Level::collect_pickup(const Rect& player_box) {
  std::optional<Handle> hit;
  ItemType type = ItemType::PlatformSpawner;
  pickups_.for_each([&](Handle h, const ItemPickup& it) {
    if (!hit && it.rect.overlaps(player_box)) {
      hit = h;
      type = it.type;
    }
  });
  if (!hit) return std::nullopt;
  pickups_.erase(*hit);
  return type;
}

} // namespace vclimb
