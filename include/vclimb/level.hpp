#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vclimb/config.hpp>
#include <vclimb/inventory.hpp>
#include <vclimb/magnetic.hpp>
#include <vclimb/sim.hpp>
#include <vclimb/slot_map.hpp>

namespace vclimb {

struct ItemPickup {
  Rect rect;
  ItemType type = ItemType::PlatformSpawner;
};

// Procedural tower: a wall-to-wall ground plus one platform per level going
// up. Deterministic for a given seed. Every generated platform is offered to
// the magnetic field, which may turn it magnetic.
class Level {
public:
  Level(const WorldConfig& world, MagneticField& field, std::uint32_t seed);

  // Drop everything and rebuild from seed (ground only; call update to fill).
  void reset(std::uint32_t seed);

  // Keep platforms generate_distance above camera_top, destroy those
  // cleanup_distance below camera_bottom. Returns platforms generated.
  std::size_t update(double camera_top, double camera_bottom);

  // Item-spawned platform; never magnetic.
  Handle spawn_platform(const Rect& rect);

  // Remove and return the first pickup overlapping the box.
  std::optional<ItemType> collect_pickup(const Rect& player_box);

  const SlotMap<Platform>& platforms() const { return platforms_; }
  const SlotMap<ItemPickup>& pickups() const { return pickups_; }
  const Platform* platform(Handle h) const { return platforms_.get(h); }

  Handle ground() const { return ground_; }
  double ground_top() const { return world_.ground_y; }
  double next_platform_y() const { return next_y_; }
  std::size_t generated_count() const { return generated_; }

private:
  void generate_next_();

  WorldConfig world_;
  MagneticField& field_;
  std::mt19937 rng_;

  SlotMap<Platform> platforms_;
  SlotMap<ItemPickup> pickups_;
  Handle ground_{};
  double next_y_{0.0};
  std::size_t generated_{0};
};

} // namespace vclimb
