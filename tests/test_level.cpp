#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <vclimb/level.hpp>

using Catch::Approx;
using namespace vclimb;

static std::vector<Rect> platform_rects(const Level& level) {
  std::vector<Rect> out;
  level.platforms().for_each([&](Handle, const Platform& p){ out.push_back(p.rect); });
  return out;
}

TEST_CASE("Level starts with only the ground") {
  WorldConfig w;
  MagneticField field(MagneticConfig{});
  Level level(w, field, 1);

  REQUIRE(level.platforms().size() == 1);
  const Platform* g = level.platform(level.ground());
  REQUIRE(g != nullptr);
  REQUIRE(g->rect.top() == Approx(w.ground_y));
  REQUIRE(g->rect.left() <= w.wall_thickness);
  REQUIRE(g->rect.right() >= w.width - w.wall_thickness);
  REQUIRE(level.generated_count() == 0);
}

TEST_CASE("Level generation is deterministic for a seed") {
  WorldConfig w;
  MagneticField fa(MagneticConfig{});
  MagneticField fb(MagneticConfig{});
  Level a(w, fa, 42);
  Level b(w, fb, 42);
  a.update(0.0, 600.0);
  b.update(0.0, 600.0);

  auto ra = platform_rects(a);
  auto rb = platform_rects(b);
  REQUIRE(ra.size() == rb.size());
  REQUIRE(ra.size() > 10);
  for (std::size_t i = 0; i < ra.size(); ++i) {
    REQUIRE(ra[i].x == rb[i].x);
    REQUIRE(ra[i].y == rb[i].y);
  }
  REQUIRE(fa.platform_count() == fb.platform_count());

  // Same seed after reset reproduces the same tower
  fa.reset();
  a.reset(42);
  a.update(0.0, 600.0);
  auto again = platform_rects(a);
  REQUIRE(again.size() == ra.size());
  REQUIRE(again.back().x == ra.back().x);
}

TEST_CASE("Generated platforms stay between the walls and within the spacing") {
  WorldConfig w;
  MagneticField field(MagneticConfig{});
  Level level(w, field, 7);
  const auto made = level.update(-2000.0, -1400.0);
  REQUIRE(made == level.generated_count());
  REQUIRE(level.next_platform_y() <= -2000.0 - w.generate_distance);

  std::vector<double> ys;
  level.platforms().for_each([&](Handle h, const Platform& p) {
    if (h == level.ground()) return;
    REQUIRE(p.rect.left() >= w.wall_thickness);
    REQUIRE(p.rect.right() <= w.width - w.wall_thickness + 1e-9);
    ys.push_back(p.rect.top());
  });
  for (std::size_t i = 1; i < ys.size(); ++i) {
    const double gap = ys[i - 1] - ys[i];
    REQUIRE(gap >= w.vertical_spacing_min - 1e-9);
    REQUIRE(gap <= w.vertical_spacing_max + 1e-9);
  }
}

TEST_CASE("Cleanup removes platforms and their magnets far below the camera") {
  WorldConfig w;
  MagneticConfig mc;
  mc.spawn_interval = 1;
  mc.spawn_chance = 1.0;
  MagneticField field(mc);
  Level level(w, field, 3);
  level.update(0.0, 600.0);

  // Every generated platform turned magnetic and carries a live handle
  level.platforms().for_each([&](Handle h, const Platform& p) {
    if (h == level.ground()) return;
    REQUIRE(field.get(p.magnet) != nullptr);
  });
  REQUIRE(level.pickups().empty());
  REQUIRE(field.platform_count() == level.generated_count());

  const double bottom = -4000.0;
  level.update(bottom - 600.0, bottom);
  const double cutoff = bottom + w.cleanup_distance;

  REQUIRE(level.platform(level.ground()) == nullptr);
  level.platforms().for_each([&](Handle, const Platform& p) {
    REQUIRE(p.rect.top() <= cutoff);
  });
  field.for_each([&](Handle, const MagneticPlatform& m) {
    REQUIRE(m.pos.y <= cutoff);
  });
}

TEST_CASE("Pickups spawn on plain platforms and are collected once") {
  WorldConfig w;
  w.item_spawn_chance = 1.0;
  MagneticConfig mc;
  mc.spawn_interval = 100000;
  MagneticField field(mc);
  Level level(w, field, 11);
  level.update(0.0, 600.0);

  REQUIRE(level.pickups().size() == level.generated_count());

  Rect target;
  level.pickups().for_each([&](Handle, const ItemPickup& it){ target = it.rect; });
  const auto before = level.pickups().size();

  REQUIRE_FALSE(level.collect_pickup(Rect{-500.0, -500.0, 10.0, 10.0}));
  auto got = level.collect_pickup(target);
  REQUIRE(got);
  REQUIRE(*got == ItemType::PlatformSpawner);
  REQUIRE(level.pickups().size() == before - 1);
}

TEST_CASE("spawn_platform clamps into the shaft") {
  WorldConfig w;
  MagneticField field(MagneticConfig{});
  Level level(w, field, 1);

  auto h = level.spawn_platform(Rect{-50.0, 300.0, 192.0, 16.0});
  const Platform* p = level.platform(h);
  REQUIRE(p != nullptr);
  REQUIRE(p->spawned_by_item);
  REQUIRE(p->rect.left() == Approx(w.wall_thickness));
  REQUIRE(p->magnet == Handle{});

  auto h2 = level.spawn_platform(Rect{900.0, 300.0, 192.0, 16.0});
  REQUIRE(level.platform(h2)->rect.right() == Approx(w.width - w.wall_thickness));
}

TEST_CASE("reset clears the magnetic field with the platforms") {
  WorldConfig w;
  MagneticConfig mc;
  mc.spawn_interval = 1;
  mc.spawn_chance = 1.0;
  MagneticField field(mc);
  Level level(w, field, 5);
  level.update(0.0, 600.0);
  REQUIRE(field.platform_count() > 0);

  level.reset(5);
  REQUIRE(field.platform_count() == 0);
  REQUIRE(level.platforms().size() == 1);
  REQUIRE(level.pickups().empty());
}
