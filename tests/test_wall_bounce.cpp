#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <vclimb/wall_bounce.hpp>

using Catch::Approx;
using namespace vclimb;

static WallContactEvent left_contact(double t, double vx) {
  WallContactEvent e;
  e.side = WallSide::Left;
  e.position = Vec2{64.0, 300.0};
  e.timestamp_ms = t;
  e.velocity = Vec2{vx, -100.0};
  return e;
}

TEST_CASE("Bounce inside the perfect window reflects and boosts vx") {
  WallBounceMachine m(WallBounceConfig{});
  PlayerKinematics p;
  p.vel = Vec2{0.0, -100.0};        // the wall already zeroed vx

  REQUIRE(m.on_contact(left_contact(0.0, -400.0)));
  REQUIRE(m.is_open());

  auto o = m.on_bounce_input(90.0, p);
  REQUIRE(o);
  REQUIRE(o->quality == BounceQuality::Perfect);
  REQUIRE(o->multiplier == Approx(1.3));
  REQUIRE(o->points == Approx(150.0));
  REQUIRE(p.vel.x == Approx(520.0));
  REQUIRE(p.vel.y == Approx(-100.0));  // vertical untouched
  REQUIRE(p.facing == 1);
  REQUIRE_FALSE(m.is_open());
}

TEST_CASE("Bounce tiers follow elapsed time") {
  WallBounceConfig cfg;
  WallBounceMachine m(cfg);
  REQUIRE(m.classify(0.0) == BounceQuality::Perfect);
  REQUIRE(m.classify(100.0) == BounceQuality::Perfect);
  REQUIRE(m.classify(150.0) == BounceQuality::Good);
  REQUIRE(m.classify(200.0) == BounceQuality::Good);
  REQUIRE(m.classify(240.0) == BounceQuality::Late);

  PlayerKinematics p;
  REQUIRE(m.on_contact(left_contact(1000.0, -200.0)));
  auto o = m.on_bounce_input(1230.0, p);
  REQUIRE(o);
  REQUIRE(o->quality == BounceQuality::Late);
  REQUIRE(p.vel.x == Approx(200.0 * cfg.late_multiplier));
}

TEST_CASE("One outcome per window opening") {
  WallBounceMachine m(WallBounceConfig{});
  PlayerKinematics p;
  REQUIRE(m.on_contact(left_contact(0.0, -400.0)));

  // A second contact while open is ignored
  REQUIRE_FALSE(m.on_contact(left_contact(20.0, -900.0)));

  REQUIRE(m.on_bounce_input(50.0, p));
  REQUIRE_FALSE(m.on_bounce_input(60.0, p));
  REQUIRE_FALSE(m.update(1000.0, p));     // no Missed after a bounce

  const auto& c = m.counters();
  REQUIRE(c.total == 1);
  REQUIRE(c.perfect == 1);
  REQUIRE(c.missed == 0);
}

TEST_CASE("Window timeout yields Missed with no velocity change") {
  WallBounceMachine m(WallBounceConfig{});
  PlayerKinematics p;
  p.vel = Vec2{0.0, 50.0};
  REQUIRE(m.on_contact(left_contact(0.0, -400.0)));

  REQUIRE_FALSE(m.update(250.0, p));      // boundary still open
  auto o = m.update(251.0, p);
  REQUIRE(o);
  REQUIRE(o->quality == BounceQuality::Missed);
  REQUIRE(o->multiplier == Approx(1.0));
  REQUIRE(o->points == Approx(0.0));
  REQUIRE(p.vel.x == Approx(0.0));
  REQUIRE_FALSE(m.is_open());
  REQUIRE(m.counters().missed == 1);
  REQUIRE(m.counters().total == 0);
}

TEST_CASE("Late press past the window does not bounce") {
  WallBounceMachine m(WallBounceConfig{});
  PlayerKinematics p;
  REQUIRE(m.on_contact(left_contact(0.0, -400.0)));

  REQUIRE_FALSE(m.on_bounce_input(300.0, p));
  REQUIRE(p.vel.x == Approx(0.0));
  REQUIRE(m.is_open());                   // timeout is reported by update
  auto o = m.update(300.0, p);
  REQUIRE(o);
  REQUIRE(o->quality == BounceQuality::Missed);
}

TEST_CASE("Slow contacts and contacts away from the wall are ignored") {
  WallBounceMachine m(WallBounceConfig{});
  REQUIRE_FALSE(m.on_contact(left_contact(0.0, -10.0)));
  REQUIRE_FALSE(m.on_contact(left_contact(0.0, 300.0)));

  WallContactEvent right;
  right.side = WallSide::Right;
  right.velocity = Vec2{-300.0, 0.0};
  REQUIRE_FALSE(m.on_contact(right));
  right.velocity = Vec2{300.0, 0.0};
  REQUIRE(m.on_contact(right));
}

TEST_CASE("Right wall bounce sends the player left") {
  WallBounceMachine m(WallBounceConfig{});
  PlayerKinematics p;
  WallContactEvent e;
  e.side = WallSide::Right;
  e.timestamp_ms = 500.0;
  e.velocity = Vec2{300.0, 0.0};
  REQUIRE(m.on_contact(e));

  auto o = m.on_bounce_input(650.0, p);
  REQUIRE(o);
  REQUIRE(o->quality == BounceQuality::Good);
  REQUIRE(o->side == WallSide::Right);
  REQUIRE(p.vel.x == Approx(-300.0 * 1.05));
  REQUIRE(p.facing == -1);
}

TEST_CASE("Input with no open window is a no-op") {
  WallBounceMachine m(WallBounceConfig{});
  PlayerKinematics p;
  p.vel = Vec2{123.0, 0.0};
  REQUIRE_FALSE(m.on_bounce_input(10.0, p));
  REQUIRE_FALSE(m.update(10.0, p));
  REQUIRE(p.vel.x == Approx(123.0));
  REQUIRE(m.window_progress(10.0) == Approx(0.0));
}

TEST_CASE("window_progress and reset") {
  WallBounceMachine m(WallBounceConfig{});
  REQUIRE(m.on_contact(left_contact(100.0, -400.0)));
  REQUIRE(m.window_progress(225.0) == Approx(0.5));
  REQUIRE(m.window_progress(1000.0) == Approx(1.0));

  m.reset();
  REQUIRE_FALSE(m.is_open());
  REQUIRE(m.counters().missed == 0);
  REQUIRE(m.on_contact(left_contact(2000.0, -400.0)));
}
