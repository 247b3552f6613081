#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <vclimb/score.hpp>

using Catch::Approx;
using namespace vclimb;

TEST_CASE("Height points accrue per interval of new height") {
  ScoreConfig cfg;
  cfg.height_interval = 10.0;
  cfg.height_point_value = 1.0;
  cfg.milestones = {};
  HeightScorer s(cfg);
  s.reset(1000.0);

  REQUIRE(s.update(995.0).points == Approx(0.0));
  REQUIRE(s.update(958.0).points == Approx(4.0));
  REQUIRE(s.update(952.0).points == Approx(0.0));   // still below 50
  REQUIRE(s.update(950.0).points == Approx(1.0));
  REQUIRE(s.update(990.0).points == Approx(0.0));   // falling scores nothing
  REQUIRE(s.highest_height() == Approx(50.0));
  REQUIRE(s.score() == Approx(5.0));
}

TEST_CASE("Milestones pay their own value exactly once") {
  ScoreConfig cfg;
  cfg.milestones = {250.0, 100.0, 500.0};           // unsorted on purpose
  HeightScorer s(cfg);
  s.reset(1000.0);

  auto u1 = s.update(900.0);
  REQUIRE(u1.milestones.size() == 1);
  REQUIRE(u1.milestones[0] == Approx(100.0));
  REQUIRE(u1.points == Approx(10.0 + 100.0));

  auto u2 = s.update(745.0);
  REQUIRE(u2.milestones.size() == 1);
  REQUIRE(u2.points == Approx(15.0 + 250.0));

  s.update(900.0);
  auto u3 = s.update(740.0);
  REQUIRE(u3.milestones.empty());
  REQUIRE(s.milestones_reached() == 2);

  // A big jump can cross several milestones at once
  HeightScorer big(cfg);
  big.reset(0.0);
  auto u = big.update(-600.0);
  REQUIRE(u.milestones.size() == 3);
  REQUIRE(u.points == Approx(60.0 + 100.0 + 250.0 + 500.0));
}

TEST_CASE("reset starts a fresh height baseline") {
  HeightScorer s(ScoreConfig{});
  s.reset(1000.0);
  s.update(500.0);
  REQUIRE(s.score() > 0.0);

  s.reset(500.0);
  REQUIRE(s.score() == Approx(0.0));
  REQUIRE(s.highest_height() == Approx(0.0));
  REQUIRE(s.milestones_reached() == 0);
  REQUIRE(s.update(400.0).milestones.size() == 1);
}

TEST_CASE("update flags only a new best height as a record") {
  HeightScorer s(ScoreConfig{});
  s.reset(1000.0);
  REQUIRE_FALSE(s.update(1000.0).new_record);
  REQUIRE(s.update(996.0).new_record);              // below one interval still counts
  REQUIRE_FALSE(s.update(998.0).new_record);
  REQUIRE_FALSE(s.update(996.0).new_record);
  REQUIRE(s.update(990.0).new_record);
}
