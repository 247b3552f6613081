#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <vclimb/camera.hpp>

using Catch::Approx;
using namespace vclimb;

TEST_CASE("Camera follows new heights and never descends") {
  WorldConfig w;
  w.view_height = 600.0;
  Camera cam(w, 50.0);
  cam.reset(0.0);
  REQUIRE(cam.bottom() == Approx(600.0));

  cam.update(1.0 / 60.0, 500.0);          // player low in view: no move
  REQUIRE(cam.top() == Approx(0.0));

  cam.update(1.0 / 60.0, 100.0);
  REQUIRE(cam.top() == Approx(100.0 - 600.0 * Camera::kFollowFraction));

  const double top = cam.top();
  cam.update(1.0 / 60.0, 300.0);          // falling back down
  REQUIRE(cam.top() == Approx(top));
}

TEST_CASE("Auto-scroll keeps rising when the player does not") {
  WorldConfig w;
  w.view_height = 600.0;
  Camera cam(w, 50.0);
  cam.reset(0.0);
  REQUIRE_FALSE(cam.auto_scrolling());

  cam.enable_auto_scroll();
  cam.update(1.0, 500.0);
  REQUIRE(cam.top() == Approx(-50.0));
  cam.update(0.5, 500.0);
  REQUIRE(cam.top() == Approx(-75.0));
  REQUIRE(cam.bottom() == Approx(525.0));

  // A fast climber still pulls the camera faster than the scroll
  cam.update(0.1, -1000.0);
  REQUIRE(cam.top() == Approx(-1180.0));

  cam.reset(200.0);
  REQUIRE_FALSE(cam.auto_scrolling());
  REQUIRE(cam.top() == Approx(200.0));
}
