#include <catch2/catch_test_macros.hpp>
#include <vector>

#include <vclimb/slot_map.hpp>
#include <vclimb/timer_queue.hpp>

using namespace vclimb;

TEST_CASE("TimerQueue fires due timers once, earliest first") {
  TimerQueue<int> q;
  q.schedule(300.0, 3);
  q.schedule(100.0, 1);
  q.schedule(200.0, 2);

  std::vector<int> fired;
  REQUIRE(q.poll(50.0, [&](int v){ fired.push_back(v); }) == 0);
  REQUIRE(fired.empty());

  REQUIRE(q.poll(250.0, [&](int v){ fired.push_back(v); }) == 2);
  REQUIRE(fired == std::vector<int>{1, 2});

  // Already fired timers never fire again
  REQUIRE(q.poll(250.0, [&](int v){ fired.push_back(v); }) == 0);
  REQUIRE(q.poll(1000.0, [&](int v){ fired.push_back(v); }) == 1);
  REQUIRE(fired == std::vector<int>{1, 2, 3});
  REQUIRE(q.empty());
}

TEST_CASE("TimerQueue cancel removes a pending timer") {
  TimerQueue<int> q;
  auto id = q.schedule(100.0, 7);
  q.schedule(100.0, 8);
  REQUIRE(q.cancel(id));
  REQUIRE_FALSE(q.cancel(id));

  std::vector<int> fired;
  q.poll(100.0, [&](int v){ fired.push_back(v); });
  REQUIRE(fired == std::vector<int>{8});
}

TEST_CASE("TimerQueue clear invalidates everything scheduled before it") {
  TimerQueue<int> q;
  auto id = q.schedule(100.0, 1);
  q.clear();
  REQUIRE(q.empty());
  REQUIRE_FALSE(q.cancel(id));

  int count = 0;
  q.poll(1000.0, [&](int){ ++count; });
  REQUIRE(count == 0);
}

TEST_CASE("Timer payload handle no-ops once its entity is destroyed") {
  SlotMap<int> entities;
  auto h = entities.insert(42);

  TimerQueue<Handle> q;
  q.schedule(3000.0, h);
  entities.erase(h);
  entities.insert(99);              // slot reused by someone else

  int touched = 0;
  q.poll(3000.0, [&](const Handle& fired){
    if (int* v = entities.get(fired)) { *v = 0; ++touched; }
  });
  REQUIRE(touched == 0);
}
