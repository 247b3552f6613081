#include <catch2/catch_test_macros.hpp>
#include <vector>

#include <vclimb/slot_map.hpp>

using namespace vclimb;

TEST_CASE("SlotMap insert/get/erase") {
  SlotMap<int> m;
  auto a = m.insert(10);
  auto b = m.insert(20);
  REQUIRE(m.size() == 2);
  REQUIRE(*m.get(a) == 10);
  REQUIRE(*m.get(b) == 20);

  REQUIRE(m.erase(a));
  REQUIRE_FALSE(m.erase(a));        // already gone
  REQUIRE(m.get(a) == nullptr);
  REQUIRE(m.size() == 1);
}

TEST_CASE("SlotMap reuses slots with a new generation") {
  SlotMap<int> m;
  auto a = m.insert(1);
  m.erase(a);
  auto b = m.insert(2);

  REQUIRE(b.index == a.index);
  REQUIRE(b.generation != a.generation);
  REQUIRE(m.get(a) == nullptr);     // stale handle never resolves to the new entry
  REQUIRE(*m.get(b) == 2);
}

TEST_CASE("SlotMap default handle is always stale") {
  SlotMap<int> m;
  m.insert(5);
  REQUIRE_FALSE(m.contains(Handle{}));
  REQUIRE(m.get(Handle{}) == nullptr);
}

TEST_CASE("SlotMap clear keeps old handles stale") {
  SlotMap<int> m;
  auto a = m.insert(1);
  auto b = m.insert(2);
  m.clear();
  REQUIRE(m.empty());
  REQUIRE_FALSE(m.contains(a));
  REQUIRE_FALSE(m.contains(b));

  auto c = m.insert(3);
  REQUIRE_FALSE(m.contains(a));
  REQUIRE_FALSE(m.contains(b));
  REQUIRE(*m.get(c) == 3);
}

TEST_CASE("SlotMap for_each visits live entries only") {
  SlotMap<int> m;
  auto a = m.insert(1);
  m.insert(2);
  m.insert(3);
  m.erase(a);

  int sum = 0;
  std::size_t n = 0;
  m.for_each([&](Handle, int& v){ sum += v; ++n; });
  REQUIRE(n == 2);
  REQUIRE(sum == 5);
}
