#include <catch2/catch_test_macros.hpp>
#include <string>
#include <variant>
#include <vector>

#include <vclimb/events.hpp>

using namespace vclimb;

TEST_CASE("NotificationBus delivers in subscription order") {
  NotificationBus bus;
  std::string order;
  bus.subscribe([&](const Notification&) { order += "a"; });
  bus.subscribe([&](const Notification&) { order += "b"; });
  REQUIRE(bus.consumer_count() == 2);

  bus.publish(ChainCompletedNote{3, 120.0});
  bus.publish(ChainBrokenNote{2, 0.0});
  REQUIRE(order == "abab");
}

TEST_CASE("Consumer subscribed during delivery hears the next notification") {
  NotificationBus bus;
  std::vector<std::size_t> seen_by_late;
  int first_calls = 0;

  bus.subscribe([&](const Notification&) {
    ++first_calls;
    // Enough subscriptions to force the storage to grow mid-delivery
    for (int i = 0; i < 64; ++i) bus.subscribe([](const Notification&) {});
    bus.subscribe([&](const Notification& m) {
      if (const auto* c = std::get_if<ChainCompletedNote>(&m)) seen_by_late.push_back(c->length);
    });
  });

  bus.publish(ChainCompletedNote{1, 10.0});
  REQUIRE(first_calls == 1);
  REQUIRE(seen_by_late.empty());
  REQUIRE(bus.consumer_count() == 66);

  bus.publish(ChainCompletedNote{2, 20.0});
  REQUIRE(first_calls == 2);
  REQUIRE(seen_by_late == std::vector<std::size_t>{2});
}
