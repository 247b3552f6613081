#pragma once
#include <cstddef>
#include <deque>
#include <functional>
#include <utility>
#include <variant>
#include <vclimb/death_line.hpp>
#include <vclimb/geom.hpp>
#include <vclimb/slot_map.hpp>
#include <vclimb/wall_bounce.hpp>

namespace vclimb {

// One-way notifications from the simulation to presentation collaborators.

struct WallBounceNote {
  BounceQuality quality = BounceQuality::Missed;
  Vec2 velocity;
  Vec2 position;
};

struct ChainCompletedNote {
  std::size_t length = 0;
  double score_delta = 0.0;
};

struct ChainBrokenNote {
  std::size_t length = 0;
  double score_delta = 0.0;     // always 0: a broken chain is not credited
};

struct MagneticChainNote {
  Handle from{};
  Handle to{};
  std::size_t chain_length = 0;
  double total_charge = 0.0;
};

struct DeathLineActivatedNote {
  double y = 0.0;
  double at_ms = 0.0;
};

struct DeathLineWarningNote {
  double distance = 0.0;
  double urgency = 0.0;
  Vec2 position;
};

struct GameOverNote {
  GameOverCause cause = GameOverCause::DeathLine;
  double survival_ms = 0.0;
  double final_height = 0.0;
  Vec2 position;
};

using Notification = std::variant<WallBounceNote,
                                  ChainCompletedNote,
                                  ChainBrokenNote,
                                  MagneticChainNote,
                                  DeathLineActivatedNote,
                                  DeathLineWarningNote,
                                  GameOverNote>;

// Ordered list of consumers. Delivery is synchronous, in subscription order.
// A consumer subscribed during delivery first hears the next notification.
class NotificationBus {
public:
  using Consumer = std::function<void(const Notification&)>;

  std::size_t subscribe(Consumer c) {
    consumers_.push_back(std::move(c));
    return consumers_.size() - 1;
  }

  void publish(const Notification& n) const {
    const std::size_t count = consumers_.size();
    for (std::size_t i = 0; i < count; ++i) consumers_[i](n);
  }

  std::size_t consumer_count() const { return consumers_.size(); }

private:
  std::deque<Consumer> consumers_;   // push_back keeps running consumers in place
};

} // namespace vclimb
