#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <utility>
#include <vector>

namespace vclimb {

struct TimerId {
  std::uint64_t seq{0};    // 0 is never issued
  std::uint32_t epoch{0};

  bool operator==(const TimerId&) const = default;
};

// One-shot delayed actions, polled once per tick (level-triggered).
// Payloads are plain values (typically a Handle into a SlotMap); the consumer
// re-resolves them when the timer fires, so a timer never holds a live
// reference. clear() bumps the epoch: ids issued before it can no longer
// cancel anything and nothing scheduled before it will fire.
template <class Payload>
class TimerQueue {
public:
  TimerId schedule(double fire_at_ms, Payload payload) {
    const TimerId id{++seq_, epoch_};
    pending_.push_back(Entry{fire_at_ms, id, std::move(payload)});
    return id;
  }

  bool cancel(TimerId id) {
    if (id.epoch != epoch_) return false;
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&](const Entry& e){ return e.id == id; });
    if (it == pending_.end()) return false;
    pending_.erase(it);
    return true;
  }

  // Fire (and remove) every timer due at now_ms, earliest first, each at most
  // once. f(const Payload&). Timers scheduled from inside f wait for the
  // next poll.
  template <class F>
  std::size_t poll(double now_ms, F&& f) {
    std::vector<Entry> due;
    auto split = std::stable_partition(pending_.begin(), pending_.end(),
                                       [&](const Entry& e){ return e.fire_at_ms > now_ms; });
    due.assign(std::make_move_iterator(split), std::make_move_iterator(pending_.end()));
    pending_.erase(split, pending_.end());
    std::stable_sort(due.begin(), due.end(), [](const Entry& a, const Entry& b){
      if (a.fire_at_ms != b.fire_at_ms) return a.fire_at_ms < b.fire_at_ms;
      return a.id.seq < b.id.seq;
    });
    for (const auto& e : due) f(e.payload);
    return due.size();
  }

  void clear() {
    pending_.clear();
    ++epoch_;
  }

  std::size_t size() const { return pending_.size(); }
  bool empty() const { return pending_.empty(); }

private:
  struct Entry {
    double fire_at_ms{};
    TimerId id{};
    Payload payload{};
  };
  std::vector<Entry> pending_;
  std::uint64_t seq_{0};
  std::uint32_t epoch_{0};
};

} // namespace vclimb
