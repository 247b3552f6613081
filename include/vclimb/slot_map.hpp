#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace vclimb {

// Generation-checked reference into a SlotMap. A handle whose generation no
// longer matches its slot refers to a destroyed entity and resolves to null.
struct Handle {
  std::uint32_t index{0};
  std::uint32_t generation{0}; // 0 is never issued -> default handle is always stale

  bool operator==(const Handle&) const = default;
};

// Dense-index object pool with generation counters and a free list.
template <class T>
class SlotMap {
public:
  Handle insert(T value) {
    std::uint32_t idx;
    if (!free_.empty()) {
      idx = free_.back();
      free_.pop_back();
    } else {
      idx = static_cast<std::uint32_t>(slots_.size());
      slots_.push_back(Slot{});
    }
    Slot& s = slots_[idx];
    ++s.generation;
    s.alive = true;
    s.value = std::move(value);
    ++live_;
    return Handle{idx, s.generation};
  }

  // Returns false for stale handles (already erased or never issued).
  bool erase(Handle h) {
    if (!contains(h)) return false;
    Slot& s = slots_[h.index];
    s.alive = false;
    s.value = T{};
    free_.push_back(h.index);
    --live_;
    return true;
  }

  bool contains(Handle h) const {
    return h.index < slots_.size()
        && slots_[h.index].alive
        && slots_[h.index].generation == h.generation;
  }

  T*       get(Handle h)       { return contains(h) ? &slots_[h.index].value : nullptr; }
  const T* get(Handle h) const { return contains(h) ? &slots_[h.index].value : nullptr; }

  // Visit live entries in slot order: f(Handle, T&)
  template <class F>
  void for_each(F&& f) {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
      Slot& s = slots_[i];
      if (s.alive) f(Handle{static_cast<std::uint32_t>(i), s.generation}, s.value);
    }
  }
  template <class F>
  void for_each(F&& f) const {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
      const Slot& s = slots_[i];
      if (s.alive) f(Handle{static_cast<std::uint32_t>(i), s.generation}, s.value);
    }
  }

  // Erase every live entry. Generations survive so old handles stay stale.
  void clear() {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
      if (slots_[i].alive) {
        slots_[i].alive = false;
        slots_[i].value = T{};
        free_.push_back(static_cast<std::uint32_t>(i));
      }
    }
    live_ = 0;
  }

  std::size_t size() const { return live_; }
  bool empty() const { return live_ == 0; }

private:
  struct Slot {
    T value{};
    std::uint32_t generation{0};
    bool alive{false};
  };
  std::vector<Slot> slots_;
  std::vector<std::uint32_t> free_;
  std::size_t live_{0};
};

} // namespace vclimb
