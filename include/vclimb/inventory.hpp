#pragma once
#include <array>
#include <cstddef>
#include <optional>

namespace vclimb {

enum class ItemType { PlatformSpawner };

struct Item {
  ItemType type = ItemType::PlatformSpawner;
  std::optional<int> charges;      // nullopt = unlimited
  double cooldown_ms = 0.0;
  std::optional<double> last_used_ms;
};

Item make_item(ItemType type);
const char* item_name(ItemType type);

enum class InventorySlot { Q = 0, E = 1 };
enum class UseResult { Empty, OnCooldown, NoCharges, Used };

struct UseOutcome {
  UseResult result = UseResult::Empty;
  std::optional<ItemType> used;    // set when result == Used
};

// Two active-item slots. New items fill Q, then E, else replace Q.
class Inventory {
public:
  InventorySlot add_item(const Item& item);
  UseOutcome use_item(InventorySlot slot, double now_ms);

  const std::optional<Item>& slot(InventorySlot s) const {
    return slots_[static_cast<std::size_t>(s)];
  }
  bool full() const { return slots_[0].has_value() && slots_[1].has_value(); }
  void clear() { slots_[0].reset(); slots_[1].reset(); }

private:
  std::array<std::optional<Item>, 2> slots_{};
};

} // namespace vclimb
