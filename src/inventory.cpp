#include <vclimb/inventory.hpp>

namespace vclimb {

Item make_item(ItemType type) {
  Item it;
  it.type = type;
  switch (type) {
    case ItemType::PlatformSpawner:
      it.charges = 1;
      it.cooldown_ms = 0.0;
      break;
  }
  return it;
}

const char* item_name(ItemType type) {
  switch (type) {
    case ItemType::PlatformSpawner: return "Platform Kit";
  }
  return "?";
}

InventorySlot Inventory::add_item(const Item& item) {
  if (!slots_[0]) { slots_[0] = item; return InventorySlot::Q; }
  if (!slots_[1]) { slots_[1] = item; return InventorySlot::E; }
  slots_[0] = item;
  return InventorySlot::Q;
}

UseOutcome Inventory::use_item(InventorySlot s, double now_ms) {
  auto& slot = slots_[static_cast<std::size_t>(s)];
  if (!slot) return UseOutcome{UseResult::Empty, std::nullopt};

  Item& it = *slot;
  if (it.last_used_ms && now_ms - *it.last_used_ms < it.cooldown_ms) {
    return UseOutcome{UseResult::OnCooldown, std::nullopt};
  }
  if (it.charges && *it.charges <= 0) {
    return UseOutcome{UseResult::NoCharges, std::nullopt};
  }

  const ItemType type = it.type;
  it.last_used_ms = now_ms;
  if (it.charges) {
    --*it.charges;
    if (*it.charges <= 0) slot.reset();
  }
  return UseOutcome{UseResult::Used, type};
}

} // namespace vclimb
