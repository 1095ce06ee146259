#pragma once

#include <optional>
#include <string>
#include <vector>

#include "item_stack.hpp"

// Fixed-size slot container. Slots are 1-based to match the network API.
class Inventory {
public:
  explicit Inventory(int slot_count);

  int slot_count() const { return static_cast<int>(slots_.size()); }

  // Occupied slots in ascending slot order.
  std::vector<ItemStack> stacks() const;
  std::optional<ItemStack> at(int slot) const;

  // Returns the quantity actually stored.
  int insert(const std::string& name, int count, int max_count);
  // Returns the quantity actually removed from the slot.
  int remove(int slot, int count);

  bool put(const ItemStack& stack);
  int count_of(const std::string& name) const;

private:
  bool valid_slot(int slot) const { return slot >= 1 && slot <= slot_count(); }

  std::vector<std::optional<ItemStack>> slots_;
};
