#include "inventory.hpp"

#include <algorithm>
#include <stdexcept>

Inventory::Inventory(int slot_count) {
  if(slot_count <= 0) {
    throw std::invalid_argument("Inventory needs at least one slot");
  }
  slots_.resize(static_cast<std::size_t>(slot_count));
}

std::vector<ItemStack> Inventory::stacks() const {
  std::vector<ItemStack> out;
  for(const auto& slot : slots_) {
    if(slot && !slot->empty()) out.push_back(*slot);
  }
  return out;
}

std::optional<ItemStack> Inventory::at(int slot) const {
  if(!valid_slot(slot)) return std::nullopt;
  const auto& entry = slots_[static_cast<std::size_t>(slot - 1)];
  if(!entry || entry->empty()) return std::nullopt;
  return entry;
}

int Inventory::insert(const std::string& name, int count, int max_count) {
  if(count <= 0 || max_count <= 0 || name.empty()) return 0;
  int left = count;

  for(auto& slot : slots_) {
    if(left == 0) break;
    if(!slot || slot->empty() || slot->name != name) continue;
    int space = std::max(0, slot->max_count - slot->count);
    int put = std::min(space, left);
    slot->count += put;
    left -= put;
  }

  for(std::size_t i = 0; i < slots_.size() && left > 0; ++i) {
    auto& slot = slots_[i];
    if(slot && !slot->empty()) continue;
    int put = std::min(max_count, left);
    slot = ItemStack{static_cast<int>(i + 1), name, put, max_count};
    left -= put;
  }
  return count - left;
}

int Inventory::remove(int slot, int count) {
  if(!valid_slot(slot) || count <= 0) return 0;
  auto& entry = slots_[static_cast<std::size_t>(slot - 1)];
  if(!entry || entry->empty()) return 0;
  int taken = std::min(count, entry->count);
  entry->count -= taken;
  if(entry->count <= 0) entry.reset();
  return taken;
}

bool Inventory::put(const ItemStack& stack) {
  if(!valid_slot(stack.slot)) return false;
  auto& entry = slots_[static_cast<std::size_t>(stack.slot - 1)];
  if(stack.empty()) {
    entry.reset();
  } else {
    entry = stack;
  }
  return true;
}

int Inventory::count_of(const std::string& name) const {
  int total = 0;
  for(const auto& slot : slots_) {
    if(slot && slot->name == name) total += slot->count;
  }
  return total;
}
