#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "item_stack.hpp"

// A peripheral on the network that exposes an inventory. Any call may throw
// std::runtime_error when the peripheral faults or becomes unreachable.
class InventoryPeripheral {
public:
  virtual ~InventoryPeripheral() = default;

  virtual const std::string& name() const = 0;

  // Occupied slots; order is not guaranteed.
  virtual std::vector<ItemStack> list() = 0;

  virtual bool supports_push() const = 0;
  virtual bool supports_pull() const = 0;

  // Moves up to limit items out of from_slot into the named inventory.
  // Returns the quantity actually moved.
  virtual int push_items(const std::string& to_name, int from_slot, int limit) = 0;

  // Moves up to limit items out of from_slot of the named inventory into this
  // one. Returns the quantity actually moved.
  virtual int pull_items(const std::string& from_name, int from_slot, int limit) = 0;
};

// The shared network as seen from the controlling agent.
class InventoryNetwork {
public:
  virtual ~InventoryNetwork() = default;

  // Every attached peripheral, inventories or not.
  virtual std::vector<std::string> peripheral_names() = 0;

  // nullptr when the name is unknown or does not expose an inventory.
  virtual std::shared_ptr<InventoryPeripheral> wrap(const std::string& name) = 0;

  // The agent's own name on the network; nullopt while disconnected.
  virtual std::optional<std::string> local_name() = 0;

  // The agent's own slots. Readable even while disconnected.
  virtual std::vector<ItemStack> local_items() = 0;
};
