#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "inventory.hpp"
#include "inventory_network.hpp"

// In-process wired network: a set of slot inventories plus the agent's own
// inventory, with per-item stack limits. The hub serves one of these over TCP
// and the tests drive one directly.
class WorldNetwork : public InventoryNetwork,
                     public std::enable_shared_from_this<WorldNetwork> {
public:
  struct PeripheralOptions {
    int slots = 27;
    bool inventory = true;
    bool push = true;
    bool pull = true;
  };

  static constexpr int kLocalSlots = 16;

  explicit WorldNetwork(std::string local_name = "turtle_1",
                        int local_slots = kLocalSlots);

  static std::shared_ptr<WorldNetwork> from_json(const nlohmann::json& doc);
  nlohmann::json to_json() const;

  void add_peripheral(const std::string& name);
  void add_peripheral(const std::string& name, PeripheralOptions options);
  bool remove_peripheral(const std::string& name);

  // Stocking helpers. The local inventory is addressed by its network name
  // whether or not it is connected. max_count 0 uses the item's stack limit.
  int give(const std::string& node, const std::string& item, int count, int max_count = 0);
  int take(const std::string& node, int slot, int count);
  std::vector<ItemStack> contents(const std::string& node) const;
  int count_item(const std::string& node, const std::string& item) const;

  void set_max_stack(const std::string& item, int max_count);
  int max_stack_for(const std::string& item) const;

  void set_connected(bool connected);
  bool connected() const;
  const std::string& local_identity() const { return local_name_; }

  // The next `calls` discovery calls report nothing, as while a modem is
  // still attaching.
  void set_discovery_outage(int calls);
  void set_identity_outage(int calls);
  void set_faulty(const std::string& name, bool faulty);

  // Every attached peripheral in attach order, ignoring outages and the
  // connection switch.
  std::vector<std::string> attached_names() const;
  bool describe(const std::string& name, PeripheralOptions& out) const;

  // World-level operations backing the peripheral API. They throw
  // std::runtime_error for unknown or faulted peripherals.
  std::vector<ItemStack> list_of(const std::string& name);
  int move_items(const std::string& from, int slot, const std::string& to, int limit);

  // InventoryNetwork
  std::vector<std::string> peripheral_names() override;
  std::shared_ptr<InventoryPeripheral> wrap(const std::string& name) override;
  std::optional<std::string> local_name() override;
  std::vector<ItemStack> local_items() override;

private:
  struct PeripheralEntry {
    PeripheralOptions options;
    std::unique_ptr<Inventory> inventory;
    bool faulty = false;
  };

  Inventory* find_inventory_locked(const std::string& name, bool require_connection);
  const Inventory* find_inventory_locked(const std::string& name) const;
  void check_healthy_locked(const std::string& name) const;

  mutable std::mutex m_;
  std::string local_name_;
  Inventory local_inventory_;
  bool connected_ = true;
  int discovery_outage_ = 0;
  int identity_outage_ = 0;
  std::vector<std::string> order_;
  std::unordered_map<std::string, PeripheralEntry> peripherals_;
  std::map<std::string, int> max_stack_;
};
