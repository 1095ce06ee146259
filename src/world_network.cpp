#include "world_network.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

class WorldPeripheral : public InventoryPeripheral {
public:
  WorldPeripheral(std::shared_ptr<WorldNetwork> world,
                  std::string name,
                  WorldNetwork::PeripheralOptions options)
    : world_(std::move(world)), name_(std::move(name)), options_(options) {}

  const std::string& name() const override { return name_; }

  std::vector<ItemStack> list() override {
    return world_->list_of(name_);
  }

  bool supports_push() const override { return options_.push; }
  bool supports_pull() const override { return options_.pull; }

  int push_items(const std::string& to_name, int from_slot, int limit) override {
    if(!options_.push) {
      throw std::runtime_error(name_ + " has no push_items");
    }
    return world_->move_items(name_, from_slot, to_name, limit);
  }

  int pull_items(const std::string& from_name, int from_slot, int limit) override {
    if(!options_.pull) {
      throw std::runtime_error(name_ + " has no pull_items");
    }
    return world_->move_items(from_name, from_slot, name_, limit);
  }

private:
  std::shared_ptr<WorldNetwork> world_;
  std::string name_;
  WorldNetwork::PeripheralOptions options_;
};

} // namespace

WorldNetwork::WorldNetwork(std::string local_name, int local_slots)
  : local_name_(std::move(local_name)),
    local_inventory_(local_slots) {}

std::shared_ptr<WorldNetwork> WorldNetwork::from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) {
    throw std::runtime_error("World description must be a JSON object");
  }
  const auto local = doc.value("local", nlohmann::json::object());
  auto world = std::make_shared<WorldNetwork>(local.value("name", "turtle_1"),
                                              local.value("slots", kLocalSlots));
  world->set_connected(local.value("connected", true));

  if(doc.contains("max_stack")) {
    for(const auto& item : doc.at("max_stack").items()) {
      world->set_max_stack(item.key(), item.value().get<int>());
    }
  }

  auto load_items = [&](Inventory& inventory, const nlohmann::json& items) {
    for(const auto& entry : items) {
      auto stack = entry.get<ItemStack>();
      if(!entry.contains("max_count")) {
        stack.max_count = world->max_stack_for(stack.name);
      }
      if(!inventory.put(stack)) {
        throw std::runtime_error("Slot " + std::to_string(stack.slot) + " out of range for " + stack.name);
      }
    }
  };

  if(local.contains("items")) {
    load_items(world->local_inventory_, local.at("items"));
  }

  for(const auto& entry : doc.value("peripherals", nlohmann::json::array())) {
    PeripheralOptions options;
    options.slots = entry.value("slots", options.slots);
    options.inventory = entry.value("inventory", true);
    options.push = entry.value("push", true);
    options.pull = entry.value("pull", true);
    auto name = entry.at("name").get<std::string>();
    world->add_peripheral(name, options);
    if(options.inventory && entry.contains("items")) {
      load_items(*world->peripherals_.at(name).inventory, entry.at("items"));
    }
  }
  return world;
}

nlohmann::json WorldNetwork::to_json() const {
  std::lock_guard lg(m_);
  nlohmann::json doc;
  doc["local"] = {
    {"name", local_name_},
    {"connected", connected_},
    {"slots", local_inventory_.slot_count()},
    {"items", local_inventory_.stacks()}
  };
  doc["max_stack"] = max_stack_;
  auto peripherals = nlohmann::json::array();
  for(const auto& name : order_) {
    const auto& entry = peripherals_.at(name);
    nlohmann::json p = {
      {"name", name},
      {"inventory", entry.options.inventory},
      {"push", entry.options.push},
      {"pull", entry.options.pull}
    };
    if(entry.inventory) {
      p["slots"] = entry.inventory->slot_count();
      p["items"] = entry.inventory->stacks();
    }
    peripherals.push_back(std::move(p));
  }
  doc["peripherals"] = std::move(peripherals);
  return doc;
}

void WorldNetwork::add_peripheral(const std::string& name) {
  add_peripheral(name, PeripheralOptions{});
}

void WorldNetwork::add_peripheral(const std::string& name, PeripheralOptions options) {
  std::lock_guard lg(m_);
  if(name.empty() || name == local_name_) {
    throw std::invalid_argument("Invalid peripheral name '" + name + "'");
  }
  PeripheralEntry entry;
  entry.options = options;
  if(options.inventory) {
    entry.inventory = std::make_unique<Inventory>(options.slots);
  }
  if(peripherals_.find(name) == peripherals_.end()) {
    order_.push_back(name);
  }
  peripherals_[name] = std::move(entry);
}

bool WorldNetwork::remove_peripheral(const std::string& name) {
  std::lock_guard lg(m_);
  if(peripherals_.erase(name) == 0) return false;
  order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
  return true;
}

Inventory* WorldNetwork::find_inventory_locked(const std::string& name, bool require_connection) {
  if(name == local_name_) {
    if(require_connection && !connected_) return nullptr;
    return &local_inventory_;
  }
  auto it = peripherals_.find(name);
  if(it == peripherals_.end()) return nullptr;
  return it->second.inventory.get();
}

const Inventory* WorldNetwork::find_inventory_locked(const std::string& name) const {
  if(name == local_name_) return &local_inventory_;
  auto it = peripherals_.find(name);
  if(it == peripherals_.end()) return nullptr;
  return it->second.inventory.get();
}

void WorldNetwork::check_healthy_locked(const std::string& name) const {
  auto it = peripherals_.find(name);
  if(it != peripherals_.end() && it->second.faulty) {
    throw std::runtime_error("Peripheral " + name + " is not responding");
  }
}

int WorldNetwork::give(const std::string& node, const std::string& item, int count, int max_count) {
  std::lock_guard lg(m_);
  auto* inventory = find_inventory_locked(node, false);
  if(!inventory) {
    throw std::runtime_error("No such inventory: " + node);
  }
  if(max_count <= 0) {
    auto it = max_stack_.find(item);
    max_count = it == max_stack_.end() ? kDefaultMaxStack : it->second;
  }
  return inventory->insert(item, count, max_count);
}

int WorldNetwork::take(const std::string& node, int slot, int count) {
  std::lock_guard lg(m_);
  auto* inventory = find_inventory_locked(node, false);
  if(!inventory) {
    throw std::runtime_error("No such inventory: " + node);
  }
  return inventory->remove(slot, count);
}

std::vector<ItemStack> WorldNetwork::contents(const std::string& node) const {
  std::lock_guard lg(m_);
  const auto* inventory = find_inventory_locked(node);
  if(!inventory) return {};
  return inventory->stacks();
}

int WorldNetwork::count_item(const std::string& node, const std::string& item) const {
  std::lock_guard lg(m_);
  const auto* inventory = find_inventory_locked(node);
  return inventory ? inventory->count_of(item) : 0;
}

void WorldNetwork::set_max_stack(const std::string& item, int max_count) {
  std::lock_guard lg(m_);
  max_stack_[item] = std::max(1, max_count);
}

int WorldNetwork::max_stack_for(const std::string& item) const {
  std::lock_guard lg(m_);
  auto it = max_stack_.find(item);
  return it == max_stack_.end() ? kDefaultMaxStack : it->second;
}

void WorldNetwork::set_connected(bool connected) {
  std::lock_guard lg(m_);
  connected_ = connected;
}

bool WorldNetwork::connected() const {
  std::lock_guard lg(m_);
  return connected_;
}

void WorldNetwork::set_discovery_outage(int calls) {
  std::lock_guard lg(m_);
  discovery_outage_ = std::max(0, calls);
}

void WorldNetwork::set_identity_outage(int calls) {
  std::lock_guard lg(m_);
  identity_outage_ = std::max(0, calls);
}

void WorldNetwork::set_faulty(const std::string& name, bool faulty) {
  std::lock_guard lg(m_);
  auto it = peripherals_.find(name);
  if(it == peripherals_.end()) {
    throw std::runtime_error("No such peripheral: " + name);
  }
  it->second.faulty = faulty;
}

std::vector<std::string> WorldNetwork::attached_names() const {
  std::lock_guard lg(m_);
  return order_;
}

bool WorldNetwork::describe(const std::string& name, PeripheralOptions& out) const {
  std::lock_guard lg(m_);
  auto it = peripherals_.find(name);
  if(it == peripherals_.end()) return false;
  out = it->second.options;
  return true;
}

std::vector<ItemStack> WorldNetwork::list_of(const std::string& name) {
  std::lock_guard lg(m_);
  check_healthy_locked(name);
  auto* inventory = find_inventory_locked(name, true);
  if(!inventory) {
    throw std::runtime_error("No such inventory: " + name);
  }
  return inventory->stacks();
}

int WorldNetwork::move_items(const std::string& from, int slot, const std::string& to, int limit) {
  std::lock_guard lg(m_);
  check_healthy_locked(from);
  check_healthy_locked(to);
  auto* source = find_inventory_locked(from, true);
  if(!source) {
    throw std::runtime_error("No such inventory: " + from);
  }
  auto* target = find_inventory_locked(to, true);
  if(!target) {
    throw std::runtime_error("No such inventory: " + to);
  }
  if(source == target || limit <= 0) return 0;

  auto stack = source->at(slot);
  if(!stack) return 0;
  int wanted = std::min(limit, stack->count);
  int stored = target->insert(stack->name, wanted, stack->max_count);
  source->remove(slot, stored);
  return stored;
}

std::vector<std::string> WorldNetwork::peripheral_names() {
  std::lock_guard lg(m_);
  if(discovery_outage_ > 0) {
    --discovery_outage_;
    return {};
  }
  if(!connected_) return {};
  return order_;
}

std::shared_ptr<InventoryPeripheral> WorldNetwork::wrap(const std::string& name) {
  PeripheralOptions options;
  {
    std::lock_guard lg(m_);
    if(!connected_) return nullptr;
    auto it = peripherals_.find(name);
    if(it == peripherals_.end() || !it->second.options.inventory) return nullptr;
    options = it->second.options;
  }
  return std::make_shared<WorldPeripheral>(shared_from_this(), name, options);
}

std::optional<std::string> WorldNetwork::local_name() {
  std::lock_guard lg(m_);
  if(identity_outage_ > 0) {
    --identity_outage_;
    return std::nullopt;
  }
  if(!connected_) return std::nullopt;
  return local_name_;
}

std::vector<ItemStack> WorldNetwork::local_items() {
  std::lock_guard lg(m_);
  return local_inventory_.stacks();
}
