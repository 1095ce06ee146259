#include "query_engine.hpp"

#include <stdexcept>

QueryEngine::QueryEngine(std::shared_ptr<Directory> directory,
                         std::shared_ptr<TransferExecutor> executor)
  : directory_(std::move(directory)), executor_(std::move(executor)) {
  if(!directory_ || !executor_) {
    throw std::invalid_argument("QueryEngine requires a directory and an executor");
  }
}

int QueryEngine::node_total(const std::string& inventory, const ItemPattern& item) {
  int total = 0;
  for(const auto& stack : executor_->find_items(Node{inventory, false}, item)) {
    total += stack.count;
  }
  return total;
}

std::vector<std::pair<std::string, int>> QueryEngine::per_node(const ItemPattern& item,
                                                               const std::vector<std::string>& inventories) {
  std::vector<std::pair<std::string, int>> out;
  out.reserve(inventories.size());
  for(const auto& inventory : inventories) {
    out.emplace_back(inventory, node_total(inventory, item));
  }
  return out;
}

int QueryEngine::count(const ItemPattern& item) {
  int total = 0;
  for(const auto& entry : per_node(item, directory_->discover_inventories())) {
    total += entry.second;
  }
  return total;
}

NodeCount QueryEngine::high(const ItemPattern& item) {
  NodeCount best;
  best.count = -1;
  for(const auto& [inventory, total] : per_node(item, directory_->discover_inventories())) {
    if(total > 0 && total > best.count) {
      best.node = inventory;
      best.count = total;
    }
  }
  if(!best.node) best.count = 0;
  return best;
}

NodeCount QueryEngine::low(const ItemPattern& item, bool include_empty) {
  NodeCount best;
  for(const auto& [inventory, total] : per_node(item, directory_->discover_inventories())) {
    if(total <= 0 && !include_empty) continue;
    if(!best.node || total < best.count) {
      best.node = inventory;
      best.count = total;
    }
  }
  return best;
}
