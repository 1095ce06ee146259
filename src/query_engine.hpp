#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "directory.hpp"
#include "pattern.hpp"
#include "transfer_executor.hpp"

struct NodeCount {
  std::optional<std::string> node;
  int count = 0;
};

// Read-only aggregation over every inventory in the directory.
class QueryEngine {
public:
  QueryEngine(std::shared_ptr<Directory> directory,
              std::shared_ptr<TransferExecutor> executor);

  int count(const ItemPattern& item);
  NodeCount high(const ItemPattern& item);
  NodeCount low(const ItemPattern& item, bool include_empty = false);

  // Matching quantity per inventory, in discovery order.
  std::vector<std::pair<std::string, int>> per_node(const ItemPattern& item,
                                                    const std::vector<std::string>& inventories);
  int node_total(const std::string& inventory, const ItemPattern& item);

private:
  std::shared_ptr<Directory> directory_;
  std::shared_ptr<TransferExecutor> executor_;
};
