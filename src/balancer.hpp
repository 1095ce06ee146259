#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "directory.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "move_orchestrator.hpp"
#include "pattern.hpp"
#include "query_engine.hpp"

struct BalanceOptions {
  bool verbose = false;
  // Keep running passes only while each pass moves at least this many.
  std::optional<int> limit;
};

struct BalancePlan {
  struct Entry {
    std::string node;
    int baseline = 0;
    int target = 0;
  };

  int total = 0;
  int target = 0;   // floor(total / nodes)
  int extra = 0;    // nodes that keep one more than target
  std::vector<Entry> entries;   // largest baseline first

  // The `extra` nodes already holding the most keep the rounding surplus,
  // which keeps the number of moved units minimal.
  static BalancePlan compute(const std::vector<std::pair<std::string, int>>& counts);
};

// Greedy donor/receiver passes toward a BalancePlan. Pairing walks donors and
// receivers in plan order without re-sorting inside a pass, so a pass is not
// globally optimal; later passes pick up the rest.
class Balancer {
public:
  Balancer(std::shared_ptr<Directory> directory,
           std::shared_ptr<QueryEngine> queries,
           std::shared_ptr<MoveOrchestrator> mover,
           std::shared_ptr<Logger> logger = nullptr);

  MoveResult balance(const ItemPattern& item, const BalanceOptions& options = {});

private:
  struct Party {
    std::string node;
    int amount = 0;   // excess for donors, need for receivers
    int current = 0;
  };

  int run_pass(const BalancePlan& plan,
               const ItemPattern& item,
               const BalanceOptions& options,
               const DirectorySnapshot& snapshot,
               int pass,
               bool& balanced);

  std::shared_ptr<Directory> directory_;
  std::shared_ptr<QueryEngine> queries_;
  std::shared_ptr<MoveOrchestrator> mover_;
  std::shared_ptr<Logger> logger_;
};
