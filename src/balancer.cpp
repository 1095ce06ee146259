#include "balancer.hpp"

#include <algorithm>
#include <stdexcept>

BalancePlan BalancePlan::compute(const std::vector<std::pair<std::string, int>>& counts) {
  BalancePlan plan;
  for(const auto& entry : counts) {
    plan.total += entry.second;
    plan.entries.push_back(Entry{entry.first, entry.second, 0});
  }
  if(plan.entries.empty()) return plan;

  const int nodes = static_cast<int>(plan.entries.size());
  plan.target = plan.total / nodes;
  plan.extra = plan.total % nodes;

  std::stable_sort(plan.entries.begin(), plan.entries.end(),
                   [](const Entry& a, const Entry& b){ return a.baseline > b.baseline; });
  for(int i = 0; i < nodes; ++i) {
    plan.entries[static_cast<std::size_t>(i)].target = plan.target + (i < plan.extra ? 1 : 0);
  }
  return plan;
}

Balancer::Balancer(std::shared_ptr<Directory> directory,
                   std::shared_ptr<QueryEngine> queries,
                   std::shared_ptr<MoveOrchestrator> mover,
                   std::shared_ptr<Logger> logger)
  : directory_(std::move(directory)),
    queries_(std::move(queries)),
    mover_(std::move(mover)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("balance")) {
  if(!directory_ || !queries_ || !mover_) {
    throw std::invalid_argument("Balancer requires a directory, queries and a mover");
  }
}

MoveResult Balancer::balance(const ItemPattern& item, const BalanceOptions& options) {
  const auto snapshot = directory_->snapshot();
  if(snapshot.inventories.empty()) {
    return MoveResult::failure(TransferError::DirectoryUnavailable, "No inventories on network");
  }

  const auto plan = BalancePlan::compute(queries_->per_node(item, snapshot.inventories));
  if(plan.total == 0) {
    return MoveResult::failure(TransferError::NoMatchOrFull,
                               "No items matching '" + item.to_string() + "' found");
  }

  if(options.verbose) {
    logger_->print("Balancing {} {} across {} chests", plan.total, item.to_string(), plan.entries.size());
    logger_->print("Target: {} per chest", plan.target);
    if(plan.extra > 0) {
      logger_->print("  ({} chests get {})", plan.extra, plan.target + 1);
    }
  }

  int total_moved = 0;
  for(int pass = 1;; ++pass) {
    bool balanced = false;
    int moved = run_pass(plan, item, options, snapshot, pass, balanced);
    total_moved += moved;
    logger_->debug("pass {} moved {}", pass, moved);
    if(balanced || moved == 0) break;
    if(options.limit && moved < *options.limit) break;
  }

  if(options.verbose) {
    logger_->print("Total moved: {}", total_moved);
  }
  return MoveResult::success(total_moved);
}

int Balancer::run_pass(const BalancePlan& plan,
                       const ItemPattern& item,
                       const BalanceOptions& options,
                       const DirectorySnapshot& snapshot,
                       int pass,
                       bool& balanced) {
  std::vector<Party> donors;
  std::vector<Party> receivers;
  for(const auto& entry : plan.entries) {
    int current = queries_->node_total(entry.node, item);
    int diff = current - entry.target;
    if(diff > 0) {
      donors.push_back(Party{entry.node, diff, current});
    } else if(diff < 0) {
      receivers.push_back(Party{entry.node, -diff, current});
    }
  }

  if(donors.empty() || receivers.empty()) {
    balanced = true;
    return 0;
  }

  if(options.verbose && (options.limit || pass == 1)) {
    logger_->print("--- Pass {} ---", pass);
  }

  int moved_this_pass = 0;
  for(auto& donor : donors) {
    for(auto& receiver : receivers) {
      if(donor.amount <= 0 || receiver.amount <= 0) continue;
      int to_move = std::min(donor.amount, receiver.amount);
      if(options.verbose) {
        logger_->print("  {} ({}) -> {} ({}): {}",
                       donor.node, donor.current, receiver.node, receiver.current, to_move);
      }

      MovePattern source{LocationPattern::named(donor.node), item, CountSpec::fixed(to_move)};
      MovePattern destination{LocationPattern::named(receiver.node), ItemPattern{}, CountSpec::fixed(1)};
      auto result = mover_->move(source, destination, MoveOptions{}, snapshot);
      if(result.transferred > 0) {
        donor.amount -= result.transferred;
        donor.current -= result.transferred;
        receiver.amount -= result.transferred;
        receiver.current += result.transferred;
        moved_this_pass += result.transferred;
      }
    }
  }
  return moved_this_pass;
}
