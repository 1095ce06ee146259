#include "transfer_executor.hpp"

#include <algorithm>
#include <stdexcept>

#include "item_matcher.hpp"

const char* to_string(TransferDirection direction) {
  switch(direction) {
    case TransferDirection::PullByDestination: return "pull";
    case TransferDirection::PushToActor: return "push-to-actor";
    case TransferDirection::PushDirect: return "push";
  }
  return "unknown";
}

TransferExecutor::TransferExecutor(std::shared_ptr<InventoryNetwork> network,
                                   std::shared_ptr<Logger> logger,
                                   bool strict)
  : network_(std::move(network)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer")),
    strict_(strict) {
  if(!network_) {
    throw std::invalid_argument("TransferExecutor requires a network");
  }
}

TransferDirection TransferExecutor::direction_for(const Node& source, const Node& destination) {
  if(source.local_actor) return TransferDirection::PullByDestination;
  if(destination.local_actor) return TransferDirection::PushToActor;
  return TransferDirection::PushDirect;
}

TransferOutcome TransferExecutor::fail(TransferError error, std::string message) const {
  logger_->debug("ERROR: {}", message);
  TransferOutcome outcome;
  outcome.status = strict_ ? TransferOutcome::Status::HardFail : TransferOutcome::Status::SoftFail;
  outcome.error = error;
  outcome.message = std::move(message);
  return outcome;
}

TransferOutcome TransferExecutor::call_peripheral(const std::string& peripheral_id,
                                                  bool pull,
                                                  const std::string& other_id,
                                                  int slot,
                                                  int quantity) {
  const char* method = pull ? "pull_items" : "push_items";
  auto peripheral = network_->wrap(peripheral_id);
  if(!peripheral) {
    return fail(TransferError::CapabilityMissing,
                fmt::format("Could not wrap peripheral: {}", peripheral_id));
  }
  if(pull ? !peripheral->supports_pull() : !peripheral->supports_push()) {
    return fail(TransferError::CapabilityMissing,
                fmt::format("{} has no {} method", peripheral_id, method));
  }

  logger_->debug("  {}.{}('{}', {}, {})", peripheral_id, method, other_id, slot, quantity);
  try {
    int moved = pull ? peripheral->pull_items(other_id, slot, quantity)
                     : peripheral->push_items(other_id, slot, quantity);
    TransferOutcome outcome;
    outcome.moved = std::max(0, moved);
    logger_->debug("  transferred: {}", outcome.moved);
    return outcome;
  } catch(const std::exception& e) {
    return fail(TransferError::TransferFailed, fmt::format("{} failed: {}", method, e.what()));
  }
}

TransferOutcome TransferExecutor::attempt(const Node& source,
                                          int slot,
                                          const Node& destination,
                                          int quantity,
                                          const std::optional<std::string>& local_name) {
  const auto direction = direction_for(source, destination);
  logger_->debug("transfer(src={}, slot={}, dst={}, count={}) [{}]",
                 source.id, slot, destination.id, quantity, to_string(direction));
  if(quantity <= 0) return TransferOutcome{};

  switch(direction) {
    case TransferDirection::PullByDestination:
      if(!local_name) {
        return fail(TransferError::TransferFailed,
                    "Not connected to network, can't transfer from local actor");
      }
      return call_peripheral(destination.id, true, *local_name, slot, quantity);

    case TransferDirection::PushToActor:
      if(!local_name) {
        return fail(TransferError::TransferFailed,
                    "Not connected to network, can't transfer to local actor");
      }
      return call_peripheral(source.id, false, *local_name, slot, quantity);

    case TransferDirection::PushDirect:
      return call_peripheral(source.id, false, destination.id, slot, quantity);
  }
  return fail(TransferError::TransferFailed, "Unknown transfer direction");
}

int TransferExecutor::execute(const Node& source,
                              int slot,
                              const Node& destination,
                              int quantity,
                              const std::optional<std::string>& local_name) {
  auto outcome = attempt(source, slot, destination, quantity, local_name);
  if(outcome.status == TransferOutcome::Status::HardFail) {
    throw TransferFault(outcome.error, outcome.message);
  }
  return outcome.moved;
}

std::vector<ItemStack> TransferExecutor::find_items(const Node& node, const ItemPattern& pattern) {
  logger_->debug("find_items('{}', '{}')", node.id, pattern.to_string());
  std::vector<ItemStack> stacks;
  try {
    if(node.local_actor) {
      stacks = network_->local_items();
    } else if(auto peripheral = network_->wrap(node.id)) {
      stacks = peripheral->list();
    } else {
      return {};
    }
  } catch(const std::exception& e) {
    logger_->debug("  listing {} failed: {}", node.id, e.what());
    return {};
  }

  std::vector<ItemStack> matching;
  for(auto& stack : stacks) {
    if(stack.empty() || !item_matches(stack.name, pattern)) continue;
    if(stack.max_count <= 0) stack.max_count = kDefaultMaxStack;
    logger_->debug("    slot {}: {} x{}", stack.slot, stack.name, stack.count);
    matching.push_back(std::move(stack));
  }
  std::sort(matching.begin(), matching.end(),
            [](const ItemStack& a, const ItemStack& b){ return a.slot < b.slot; });
  return matching;
}
