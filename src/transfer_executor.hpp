#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "inventory_network.hpp"
#include "item_stack.hpp"
#include "log.hpp"
#include "node.hpp"
#include "pattern.hpp"

enum class TransferDirection {
  PullByDestination,  // source is the local actor
  PushToActor,        // destination is the local actor
  PushDirect
};

const char* to_string(TransferDirection direction);

struct TransferOutcome {
  enum class Status { Ok, SoftFail, HardFail };
  Status status = Status::Ok;
  int moved = 0;
  TransferError error = TransferError::None;
  std::string message;

  bool failed() const { return status != Status::Ok; }
};

class TransferExecutor {
public:
  TransferExecutor(std::shared_ptr<InventoryNetwork> network,
                   std::shared_ptr<Logger> logger = nullptr,
                   bool strict = false);

  static TransferDirection direction_for(const Node& source, const Node& destination);

  // One slot-to-node transfer. Never throws; failures come back as SoftFail,
  // or HardFail in strict mode.
  TransferOutcome attempt(const Node& source,
                          int slot,
                          const Node& destination,
                          int quantity,
                          const std::optional<std::string>& local_name);

  // attempt() that raises TransferFault on a hard failure. Returns the
  // quantity moved.
  int execute(const Node& source,
              int slot,
              const Node& destination,
              int quantity,
              const std::optional<std::string>& local_name);

  // Matching stacks of one node in ascending slot order. Unreachable or
  // faulting nodes yield nothing.
  std::vector<ItemStack> find_items(const Node& node, const ItemPattern& pattern);

  void set_strict(bool strict) { strict_ = strict; }
  bool strict() const { return strict_; }

private:
  TransferOutcome fail(TransferError error, std::string message) const;
  TransferOutcome call_peripheral(const std::string& peripheral_id,
                                  bool pull,
                                  const std::string& other_id,
                                  int slot,
                                  int quantity);

  std::shared_ptr<InventoryNetwork> network_;
  std::shared_ptr<Logger> logger_;
  bool strict_ = false;
};
