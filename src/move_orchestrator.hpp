#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "directory.hpp"
#include "errors.hpp"
#include "location_resolver.hpp"
#include "log.hpp"
#include "pattern.hpp"
#include "transfer_executor.hpp"

// Single-shot "local inventory changed" flag. Raising it while already
// raised does not queue a second notification.
class InventorySignal {
public:
  void raise();
  bool consume();
  void set_listener(std::function<void()> listener);

private:
  std::atomic<bool> pending_{false};
  std::mutex listener_mutex_;
  std::function<void()> listener_;
};

struct MoveOptions {
  bool verbose = false;
};

class MoveOrchestrator {
public:
  MoveOrchestrator(std::shared_ptr<Directory> directory,
                   std::shared_ptr<TransferExecutor> executor,
                   std::shared_ptr<Logger> logger = nullptr);

  MoveResult move(const std::string& source,
                  const std::string& destination,
                  const MoveOptions& options = {});

  // Same as above against an existing directory snapshot; the balancer
  // reuses one snapshot for all of its moves.
  MoveResult move(const MovePattern& source,
                  const MovePattern& destination,
                  const MoveOptions& options,
                  const DirectorySnapshot& snapshot);

  // Moves between already-resolved node sets. A destination outside any
  // mode must hold exactly one node.
  MoveResult move_resolved(const LocationResolution& sources,
                           const ItemPattern& item,
                           const CountSpec& count,
                           const LocationResolution& targets,
                           const MoveOptions& options,
                           const std::optional<std::string>& local_name);

  InventorySignal& inventory_signal() { return inventory_signal_; }
  const LocationResolver& resolver() const { return resolver_; }

private:
  MoveResult fail_location(const std::string& side, const std::string& location);

  std::shared_ptr<Directory> directory_;
  std::shared_ptr<TransferExecutor> executor_;
  std::shared_ptr<Logger> logger_;
  LocationResolver resolver_;
  InventorySignal inventory_signal_;
};
