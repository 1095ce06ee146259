#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "balancer.hpp"
#include "directory.hpp"
#include "errors.hpp"
#include "inventory_network.hpp"
#include "location_resolver.hpp"
#include "log.hpp"
#include "move_orchestrator.hpp"
#include "node.hpp"
#include "query_engine.hpp"
#include "transfer_executor.hpp"

class SettingsManager;

// Front door for callers: wires one Directory, TransferExecutor,
// MoveOrchestrator, QueryEngine and Balancer over a single network.
class TransferEngine {
public:
  struct Options {
    // Unset: a RemoteNetwork to hub_host:hub_port.
    std::shared_ptr<InventoryNetwork> network;
    // Unset: discovery_attempts / discovery_delay_ms from settings.
    std::optional<RetryPolicy> retry;
    // Unset: follows the debug setting.
    std::optional<bool> strict;
  };

  TransferEngine(std::shared_ptr<SettingsManager> settings, Options options);
  explicit TransferEngine(std::shared_ptr<SettingsManager> settings = nullptr);

  MoveResult move(const std::string& source,
                  const std::string& destination,
                  const MoveOptions& options = {});

  int query_count(const std::string& item);
  NodeCount query_high(const std::string& item);
  NodeCount query_low(const std::string& item, bool include_empty = false);
  // A missing limit falls back to the balance_limit setting when positive.
  MoveResult query_balance(const std::string& item, BalanceOptions options = {});

  std::optional<std::string> local_name();
  std::vector<std::string> inventories();
  LocationResolution match_location(const std::string& location);
  std::vector<ItemStack> find_items(const Node& node, const std::string& item);
  // Single-slot transfer; throws TransferFault on a hard failure in strict
  // mode.
  int transfer(const Node& source, int slot, const Node& destination, int count);

  InventorySignal& inventory_signal() { return mover_->inventory_signal(); }

  void set_strict(bool strict) { executor_->set_strict(strict); }
  bool strict() const { return executor_->strict(); }

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<MoveOrchestrator> mover() const { return mover_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

private:
  RetryPolicy retry_from_settings() const;

  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<InventoryNetwork> network_;
  std::shared_ptr<Directory> directory_;
  std::shared_ptr<TransferExecutor> executor_;
  std::shared_ptr<MoveOrchestrator> mover_;
  std::shared_ptr<QueryEngine> queries_;
  std::shared_ptr<Balancer> balancer_;
};
