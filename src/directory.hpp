#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "inventory_network.hpp"
#include "log.hpp"

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds delay{200};
  // Empty means std::this_thread::sleep_for.
  std::function<void(std::chrono::milliseconds)> sleep;

  void pause() const;

  // Same attempt budget without any real waiting.
  static RetryPolicy immediate(int attempts = 3);
};

// What one discovery pass saw. Taken once per engine call and reused for
// the rest of that call.
struct DirectorySnapshot {
  std::vector<std::string> peripherals;
  std::vector<std::string> inventories;
  std::optional<std::string> local_name;
};

// Retry policy plus the last local identity the network reported.
struct DiscoveryContext {
  RetryPolicy retry;
  std::optional<std::string> last_local_name;
};

class Directory {
public:
  Directory(std::shared_ptr<InventoryNetwork> network,
            RetryPolicy retry = {},
            std::shared_ptr<Logger> logger = nullptr);

  // Both return an empty result once the retry budget is spent.
  std::optional<std::string> discover_local_name();
  std::vector<std::string> discover_inventories();

  DirectorySnapshot snapshot();

  // True when the id is the agent's own network name, as reported now or,
  // failing that, the last time the network answered.
  bool is_local_name(const DirectorySnapshot& snapshot, const std::string& id) const;

  const DiscoveryContext& context() const { return context_; }

private:
  bool try_discover(DirectorySnapshot& out, int attempt);

  std::shared_ptr<InventoryNetwork> network_;
  DiscoveryContext context_;
  std::shared_ptr<Logger> logger_;
};
