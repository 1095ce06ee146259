#include "directory.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

void RetryPolicy::pause() const {
  if(delay.count() <= 0) return;
  if(sleep) {
    sleep(delay);
  } else {
    std::this_thread::sleep_for(delay);
  }
}

RetryPolicy RetryPolicy::immediate(int attempts) {
  RetryPolicy policy;
  policy.max_attempts = attempts;
  policy.delay = std::chrono::milliseconds(0);
  policy.sleep = [](std::chrono::milliseconds) {};
  return policy;
}

Directory::Directory(std::shared_ptr<InventoryNetwork> network,
                     RetryPolicy retry,
                     std::shared_ptr<Logger> logger)
  : network_(std::move(network)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("directory")) {
  if(!network_) {
    throw std::invalid_argument("Directory requires a network");
  }
  context_.retry = std::move(retry);
  if(context_.retry.max_attempts < 1) context_.retry.max_attempts = 1;
}

std::optional<std::string> Directory::discover_local_name() {
  const int attempts = std::max(1, context_.retry.max_attempts);
  for(int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      if(auto name = network_->local_name()) {
        logger_->debug("local_name() -> {} (attempt {})", *name, attempt);
        context_.last_local_name = name;
        return name;
      }
    } catch(const std::exception& e) {
      logger_->debug("local_name() attempt {} raised: {}", attempt, e.what());
    }
    if(attempt < attempts) {
      logger_->debug("local_name() attempt {} failed, retrying", attempt);
      context_.retry.pause();
    }
  }
  logger_->debug("local_name() -> none (not connected after {} attempts)", attempts);
  return std::nullopt;
}

bool Directory::try_discover(DirectorySnapshot& out, int attempt) {
  try {
    auto names = network_->peripheral_names();
    std::vector<std::string> inventories;
    for(const auto& name : names) {
      if(network_->wrap(name)) inventories.push_back(name);
    }
    if(inventories.empty()) return false;
    logger_->debug("inventories() found {} (attempt {})", inventories.size(), attempt);
    out.peripherals = std::move(names);
    out.inventories = std::move(inventories);
    return true;
  } catch(const std::exception& e) {
    logger_->debug("inventories() attempt {} raised: {}", attempt, e.what());
    return false;
  }
}

std::vector<std::string> Directory::discover_inventories() {
  const int attempts = std::max(1, context_.retry.max_attempts);
  DirectorySnapshot found;
  for(int attempt = 1; attempt <= attempts; ++attempt) {
    if(try_discover(found, attempt)) return found.inventories;
    if(attempt < attempts) {
      logger_->debug("inventories() found none, retrying");
      context_.retry.pause();
    }
  }
  logger_->debug("inventories() -> empty after {} attempts", attempts);
  return {};
}

DirectorySnapshot Directory::snapshot() {
  DirectorySnapshot snap;
  const int attempts = std::max(1, context_.retry.max_attempts);
  bool found = false;
  for(int attempt = 1; attempt <= attempts && !found; ++attempt) {
    found = try_discover(snap, attempt);
    if(!found && attempt < attempts) context_.retry.pause();
  }
  if(!found) {
    logger_->debug("directory unavailable: no inventories after {} attempts", attempts);
  }
  snap.local_name = discover_local_name();
  return snap;
}

bool Directory::is_local_name(const DirectorySnapshot& snapshot, const std::string& id) const {
  if(snapshot.local_name) return *snapshot.local_name == id;
  return context_.last_local_name && *context_.last_local_name == id;
}
