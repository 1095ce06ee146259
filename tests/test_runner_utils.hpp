#pragma once

#include "log.hpp"
#include "settings_manager.hpp"
#include "transfer_engine.hpp"
#include "world_network.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace invmesh::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        record(label.empty() ? channel : label, message);
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void attach(TransferEngine& engine, const std::string& label = std::string()) {
    attach(engine.logger(), label);
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  void record(const std::string& label, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.emplace_back(label + ": " + message);
    cv_.notify_all();
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// Reports the failed condition and returns it, so tests can chain checks
// with &&.
inline bool expect(bool condition, const std::string& what) {
  if(!condition) {
    std::cerr << "\n    expectation failed: " << what << "\n";
  }
  return condition;
}

// Agent "turtle_1" plus one 27-slot chest per name, all push/pull capable.
inline std::shared_ptr<WorldNetwork> make_world(const std::vector<std::string>& chests,
                                                const std::string& local_name = "turtle_1") {
  auto world = std::make_shared<WorldNetwork>(local_name);
  for(const auto& chest : chests) {
    world->add_peripheral(chest);
  }
  return world;
}

inline std::shared_ptr<TransferEngine> make_engine(std::shared_ptr<InventoryNetwork> network,
                                                   bool strict = false,
                                                   int attempts = 3) {
  TransferEngine::Options options;
  options.network = std::move(network);
  options.retry = RetryPolicy::immediate(attempts);
  options.strict = strict;
  return std::make_shared<TransferEngine>(std::make_shared<SettingsManager>(), options);
}

inline int total_items(const WorldNetwork& world, const std::string& node) {
  int total = 0;
  for(const auto& stack : world.contents(node)) total += stack.count;
  return total;
}

} // namespace invmesh::test
