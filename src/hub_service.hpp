#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "world_network.hpp"

// Answers wire requests against a WorldNetwork. Faults inside the world are
// reported as error responses, never thrown.
class HubService {
public:
  HubService(std::shared_ptr<WorldNetwork> world, std::shared_ptr<Logger> logger = nullptr);

  nlohmann::json handle(const nlohmann::json& request);

  std::shared_ptr<WorldNetwork> world() const { return world_; }

private:
  nlohmann::json dispatch(const std::string& type, const nlohmann::json& request);
  std::shared_ptr<InventoryPeripheral> require_peripheral(const nlohmann::json& request);

  std::shared_ptr<WorldNetwork> world_;
  std::shared_ptr<Logger> logger_;
};
