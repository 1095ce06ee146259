#include "hub_service.hpp"

#include <stdexcept>

#include "protocol.hpp"

HubService::HubService(std::shared_ptr<WorldNetwork> world, std::shared_ptr<Logger> logger)
  : world_(std::move(world)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("hub")) {
  if(!world_) {
    throw std::invalid_argument("HubService requires a world");
  }
}

std::shared_ptr<InventoryPeripheral> HubService::require_peripheral(const nlohmann::json& request) {
  auto name = request.at("peripheral").get<std::string>();
  auto peripheral = world_->wrap(name);
  if(!peripheral) {
    throw std::runtime_error("No such inventory: " + name);
  }
  return peripheral;
}

nlohmann::json HubService::dispatch(const std::string& type, const nlohmann::json& request) {
  if(type == kRequestNames) {
    return world_->peripheral_names();
  }
  if(type == kRequestLocalName) {
    auto name = world_->local_name();
    return name ? nlohmann::json(*name) : nlohmann::json(nullptr);
  }
  if(type == kRequestLocalItems) {
    return world_->local_items();
  }
  if(type == kRequestDescribe) {
    auto peripheral = world_->wrap(request.at("peripheral").get<std::string>());
    if(!peripheral) return nullptr;
    return nlohmann::json{{"push", peripheral->supports_push()},
                          {"pull", peripheral->supports_pull()}};
  }
  if(type == kRequestList) {
    return require_peripheral(request)->list();
  }
  if(type == kRequestPushItems) {
    return require_peripheral(request)->push_items(request.at("to").get<std::string>(),
                                                   request.at("slot").get<int>(),
                                                   request.at("limit").get<int>());
  }
  if(type == kRequestPullItems) {
    return require_peripheral(request)->pull_items(request.at("from").get<std::string>(),
                                                   request.at("slot").get<int>(),
                                                   request.at("limit").get<int>());
  }
  throw std::runtime_error("Unknown request type '" + type + "'");
}

nlohmann::json HubService::handle(const nlohmann::json& request) {
  const uint64_t id = request.value("id", uint64_t{0});
  const std::string type = request.value("type", "");
  try {
    auto value = dispatch(type, request);
    logger_->debug("{} #{} ok", type, id);
    return make_result(id, std::move(value));
  } catch(const std::exception& e) {
    logger_->debug("{} #{} failed: {}", type, id, e.what());
    return make_error(id, e.what());
  }
}
