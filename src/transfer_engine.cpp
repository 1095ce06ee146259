#include "transfer_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "remote_network.hpp"
#include "settings_manager.hpp"

TransferEngine::TransferEngine(std::shared_ptr<SettingsManager> settings)
  : TransferEngine(std::move(settings), Options{}) {}

TransferEngine::TransferEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("invmesh")) {
  network_ = std::move(options.network);
  if(!network_) {
    int port = settings_->get<int>("hub_port");
    if(port <= 0 || port > 65535) {
      logger_->error("Invalid hub_port '{}'", port);
      throw std::runtime_error("Invalid hub_port");
    }
    network_ = std::make_shared<RemoteNetwork>(settings_->get<std::string>("hub_host"),
                                               static_cast<uint16_t>(port),
                                               logger_);
  }

  RetryPolicy retry = options.retry ? *options.retry : retry_from_settings();
  bool strict = options.strict ? *options.strict : settings_->get<bool>("debug");

  directory_ = std::make_shared<Directory>(network_, std::move(retry), logger_);
  executor_ = std::make_shared<TransferExecutor>(network_, logger_, strict);
  mover_ = std::make_shared<MoveOrchestrator>(directory_, executor_, logger_);
  queries_ = std::make_shared<QueryEngine>(directory_, executor_);
  balancer_ = std::make_shared<Balancer>(directory_, queries_, mover_, logger_);
}

RetryPolicy TransferEngine::retry_from_settings() const {
  RetryPolicy retry;
  retry.max_attempts = std::max(1, settings_->get<int>("discovery_attempts"));
  retry.delay = std::chrono::milliseconds(std::max(0, settings_->get<int>("discovery_delay_ms")));
  return retry;
}

MoveResult TransferEngine::move(const std::string& source,
                                const std::string& destination,
                                const MoveOptions& options) {
  return mover_->move(source, destination, options);
}

int TransferEngine::query_count(const std::string& item) {
  return queries_->count(ItemPattern::parse(item));
}

NodeCount TransferEngine::query_high(const std::string& item) {
  return queries_->high(ItemPattern::parse(item));
}

NodeCount TransferEngine::query_low(const std::string& item, bool include_empty) {
  return queries_->low(ItemPattern::parse(item), include_empty);
}

MoveResult TransferEngine::query_balance(const std::string& item, BalanceOptions options) {
  if(!options.limit) {
    int configured = settings_->get<int>("balance_limit");
    if(configured > 0) options.limit = configured;
  }
  return balancer_->balance(ItemPattern::parse(item), options);
}

std::optional<std::string> TransferEngine::local_name() {
  return directory_->discover_local_name();
}

std::vector<std::string> TransferEngine::inventories() {
  return directory_->discover_inventories();
}

LocationResolution TransferEngine::match_location(const std::string& location) {
  auto pattern = parse_location(location);
  DirectorySnapshot snapshot;
  if(!pattern.is_self()) {
    snapshot = directory_->snapshot();
  } else {
    snapshot.local_name = directory_->discover_local_name();
  }
  return mover_->resolver().resolve(pattern, snapshot);
}

std::vector<ItemStack> TransferEngine::find_items(const Node& node, const std::string& item) {
  return executor_->find_items(node, ItemPattern::parse(item));
}

int TransferEngine::transfer(const Node& source, int slot, const Node& destination, int count) {
  auto name = directory_->discover_local_name();
  if(!name) name = directory_->context().last_local_name;
  int moved = executor_->execute(source, slot, destination, count, name);
  if(moved > 0 && (source.local_actor || destination.local_actor)) {
    mover_->inventory_signal().raise();
  }
  return moved;
}

LogListenerHandle TransferEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  return logger_->add_listener(std::move(listener), user_data);
}

void TransferEngine::remove_log_listener(LogListenerHandle handle) {
  if(handle != 0) {
    logger_->remove_listener(handle);
  }
}
