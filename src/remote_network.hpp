#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "inventory_network.hpp"
#include "log.hpp"

// Blocking request/response client for a hub. Connects lazily and
// reconnects on the next call after an I/O failure. Every failure, including
// an error response, is raised as std::runtime_error.
class HubClient {
public:
  HubClient(std::string host, uint16_t port, std::shared_ptr<Logger> logger = nullptr);
  ~HubClient();

  HubClient(const HubClient&) = delete;
  HubClient& operator=(const HubClient&) = delete;

  // Returns the "value" member of a successful response.
  nlohmann::json call(const std::string& type,
                      nlohmann::json fields = nlohmann::json::object());

  void close();

private:
  using tcp = asio::ip::tcp;

  void ensure_connected();
  void close_locked();

  std::string host_;
  uint16_t port_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  tcp::socket socket_;
  asio::streambuf read_buf_;
  std::mutex m_;
  uint64_t next_id_ = 1;
};

// InventoryNetwork backed by a hub over TCP.
class RemoteNetwork : public InventoryNetwork {
public:
  explicit RemoteNetwork(std::shared_ptr<HubClient> client);
  RemoteNetwork(const std::string& host, uint16_t port, std::shared_ptr<Logger> logger = nullptr);

  std::vector<std::string> peripheral_names() override;
  std::shared_ptr<InventoryPeripheral> wrap(const std::string& name) override;
  std::optional<std::string> local_name() override;
  std::vector<ItemStack> local_items() override;

private:
  std::shared_ptr<HubClient> client_;
};
