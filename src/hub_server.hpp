#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"

class HubConnection;
class HubService;
class WorldNetwork;

// TCP front of a WorldNetwork. Owns its io_context; run() blocks, while
// start_background() serves from an internal thread.
class HubServer {
public:
  struct Options {
    std::string listen_ip = "127.0.0.1";
    uint16_t listen_port = 0;
  };

  HubServer(std::shared_ptr<WorldNetwork> world, Options options,
            std::shared_ptr<Logger> logger = nullptr);
  ~HubServer();

  void start();
  void run();
  void start_background();
  void stop();

  struct Stats {
    std::size_t accepted = 0;
    std::size_t open = 0;
  };

  Stats stats() const;

  // Bound port; resolved after start() when 0 was requested.
  uint16_t listen_port() const { return listen_port_; }
  std::shared_ptr<WorldNetwork> world() const { return world_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  using tcp = asio::ip::tcp;

  void start_accept();

  Options options_;
  std::shared_ptr<WorldNetwork> world_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<HubService> service_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::atomic<bool> started_{false};
  uint16_t listen_port_ = 0;
  std::atomic<std::size_t> accepted_{0};
  std::atomic<std::size_t> open_{0};
  std::mutex connections_mutex_;
  std::vector<std::weak_ptr<HubConnection>> connections_;
};
