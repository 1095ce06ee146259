#include "hub_server.hpp"

#include <algorithm>
#include <stdexcept>

#include "hub_connection.hpp"
#include "hub_service.hpp"
#include "world_network.hpp"

HubServer::HubServer(std::shared_ptr<WorldNetwork> world, Options options,
                     std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    world_(std::move(world)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("hub")) {
  service_ = std::make_shared<HubService>(world_, logger_);
}

HubServer::~HubServer() {
  stop();
}

void HubServer::start() {
  if(started_) return;

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(options_.listen_ip);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", options_.listen_ip, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, options_.listen_port);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  listen_port_ = acceptor_->local_endpoint().port();
  started_ = true;

  logger_->info("Hub listening on {}:{}", options_.listen_ip, listen_port_);
  start_accept();
}

void HubServer::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        logger_->error("Accept error: {}", ec.message());
      } else {
        ++accepted_;
        ++open_;
        auto conn = HubConnection::create(std::move(socket), service_, logger_,
                                          [this](){ --open_; });
        logger_->info("Accepted connection from {}", conn->remote());
        std::lock_guard lg(connections_mutex_);
        connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                          [](const auto& weak){ return weak.expired(); }),
                           connections_.end());
        connections_.push_back(conn);
      }
      if(started_) {
        start_accept();
      }
    });
}

void HubServer::run() {
  if(!started_) start();
  io_.run();
}

void HubServer::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void HubServer::stop() {
  if(!started_) return;
  started_ = false;

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  acceptor_.reset();

  // The loop is stopped; drop live clients so blocked readers see EOF.
  std::vector<std::weak_ptr<HubConnection>> connections;
  {
    std::lock_guard lg(connections_mutex_);
    connections.swap(connections_);
  }
  for(auto& weak : connections) {
    if(auto conn = weak.lock()) conn->close();
  }
  io_.restart();
}

HubServer::Stats HubServer::stats() const {
  Stats s;
  s.accepted = accepted_;
  s.open = open_;
  return s;
}
