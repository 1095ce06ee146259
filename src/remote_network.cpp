#include "remote_network.hpp"

#include <istream>
#include <stdexcept>

#include "protocol.hpp"

namespace {

class RemotePeripheral : public InventoryPeripheral {
public:
  RemotePeripheral(std::shared_ptr<HubClient> client, std::string name, bool push, bool pull)
    : client_(std::move(client)), name_(std::move(name)), push_(push), pull_(pull) {}

  const std::string& name() const override { return name_; }

  std::vector<ItemStack> list() override {
    return client_->call(kRequestList, {{"peripheral", name_}}).get<std::vector<ItemStack>>();
  }

  bool supports_push() const override { return push_; }
  bool supports_pull() const override { return pull_; }

  int push_items(const std::string& to_name, int from_slot, int limit) override {
    if(!push_) {
      throw std::runtime_error(name_ + " has no push_items");
    }
    return client_->call(kRequestPushItems,
                         {{"peripheral", name_}, {"to", to_name},
                          {"slot", from_slot}, {"limit", limit}}).get<int>();
  }

  int pull_items(const std::string& from_name, int from_slot, int limit) override {
    if(!pull_) {
      throw std::runtime_error(name_ + " has no pull_items");
    }
    return client_->call(kRequestPullItems,
                         {{"peripheral", name_}, {"from", from_name},
                          {"slot", from_slot}, {"limit", limit}}).get<int>();
  }

private:
  std::shared_ptr<HubClient> client_;
  std::string name_;
  bool push_;
  bool pull_;
};

} // namespace

HubClient::HubClient(std::string host, uint16_t port, std::shared_ptr<Logger> logger)
  : host_(std::move(host)),
    port_(port),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("hub-client")),
    socket_(io_) {}

HubClient::~HubClient() {
  close();
}

void HubClient::ensure_connected() {
  if(socket_.is_open()) return;
  tcp::resolver resolver(io_);
  auto endpoints = resolver.resolve(host_, std::to_string(port_));
  asio::connect(socket_, endpoints);
  logger_->debug("Connected to hub {}:{}", host_, port_);
}

nlohmann::json HubClient::call(const std::string& type, nlohmann::json fields) {
  std::lock_guard lg(m_);
  const uint64_t id = next_id_++;
  json response;
  try {
    ensure_connected();
    auto line = make_request(type, id, std::move(fields)).dump() + "\n";
    asio::write(socket_, asio::buffer(line));

    asio::read_until(socket_, read_buf_, "\n");
    std::istream is(&read_buf_);
    std::string reply;
    std::getline(is, reply);
    response = json::parse(reply);
  } catch(const std::exception& e) {
    close_locked();
    throw std::runtime_error("Hub " + host_ + ":" + std::to_string(port_) +
                             " unreachable: " + e.what());
  }

  if(response.value("id", uint64_t{0}) != id) {
    close_locked();
    throw std::runtime_error("Hub answered out of order");
  }
  if(!response.value("ok", false)) {
    throw std::runtime_error(response.value("error", std::string("request failed")));
  }
  return response.value("value", json());
}

void HubClient::close() {
  std::lock_guard lg(m_);
  close_locked();
}

void HubClient::close_locked() {
  std::error_code ec;
  socket_.close(ec);
  read_buf_.consume(read_buf_.size());
}

RemoteNetwork::RemoteNetwork(std::shared_ptr<HubClient> client)
  : client_(std::move(client)) {
  if(!client_) {
    throw std::invalid_argument("RemoteNetwork requires a client");
  }
}

RemoteNetwork::RemoteNetwork(const std::string& host, uint16_t port, std::shared_ptr<Logger> logger)
  : RemoteNetwork(std::make_shared<HubClient>(host, port, std::move(logger))) {}

std::vector<std::string> RemoteNetwork::peripheral_names() {
  return client_->call(kRequestNames).get<std::vector<std::string>>();
}

std::shared_ptr<InventoryPeripheral> RemoteNetwork::wrap(const std::string& name) {
  auto description = client_->call(kRequestDescribe, {{"peripheral", name}});
  if(description.is_null()) return nullptr;
  return std::make_shared<RemotePeripheral>(client_, name,
                                            description.value("push", false),
                                            description.value("pull", false));
}

std::optional<std::string> RemoteNetwork::local_name() {
  auto value = client_->call(kRequestLocalName);
  if(value.is_null()) return std::nullopt;
  return value.get<std::string>();
}

std::vector<ItemStack> RemoteNetwork::local_items() {
  return client_->call(kRequestLocalItems).get<std::vector<ItemStack>>();
}
