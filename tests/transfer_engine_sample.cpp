#include "hub_server.hpp"
#include "remote_network.hpp"
#include "settings_manager.hpp"
#include "transfer_engine.hpp"
#include "world_network.hpp"

#include <iostream>
#include <stdexcept>

// Serves a small world on a loopback port and drives it the way imv does.
int main() {
  init(false);

  auto world = std::make_shared<WorldNetwork>("turtle_1");
  world->add_peripheral("minecraft:chest_0");
  world->add_peripheral("minecraft:chest_1");
  world->add_peripheral("minecraft:chest_2");
  world->give("minecraft:chest_0", "minecraft:coal", 90);
  world->give("turtle_1", "minecraft:cobblestone", 32);

  HubServer::Options hub_options;
  hub_options.listen_port = 0;
  HubServer hub(world, hub_options);
  hub.start_background();

  auto settings = std::make_shared<SettingsManager>();
  auto configure = [&](const std::string& key, const nlohmann::json& value){
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  configure("hub_host", "127.0.0.1");
  configure("hub_port", hub.listen_port());
  configure("discovery_delay_ms", 0);

  TransferEngine engine(settings);

  MoveOptions verbose;
  verbose.verbose = true;
  engine.move("./cobble:++", "chest1", verbose);
  std::cout << "coal on network: " << engine.query_count("coal") << "\n";

  BalanceOptions balance;
  balance.verbose = true;
  auto result = engine.query_balance("coal", balance);
  std::cout << "balanced: " << result.transferred << " moved\n";

  hub.stop();
  return result.ok() ? 0 : 1;
}
