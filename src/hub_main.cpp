#include <cpptrace/cpptrace.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <unistd.h>

#include "command_line_parser.hpp"
#include "hub_console.hpp"
#include "hub_server.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "world_network.hpp"

namespace {

const nlohmann::json HUB_ARGV_SPECIFICATION = nlohmann::json::array({
  {{"index", 0}, {"key", "world_file"}}
});

// Used when no world file is given: the agent plus three chests.
std::shared_ptr<WorldNetwork> make_default_world() {
  auto world = std::make_shared<WorldNetwork>("turtle_1");
  world->set_max_stack("minecraft:lava_bucket", 1);
  world->set_max_stack("minecraft:ender_pearl", 16);
  world->add_peripheral("minecraft:chest_0");
  world->add_peripheral("minecraft:chest_1");
  world->add_peripheral("minecraft:chest_2");
  world->add_peripheral("modem_0", WorldNetwork::PeripheralOptions{0, false, false, false});
  world->give("minecraft:chest_0", "minecraft:coal", 96);
  world->give("minecraft:chest_1", "minecraft:iron_ingot", 40);
  world->give("turtle_1", "minecraft:cobblestone", 64);
  return world;
}

std::shared_ptr<WorldNetwork> load_world(const std::filesystem::path& path, Logger& logger) {
  std::ifstream in(path);
  if(!in) {
    throw std::runtime_error("Unable to open world file " + path.string());
  }
  nlohmann::json doc;
  in >> doc;
  auto world = WorldNetwork::from_json(doc);
  logger.info("Loaded world {} ({} peripherals)", path.string(), world->attached_names().size());
  return world;
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "invmesh.json");
    settings->load();

    CommandLineParser parser("invmesh_hub",
                             "serve a simulated inventory network over TCP",
                             HUB_ARGV_SPECIFICATION);
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings->get<bool>("verbose"), settings->get<bool>("debug"));
    auto logger = std::make_shared<Logger>("hub");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    int listen_port_value = settings->get<int>("listen_port");
    if(listen_port_value < 0 || listen_port_value > 65535) {
      logger->error("Invalid listen_port '{}'", listen_port_value);
      return 1;
    }

    const auto world_file = settings->get<std::string>("world_file");
    auto world = world_file.empty() ? make_default_world() : load_world(world_file, *logger);

    HubServer::Options options;
    options.listen_ip = settings->get<std::string>("listen_ip");
    options.listen_port = static_cast<uint16_t>(listen_port_value);
    HubServer server(world, options, logger);
    server.start();
    logger->print("Hub serving {} on {}:{}",
                  world->local_identity(), options.listen_ip, server.listen_port());

    if(!isatty(STDIN_FILENO)) {
      server.run();
      return 0;
    }

    server.start_background();
    HubConsole console(world, settings, logger);
    console.run_loop();
    server.stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("hub-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
