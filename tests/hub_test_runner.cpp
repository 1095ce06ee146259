#include "hub_console.hpp"
#include "hub_server.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "remote_network.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "transfer_engine.hpp"
#include "world_network.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <stdexcept>
#include <vector>

using invmesh::test::expect;
using invmesh::test::make_engine;
using invmesh::test::make_world;

namespace {

struct TestContext {
  invmesh::test::LogCapture& logs;
  bool verbose = false;
};

// A started hub on an ephemeral loopback port plus its world.
struct RunningHub {
  std::shared_ptr<WorldNetwork> world;
  std::unique_ptr<HubServer> server;

  explicit RunningHub(std::shared_ptr<WorldNetwork> w) : world(std::move(w)) {
    HubServer::Options options;
    options.listen_ip = "127.0.0.1";
    options.listen_port = 0;
    server = std::make_unique<HubServer>(world, options);
    server->start();
    server->start_background();
  }

  ~RunningHub() {
    server->stop();
  }

  std::shared_ptr<RemoteNetwork> connect() const {
    return std::make_shared<RemoteNetwork>("127.0.0.1", server->listen_port());
  }
};

bool test_remote_discovery(TestContext& ctx) {
  auto world = make_world({"minecraft:chest_0", "minecraft:chest_1"});
  world->add_peripheral("modem_0", WorldNetwork::PeripheralOptions{1, false, false, false});
  RunningHub hub(world);
  ctx.logs.attach(hub.server->logger(), "hub");

  auto remote = hub.connect();
  auto names = remote->peripheral_names();
  auto modem = remote->wrap("modem_0");
  auto chest = remote->wrap("minecraft:chest_0");
  auto local = remote->local_name();

  return expect(hub.server->listen_port() != 0, "ephemeral port resolved") &&
         expect(names.size() == 3, "every peripheral is listed") &&
         expect(!modem, "non-inventories do not wrap") &&
         expect(chest && chest->supports_push() && chest->supports_pull(), "chest wraps with capabilities") &&
         expect(local && *local == "turtle_1", "local name over the wire") &&
         expect(ctx.logs.wait_for_substring("Accepted connection", std::chrono::seconds(2)),
                "hub logged the client");
}

bool test_remote_move_and_queries(TestContext&) {
  auto world = make_world({"minecraft:chest_0", "minecraft:chest_1", "minecraft:chest_2"});
  world->give("minecraft:chest_0", "minecraft:coal", 30);
  world->give("minecraft:chest_2", "minecraft:coal", 1);
  world->give("turtle_1", "minecraft:cobblestone", 64);
  RunningHub hub(world);

  auto engine = make_engine(hub.connect());
  auto to_actor = engine->move("chest0/coal:5", "./");
  auto from_actor = engine->move("./cobble:*", "chest_1");
  int count = engine->query_count("coal");
  auto high = engine->query_high("coal");

  return expect(to_actor.ok() && to_actor.transferred == 5, "fuzzy source, push to actor") &&
         expect(world->count_item("turtle_1", "minecraft:coal") == 5, "actor received coal") &&
         expect(from_actor.transferred == 64 &&
                world->count_item("minecraft:chest_1", "minecraft:cobblestone") == 64, "pull from actor") &&
         expect(count == 26, "count sees chests only") &&
         expect(high.node && *high.node == "minecraft:chest_0" && high.count == 25, "high over the wire");
}

bool test_remote_balance(TestContext&) {
  auto world = make_world({"A", "B", "C"});
  world->give("A", "minecraft:iron_ingot", 30);
  world->give("C", "minecraft:iron_ingot", 1);
  RunningHub hub(world);

  auto engine = make_engine(hub.connect());
  auto result = engine->query_balance("iron");
  auto again = engine->query_balance("iron");

  return expect(result.ok() && result.transferred == 19, "balanced over the wire") &&
         expect(world->count_item("A", "minecraft:iron_ingot") == 11, "surplus kept by the largest") &&
         expect(again.transferred == 0, "idempotent");
}

bool test_remote_faults_surface_as_errors(TestContext&) {
  auto world = make_world({"A", "B"});
  world->give("A", "minecraft:coal", 10);
  world->set_faulty("A", true);
  RunningHub hub(world);

  auto remote = hub.connect();
  bool list_threw = false;
  try {
    remote->wrap("A")->list();
  } catch(const std::runtime_error& e) {
    list_threw = std::string(e.what()).find("not responding") != std::string::npos;
  }

  auto engine = make_engine(remote);
  auto result = engine->move("A/coal:1", "B");

  return expect(list_threw, "world fault becomes a client-side exception") &&
         expect(!result.ok() && result.kind == TransferError::NoMatchOrFull, "engine degrades to no match") &&
         expect(world->count_item("A", "minecraft:coal") == 10, "nothing moved");
}

bool test_unreachable_hub(TestContext&) {
  uint16_t port = 0;
  {
    RunningHub hub(make_world({"A"}));
    port = hub.server->listen_port();
  }

  auto engine = make_engine(std::make_shared<RemoteNetwork>("127.0.0.1", port));
  auto inventories = engine->inventories();
  auto name = engine->local_name();
  auto result = engine->move("A/coal", "./");

  return expect(inventories.empty(), "no inventories without a hub") &&
         expect(!name, "no local name without a hub") &&
         expect(result.kind == TransferError::LocationNotFound, "named location cannot resolve");
}

bool test_stop_releases_clients(TestContext&) {
  auto hub = std::make_unique<RunningHub>(make_world({"A"}));
  auto remote = hub->connect();
  bool before = !remote->peripheral_names().empty();
  auto accepted = hub->server->stats().accepted;
  hub.reset();

  bool threw = false;
  try {
    remote->peripheral_names();
  } catch(const std::runtime_error&) {
    threw = true;
  }
  return expect(before && accepted == 1, "served one client") &&
         expect(threw, "calls fail once the hub is gone");
}

bool test_client_vanishing_mid_reply(TestContext&) {
  auto world = make_world({"minecraft:chest_0"});
  world->give("minecraft:chest_0", "minecraft:coal", 64 * 20);
  RunningHub hub(world);

  {
    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect({asio::ip::make_address("127.0.0.1"), hub.server->listen_port()});
    std::string burst;
    for(uint64_t id = 1; id <= 200; ++id) {
      burst += make_request(kRequestList, id, {{"peripheral", "minecraft:chest_0"}}).dump() + "\n";
    }
    asio::write(socket, asio::buffer(burst));
    std::error_code ec;
    socket.close(ec);
  }

  bool released = invmesh::test::wait_for_condition(
    [&]{
      auto stats = hub.server->stats();
      return stats.accepted == 1 && stats.open == 0;
    }, std::chrono::seconds(3));

  auto remote = hub.connect();
  auto names = remote->peripheral_names();
  return expect(released, "abandoned connection is released") &&
         expect(names.size() == 1, "hub keeps serving new clients") &&
         expect(hub.server->stats().accepted == 2, "both clients were accepted");
}

bool test_console_commands(TestContext& ctx) {
  auto world = make_world({"minecraft:chest_0"});
  auto settings = std::make_shared<SettingsManager>();
  auto path = std::filesystem::temp_directory_path() / "invmesh_hub_test" / "world.json";
  std::string error;
  settings->set_from_string("world_file", path.string(), error);

  auto logger = std::make_shared<Logger>("console");
  ctx.logs.attach(logger, "console");
  HubConsole console(world, settings, logger);

  console.execute_command("give minecraft:chest_0 minecraft:coal 70");
  console.execute_command("take minecraft:chest_0 2 4");
  console.execute_command("show minecraft:chest_0");
  console.execute_command("connect off");
  bool disconnected = !world->connected();
  console.execute_command("connect on");
  console.execute_command("attach barrel 9");
  auto with_barrel = world->attached_names();
  console.execute_command("drop barrel");
  console.execute_command("drop barrel");
  auto without_barrel = world->attached_names();
  console.execute_command("nodes");
  console.execute_command("save");
  console.execute_command("give nowhere minecraft:coal 1");
  bool keeps_running = console.execute_command("frobnicate");
  bool quit = !console.execute_command("quit");

  bool saved = std::filesystem::exists(path);
  std::shared_ptr<WorldNetwork> reloaded;
  if(saved) {
    std::ifstream in(path);
    nlohmann::json doc;
    in >> doc;
    reloaded = WorldNetwork::from_json(doc);
  }
  std::error_code ec;
  std::filesystem::remove_all(path.parent_path(), ec);

  return expect(world->count_item("minecraft:chest_0", "minecraft:coal") == 66, "give then take") &&
         expect(ctx.logs.contains("Gave 70 x minecraft:coal to minecraft:chest_0"), "give reported") &&
         expect(ctx.logs.contains("[ 2] minecraft:coal x 2 (max 64)"), "show lists slots") &&
         expect(disconnected && world->connected(), "connect toggles the actor") &&
         expect(with_barrel.size() == 2 && with_barrel.back() == "barrel" &&
                ctx.logs.contains("Attached barrel (9 slots)"), "attach adds a chest") &&
         expect(without_barrel.size() == 1 && ctx.logs.contains("Detached barrel") &&
                ctx.logs.contains("No such peripheral: barrel"), "drop removes it once") &&
         expect(ctx.logs.contains("turtle_1"), "nodes lists the actor") &&
         expect(saved && reloaded && reloaded->count_item("minecraft:chest_0", "minecraft:coal") == 66,
                "save writes a loadable world") &&
         expect(ctx.logs.contains("Error: No such inventory: nowhere"), "errors are printed") &&
         expect(keeps_running && ctx.logs.contains("Unknown command: frobnicate"), "unknown command") &&
         expect(quit && !console.running(), "quit stops the console");
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("INVMESH_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("INVMESH_TEST_LOGS") != nullptr) || verbose;
  if(!show_logs) {
    set_log_passthrough(false);
  }
  invmesh::test::LogCapture logs;
  TestContext ctx{logs, verbose};
  std::vector<TestCase> tests = {
    {"remote_discovery", test_remote_discovery},
    {"remote_move_and_queries", test_remote_move_and_queries},
    {"remote_balance", test_remote_balance},
    {"remote_faults_surface_as_errors", test_remote_faults_surface_as_errors},
    {"unreachable_hub", test_unreachable_hub},
    {"stop_releases_clients", test_stop_releases_clients},
    {"client_vanishing_mid_reply", test_client_vanishing_mid_reply},
    {"console_commands", test_console_commands}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " hub tests: " << std::flush;

  for(const auto& test : tests) {
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << "." << std::flush;
    } else {
      std::cout << "F" << std::flush;
      ++failures;
      if(verbose) {
        std::cout << "\n  FAILED: " << test.name << "\n";
        for(const auto& line : logs.snapshot()) {
          std::cout << "    " << line << "\n";
        }
      }
    }
  }
  std::cout << "\n";

  if(failures > 0) {
    std::cout << failures << " hub test(s) failed\n";
    return 1;
  }
  std::cout << "All tests passed\n";
  return 0;
}
