#pragma once
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"
#include "world_network.hpp"

// Operator console for a hub: inspect and restock the world while clients
// are connected. Output goes through the logger's print channel.
class HubConsole {
public:
  HubConsole(std::shared_ptr<WorldNetwork> world,
             std::shared_ptr<SettingsManager> settings,
             std::shared_ptr<Logger> logger)
    : world_(std::move(world)), settings_(std::move(settings)),
      logger_(logger ? std::move(logger) : std::make_shared<Logger>("console")),
      running_(true) {}

  void run_loop() {
    while(running_) {
      auto input = read_command_line("hub> ");
      if(!input) break;
      if(!execute_command(*input)) break;
    }
    running_ = false;
  }

  bool running() const { return running_; }

  // Returns false once the console should exit.
  bool execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return true;

    std::string args;
    std::getline(iss, args);
    args = trim_copy(args);

    try {
      if(cmd == "nodes" || cmd == "n") {
        list_nodes();
      } else if(cmd == "show") {
        show_node(args);
      } else if(cmd == "give") {
        give(args);
      } else if(cmd == "take") {
        take(args);
      } else if(cmd == "attach") {
        attach(args);
      } else if(cmd == "drop") {
        drop(args);
      } else if(cmd == "connect") {
        connect(args);
      } else if(cmd == "save") {
        save_world(args);
      } else if(cmd == "settings" || cmd == "s") {
        list_settings();
      } else if(cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
      } else if(cmd == "quit" || cmd == "exit") {
        logger_->print("Quitting...");
        running_ = false;
        return false;
      } else {
        print_help();
        logger_->print("Unknown command: {}", cmd);
      }
    } catch(const std::exception& e) {
      logger_->print("Error: {}", e.what());
    }
    return true;
  }

private:
  std::optional<std::string> read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
#else
    std::cout << prompt;
    std::cout.flush();
    std::string line;
    if(!std::getline(std::cin, line)) return std::nullopt;
    return line;
#endif
  }

  void list_nodes() {
    const auto& local = world_->local_identity();
    logger_->print("  {:<28} local actor, {} ({} stacks)",
                   local,
                   world_->connected() ? "connected" : "disconnected",
                   world_->contents(local).size());
    for(const auto& name : world_->attached_names()) {
      WorldNetwork::PeripheralOptions options;
      if(!world_->describe(name, options)) continue;
      if(!options.inventory) {
        logger_->print("  {:<28} not an inventory", name);
        continue;
      }
      logger_->print("  {:<28} {} slots, push={} pull={} ({} stacks)",
                     name, options.slots,
                     options.push ? "yes" : "no",
                     options.pull ? "yes" : "no",
                     world_->contents(name).size());
    }
  }

  void show_node(const std::string& node) {
    if(node.empty()) {
      logger_->print("Usage: show <node>");
      return;
    }
    auto stacks = world_->contents(node);
    if(stacks.empty()) {
      logger_->print("{} is empty", node);
      return;
    }
    for(const auto& stack : stacks) {
      logger_->print("  [{:>2}] {} x {} (max {})", stack.slot, stack.name, stack.count, stack.max_count);
    }
  }

  void give(const std::string& args) {
    std::istringstream iss(args);
    std::string node, item;
    int count = 0;
    int max_count = 0;
    if(!(iss >> node >> item >> count) || count <= 0) {
      logger_->print("Usage: give <node> <item> <count> [max]");
      return;
    }
    iss >> max_count;
    int stored = world_->give(node, item, count, max_count);
    logger_->print("Gave {} x {} to {}", stored, item, node);
    if(stored < count) {
      logger_->print("  ({} did not fit)", count - stored);
    }
  }

  void take(const std::string& args) {
    std::istringstream iss(args);
    std::string node;
    int slot = 0;
    if(!(iss >> node >> slot)) {
      logger_->print("Usage: take <node> <slot> [count]");
      return;
    }
    int count = std::numeric_limits<int>::max();
    iss >> count;
    int removed = world_->take(node, slot, count);
    logger_->print("Took {} from {} slot {}", removed, node, slot);
  }

  void attach(const std::string& args) {
    std::istringstream iss(args);
    std::string name;
    WorldNetwork::PeripheralOptions options;
    if(!(iss >> name)) {
      logger_->print("Usage: attach <name> [slots]");
      return;
    }
    iss >> options.slots;
    if(options.slots <= 0) {
      logger_->print("Usage: attach <name> [slots]");
      return;
    }
    world_->add_peripheral(name, options);
    logger_->print("Attached {} ({} slots)", name, options.slots);
  }

  void drop(const std::string& name) {
    if(name.empty()) {
      logger_->print("Usage: drop <name>");
      return;
    }
    if(!world_->remove_peripheral(name)) {
      logger_->print("No such peripheral: {}", name);
      return;
    }
    logger_->print("Detached {}", name);
  }

  void connect(const std::string& args) {
    auto value = to_lower_copy(args);
    if(value.empty()) {
      logger_->print("{} is {}", world_->local_identity(),
                     world_->connected() ? "connected" : "disconnected");
      return;
    }
    if(!SettingsManager::is_bool_literal(value)) {
      logger_->print("Usage: connect on|off");
      return;
    }
    bool on = value == "on" || value == "true" || value == "1" || value == "yes";
    world_->set_connected(on);
    logger_->print("{} {}", world_->local_identity(), on ? "connected" : "disconnected");
  }

  void save_world(const std::string& args) {
    std::filesystem::path path = args;
    if(path.empty() && settings_) {
      path = settings_->get<std::string>("world_file");
    }
    if(path.empty()) {
      logger_->print("Usage: save <path> (no world_file configured)");
      return;
    }
    std::error_code ec;
    if(path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::trunc);
    if(!out) {
      logger_->print("Unable to write {}", path.string());
      return;
    }
    out << world_->to_json().dump(2) << "\n";
    logger_->print("World saved to {}", path.string());
  }

  void list_settings() {
    if(!settings_) {
      logger_->print("Settings manager unavailable.");
      return;
    }
    for(const auto& key : settings_->keys()) {
      logger_->print("  {:<20} {}", key, settings_->value_as_string(key));
    }
  }

  void print_help() {
    logger_->print("Available commands:");
    logger_->print("  help|h|?                          Show this help message");
    logger_->print("  quit                              Stop the hub");
    logger_->print("  nodes|n                           List the local actor and peripherals");
    logger_->print("  show <node>                       List the stacks of one inventory");
    logger_->print("  give <node> <item> <count> [max]  Insert items, stacking up to max");
    logger_->print("  take <node> <slot> [count]        Remove items from a slot");
    logger_->print("  attach <name> [slots]             Attach an empty chest");
    logger_->print("  drop <name>                       Detach a peripheral and its contents");
    logger_->print("  connect [on|off]                  Attach or detach the local actor");
    logger_->print("  save [path]                       Write the world (default world_file)");
    logger_->print("  settings|s                        Show runtime settings");
  }

  std::shared_ptr<WorldNetwork> world_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> running_;
};
