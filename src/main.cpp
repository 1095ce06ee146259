#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <string>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "pattern.hpp"
#include "settings_manager.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"

namespace {

const nlohmann::json IMV_ARGV_SPECIFICATION = nlohmann::json::array({
  {{"index", 0}, {"key", "source"}},
  {{"index", 1}, {"key", "destination"}}
});

void add_usage_lines(CommandLineParser& parser) {
  parser.add_usage_line("  imv [options] q:<item>:<mode>[:<param>]");
  parser.add_usage_line("");
  parser.add_usage_line("MOVE PATTERN: <location>/<item>:<count>");
  parser.add_usage_line("  location: peripheral name, fuzzy match (chest23), ./ (self), * or ../ (any)");
  parser.add_usage_line("  item: item name, =exact or substring, optional (defaults to *)");
  parser.add_usage_line("  count: number, * or + for one stack, ++ for all (defaults to 1)");
  parser.add_usage_line("");
  parser.add_usage_line("QUERY PATTERN: q:<item>:<mode>[:<param>]");
  parser.add_usage_line("  count: total items matching the pattern across the network");
  parser.add_usage_line("  high:  inventory with the most of the item");
  parser.add_usage_line("  low:   inventory with the least of the item (>0, or :empty to include 0)");
  parser.add_usage_line("  bal:   distribute evenly; :<limit> keeps looping until a pass moves < limit");
  parser.add_usage_line("");
  parser.add_usage_line("Examples:");
  parser.add_usage_line("  imv chest23/lava:1 ./        1 lava from chest23 to self");
  parser.add_usage_line("  imv ./coal:* chest23         full stack of coal from self to chest23");
  parser.add_usage_line("  imv ./*:++ ../               everything from self to the network");
  parser.add_usage_line("  imv -v q:coal:bal:10         balance coal until a pass moves < 10");
}

void print_node_count(const NodeCount& result, bool verbose) {
  if(!result.node) {
    print_out(nullptr, "Not found");
    return;
  }
  print_out(nullptr, "{}", *result.node);
  if(verbose) {
    print_out(nullptr, "  ({} items)", result.count);
  }
}

int run_query(TransferEngine& engine, const QueryCommand& query, bool verbose) {
  const auto item = query.item.to_string();
  switch(query.mode) {
    case QueryCommand::Mode::Count:
      print_out(nullptr, "{}", engine.query_count(item));
      return 0;

    case QueryCommand::Mode::High:
      print_node_count(engine.query_high(item), verbose);
      return 0;

    case QueryCommand::Mode::Low: {
      bool include_empty = query.param && to_lower_copy(*query.param) == "empty";
      print_node_count(engine.query_low(item, include_empty), verbose);
      return 0;
    }

    case QueryCommand::Mode::Balance: {
      BalanceOptions options;
      options.verbose = verbose;
      if(query.param) {
        auto limit = parse_count(*query.param);
        if(!limit || limit->kind != CountSpec::Kind::Fixed) {
          print_out(nullptr, "Error: balance limit must be a number, got '{}'", *query.param);
          return 1;
        }
        options.limit = limit->amount;
      }
      auto result = engine.query_balance(item, options);
      if(!result.ok()) {
        print_out(nullptr, "Error: {}", *result.error);
        return 1;
      }
      print_out(nullptr, "{}", result.transferred);
      return 0;
    }

    case QueryCommand::Mode::Unknown:
      break;
  }
  print_out(nullptr, "Unknown query mode: {}", query.mode_text);
  print_out(nullptr, "Valid modes: count, high, low, bal");
  return 1;
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "invmesh.json");
    settings->load();

    CommandLineParser parser("imv",
                             "move items between networked inventories",
                             IMV_ARGV_SPECIFICATION);
    add_usage_lines(parser);
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    const bool verbose = settings->get<bool>("verbose");
    const bool debug = settings->get<bool>("debug");
    // -v only adds transfer lines; diagnostics follow -d.
    init(false, debug);

    if(settings->save_requested()) {
      if(!settings->save()) {
        print_err(nullptr, "Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    const auto source = settings->get<std::string>("source");
    const auto destination = settings->get<std::string>("destination");

    if(auto query = parse_query(source)) {
      TransferEngine engine(settings);
      return run_query(engine, *query, verbose || debug);
    }

    if(source.empty() || destination.empty()) {
      parser.usage();
      return 1;
    }

    TransferEngine engine(settings);
    MoveOptions options;
    options.verbose = verbose || debug;
    auto result = engine.move(source, destination, options);
    if(!result.ok()) {
      print_out(nullptr, "Error: {}", *result.error);
      return 1;
    }
    return 0;
  } catch(const TransferFault& e) {
    Logger logger("imv");
    logger.error("{} ({})", e.what(), to_string(e.kind()));
    cpptrace::generate_trace().print();
    return 1;
  } catch(const std::exception& e) {
    Logger logger("imv");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
