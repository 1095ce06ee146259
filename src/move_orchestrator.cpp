#include "move_orchestrator.hpp"

#include <algorithm>
#include <stdexcept>

void InventorySignal::raise() {
  if(pending_.exchange(true)) return;
  std::function<void()> listener;
  {
    std::lock_guard lg(listener_mutex_);
    listener = listener_;
  }
  if(listener) listener();
}

bool InventorySignal::consume() {
  return pending_.exchange(false);
}

void InventorySignal::set_listener(std::function<void()> listener) {
  std::lock_guard lg(listener_mutex_);
  listener_ = std::move(listener);
}

namespace {

std::shared_ptr<Directory> require_directory(std::shared_ptr<Directory> directory) {
  if(!directory) {
    throw std::invalid_argument("MoveOrchestrator requires a directory");
  }
  return directory;
}

} // namespace

MoveOrchestrator::MoveOrchestrator(std::shared_ptr<Directory> directory,
                                   std::shared_ptr<TransferExecutor> executor,
                                   std::shared_ptr<Logger> logger)
  : directory_(require_directory(std::move(directory))),
    executor_(std::move(executor)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("move")),
    resolver_(*directory_) {
  if(!executor_) {
    throw std::invalid_argument("MoveOrchestrator requires a transfer executor");
  }
}

MoveResult MoveOrchestrator::fail_location(const std::string& side, const std::string& location) {
  auto message = "Could not find " + side + " location: " + location;
  logger_->debug("ERROR: {}", message);
  if(executor_->strict()) {
    throw TransferFault(TransferError::LocationNotFound, message);
  }
  return MoveResult::failure(TransferError::LocationNotFound, message);
}

MoveResult MoveOrchestrator::move(const std::string& source,
                                  const std::string& destination,
                                  const MoveOptions& options) {
  logger_->debug("move('{}', '{}')", source, destination);
  auto src = parse_pattern(source);
  auto dst = parse_pattern(destination);
  logger_->debug("  parsed src: loc={} item={} count={}",
                 src.location.raw, src.item.to_string(), src.count.to_string());
  logger_->debug("  parsed dst: loc={} item={} count={}",
                 dst.location.raw, dst.item.to_string(), dst.count.to_string());
  return move(src, dst, options, directory_->snapshot());
}

MoveResult MoveOrchestrator::move(const MovePattern& source,
                                  const MovePattern& destination,
                                  const MoveOptions& options,
                                  const DirectorySnapshot& snapshot) {
  auto sources = resolver_.resolve(source.location, snapshot);
  auto targets = resolver_.resolve(destination.location, snapshot);
  logger_->debug("  sources: {} (any={}) destinations: {} (any={})",
                 sources.nodes.size(), sources.any_mode,
                 targets.nodes.size(), targets.any_mode);

  if(sources.empty()) return fail_location("source", source.location.raw);
  if(targets.empty()) return fail_location("destination", destination.location.raw);
  return move_resolved(sources, source.item, source.count, targets, options, snapshot.local_name);
}

MoveResult MoveOrchestrator::move_resolved(const LocationResolution& sources,
                                           const ItemPattern& item,
                                           const CountSpec& count,
                                           const LocationResolution& targets,
                                           const MoveOptions& options,
                                           const std::optional<std::string>& local_name) {
  if(targets.empty()) {
    return MoveResult::failure(TransferError::LocationNotFound, "No destination location");
  }
  if(!targets.any_mode && targets.nodes.size() > 1) {
    return MoveResult::failure(TransferError::AmbiguousDestination,
                               "Destination must be a single location, matched: " +
                               std::to_string(targets.nodes.size()));
  }

  const bool drain = count.kind == CountSpec::Kind::AllMatching;
  bool stack_pending = count.kind == CountSpec::Kind::OneStack;
  int remaining = count.kind == CountSpec::Kind::Fixed ? count.amount : 0;
  auto exhausted = [&]{ return !drain && !stack_pending && remaining <= 0; };

  int total = 0;
  auto record = [&](const Node& from, const ItemStack& stack, const Node& to, int moved) {
    total += moved;
    if(!drain) remaining -= moved;
    if(options.verbose) {
      logger_->print("{}: {} x {} -> {}", from.id, moved, stack.name, to.id);
    }
  };

  for(const auto& from : sources.nodes) {
    if(exhausted()) break;
    for(const auto& stack : executor_->find_items(from, item)) {
      if(exhausted()) break;

      int wanted = 0;
      if(drain) {
        wanted = stack.count;
      } else if(stack_pending) {
        wanted = std::min(stack.max_count, stack.count);
        remaining = wanted;
        stack_pending = false;
      } else {
        wanted = std::min(remaining, stack.count);
      }
      if(wanted <= 0) continue;

      if(targets.any_mode) {
        for(const auto& to : targets.nodes) {
          if(to.same_as(from)) continue;
          int moved = executor_->execute(from, stack.slot, to, wanted, local_name);
          if(moved > 0) {
            record(from, stack, to, moved);
            break;
          }
        }
      } else {
        const auto& to = targets.nodes.front();
        int moved = executor_->execute(from, stack.slot, to, wanted, local_name);
        if(moved > 0) record(from, stack, to, moved);
      }
    }
  }

  if(total == 0) {
    return MoveResult::failure(TransferError::NoMatchOrFull,
                               "No items matching '" + item.to_string() +
                               "' found or destination full");
  }

  if(options.verbose) {
    logger_->print("Total: {} items transferred", total);
  }

  auto is_local = [](const Node& node){ return node.local_actor; };
  if(std::any_of(sources.nodes.begin(), sources.nodes.end(), is_local) ||
     std::any_of(targets.nodes.begin(), targets.nodes.end(), is_local)) {
    inventory_signal_.raise();
  }
  return MoveResult::success(total);
}
