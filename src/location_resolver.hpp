#pragma once

#include <optional>
#include <string>
#include <vector>

#include "directory.hpp"
#include "node.hpp"
#include "pattern.hpp"

struct LocationResolution {
  std::vector<Node> nodes;
  bool any_mode = false;

  bool empty() const { return nodes.empty(); }
};

class LocationResolver {
public:
  explicit LocationResolver(const Directory& directory) : directory_(directory) {}

  // Self resolves without touching the snapshot. Any lists every inventory.
  // Named tries an exact id first, then fuzzy matching; an empty result
  // means nothing matched.
  LocationResolution resolve(const LocationPattern& pattern,
                             const DirectorySnapshot& snapshot) const;

  // Case-insensitive substring match, falling back to a match with '_' and
  // ':' removed from both sides. The shortest matching id wins; ties keep
  // the input order.
  static std::optional<std::string> best_fuzzy_match(const std::string& pattern,
                                                     const std::vector<std::string>& ids);

  static Node self_node(const DirectorySnapshot& snapshot);

private:
  Node make_node(const DirectorySnapshot& snapshot, const std::string& id) const;

  const Directory& directory_;
};
