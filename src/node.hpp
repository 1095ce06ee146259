#pragma once

#include <string>

// Id used for the agent's own inventory while it has no network name.
inline constexpr const char* kSelfNodeId = "@self";

struct Node {
  std::string id;
  bool local_actor = false;

  bool same_as(const Node& other) const {
    if(local_actor && other.local_actor) return true;
    return id == other.id;
  }
};
