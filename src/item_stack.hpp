#pragma once

#include <nlohmann/json.hpp>

#include <string>

inline constexpr int kDefaultMaxStack = 64;

// One item type sitting in one slot of one node. Slots are 1-based.
struct ItemStack {
  int slot = 0;
  std::string name;
  int count = 0;
  int max_count = kDefaultMaxStack;

  bool empty() const { return name.empty() || count <= 0; }
};

inline void to_json(nlohmann::json& j, const ItemStack& stack) {
  j = nlohmann::json{
    {"slot", stack.slot},
    {"name", stack.name},
    {"count", stack.count},
    {"max_count", stack.max_count}
  };
}

inline void from_json(const nlohmann::json& j, ItemStack& stack) {
  stack.slot = j.value("slot", 0);
  stack.name = j.at("name").get<std::string>();
  stack.count = j.value("count", 0);
  stack.max_count = j.value("max_count", kDefaultMaxStack);
}
