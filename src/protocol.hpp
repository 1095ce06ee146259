#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

using json = nlohmann::json;

// protocol.hpp
// One JSON object per line. Every request carries "type" and "id"; the
// matching response is {"type":"result","id":...,"ok":...}.
inline constexpr const char* kRequestNames = "names";
inline constexpr const char* kRequestLocalName = "local_name";
inline constexpr const char* kRequestLocalItems = "local_items";
inline constexpr const char* kRequestDescribe = "describe";
inline constexpr const char* kRequestList = "list";
inline constexpr const char* kRequestPushItems = "push_items";
inline constexpr const char* kRequestPullItems = "pull_items";

json make_request(const std::string& type, uint64_t id, json fields = json::object());
json make_result(uint64_t id, json value);
json make_error(uint64_t id, const std::string& message);
