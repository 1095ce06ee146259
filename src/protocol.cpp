#include "protocol.hpp"

json make_request(const std::string& type, uint64_t id, json fields) {
    json j = fields.is_object() ? std::move(fields) : json::object();
    j["type"] = type;
    j["id"] = id;
    return j;
}

json make_result(uint64_t id, json value) {
    json j;
    j["type"] = "result";
    j["id"] = id;
    j["ok"] = true;
    j["value"] = std::move(value);
    return j;
}

json make_error(uint64_t id, const std::string& message) {
    json j;
    j["type"] = "result";
    j["id"] = id;
    j["ok"] = false;
    j["error"] = message;
    return j;
}
