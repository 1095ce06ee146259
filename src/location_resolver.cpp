#include "location_resolver.hpp"

#include <algorithm>

#include "utils.hpp"

namespace {

constexpr std::string_view kSeparators = "_:";

} // namespace

Node LocationResolver::self_node(const DirectorySnapshot& snapshot) {
  return Node{snapshot.local_name.value_or(kSelfNodeId), true};
}

Node LocationResolver::make_node(const DirectorySnapshot& snapshot, const std::string& id) const {
  return Node{id, directory_.is_local_name(snapshot, id)};
}

std::optional<std::string> LocationResolver::best_fuzzy_match(const std::string& pattern,
                                                              const std::vector<std::string>& ids) {
  const std::string wanted = to_lower_copy(pattern);
  const std::string wanted_simple = strip_chars(wanted, kSeparators);

  std::vector<std::string> matches;
  for(const auto& id : ids) {
    const std::string lowered = to_lower_copy(id);
    if(contains(lowered, wanted) ||
       contains(strip_chars(lowered, kSeparators), wanted_simple)) {
      matches.push_back(id);
    }
  }
  if(matches.empty()) return std::nullopt;

  std::stable_sort(matches.begin(), matches.end(),
                   [](const std::string& a, const std::string& b){ return a.size() < b.size(); });
  return matches.front();
}

LocationResolution LocationResolver::resolve(const LocationPattern& pattern,
                                             const DirectorySnapshot& snapshot) const {
  LocationResolution result;
  switch(pattern.kind) {
    case LocationPattern::Kind::Self:
      result.nodes.push_back(self_node(snapshot));
      return result;

    case LocationPattern::Kind::Any:
      result.any_mode = true;
      for(const auto& id : snapshot.inventories) {
        result.nodes.push_back(make_node(snapshot, id));
      }
      return result;

    case LocationPattern::Kind::Named:
      break;
  }

  if(pattern.raw.empty()) return result;

  std::vector<std::string> candidates = snapshot.peripherals;
  if(snapshot.local_name &&
     std::find(candidates.begin(), candidates.end(), *snapshot.local_name) == candidates.end()) {
    candidates.push_back(*snapshot.local_name);
  }

  if(std::find(candidates.begin(), candidates.end(), pattern.raw) != candidates.end()) {
    result.nodes.push_back(make_node(snapshot, pattern.raw));
    return result;
  }

  if(auto match = best_fuzzy_match(pattern.raw, candidates)) {
    result.nodes.push_back(make_node(snapshot, *match));
  }
  return result;
}
