#include "item_matcher.hpp"

#include "utils.hpp"

bool item_matches(const std::string& item_name, const ItemPattern& pattern) {
  if(pattern.matches_everything()) return true;

  const std::string name = to_lower_copy(item_name);
  const std::string short_name = strip_namespace(name);
  const std::string wanted = to_lower_copy(pattern.text);

  if(pattern.exact) {
    return name == wanted || short_name == wanted;
  }
  return contains(name, wanted) || contains(short_name, wanted);
}
