#pragma once

#include <string>

#include "pattern.hpp"

// "*" matches everything. Exact patterns compare the full or the
// namespace-stripped name; fuzzy patterns look for a substring of either.
// Both are case-insensitive.
bool item_matches(const std::string& item_name, const ItemPattern& pattern);
