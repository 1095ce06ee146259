#pragma once
#include <string>
#include <string_view>

std::string to_lower_copy(std::string_view text);
// Removes every character of `chars` from the text.
std::string strip_chars(std::string_view text, std::string_view chars);
// "minecraft:coal" -> "coal"; names without a namespace are returned as-is.
std::string strip_namespace(std::string_view name);
bool contains(std::string_view haystack, std::string_view needle);
std::string trim_copy(std::string_view text);
