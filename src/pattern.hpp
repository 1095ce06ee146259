#pragma once

#include <optional>
#include <string>
#include <string_view>

struct LocationPattern {
  enum class Kind { Self, Any, Named };
  Kind kind = Kind::Named;
  std::string raw;

  bool is_self() const { return kind == Kind::Self; }
  bool is_any() const { return kind == Kind::Any; }

  static LocationPattern named(std::string name) {
    return LocationPattern{Kind::Named, std::move(name)};
  }
};

struct ItemPattern {
  std::string text = "*";   // without the leading '='
  bool exact = false;

  bool matches_everything() const { return !exact && text == "*"; }
  // Round-trips through parse_pattern.
  std::string to_string() const { return exact ? "=" + text : text; }

  static ItemPattern parse(std::string_view token);
};

struct CountSpec {
  enum class Kind { Fixed, OneStack, AllMatching };
  Kind kind = Kind::Fixed;
  int amount = 1;   // meaningful for Fixed only

  static CountSpec fixed(int n) { return CountSpec{Kind::Fixed, n}; }
  static CountSpec one_stack() { return CountSpec{Kind::OneStack, 0}; }
  static CountSpec all_matching() { return CountSpec{Kind::AllMatching, 0}; }

  std::string to_string() const;
};

struct MovePattern {
  LocationPattern location;
  ItemPattern item;
  CountSpec count;
};

// location[/item[:count]]. Never fails: anything it cannot split is taken as
// a bare location with item "*" and count 1.
MovePattern parse_pattern(std::string_view text);
LocationPattern parse_location(std::string_view token);
// Count token after the last ':'; nullopt when the text is not a count.
std::optional<CountSpec> parse_count(std::string_view token);

struct QueryCommand {
  enum class Mode { Count, High, Low, Balance, Unknown };
  ItemPattern item;
  Mode mode = Mode::Unknown;
  std::string mode_text;
  std::optional<std::string> param;
};

// q:<item>:<mode>[:<param>]
std::optional<QueryCommand> parse_query(std::string_view text);
