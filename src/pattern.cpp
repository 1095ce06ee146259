#include "pattern.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace {

bool is_self_token(std::string_view token) {
  return token == "./" || token == ".";
}

bool is_any_token(std::string_view token) {
  return token == "*" || token == "../" || token == "..";
}

std::string lowered(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return out;
}

MovePattern bare_location(const std::string& text) {
  MovePattern pattern;
  pattern.location = parse_location(text);
  return pattern;
}

} // namespace

ItemPattern ItemPattern::parse(std::string_view token) {
  ItemPattern pattern;
  if(!token.empty() && token.front() == '=') {
    pattern.exact = true;
    pattern.text = std::string(token.substr(1));
  } else if(!token.empty()) {
    pattern.text = std::string(token);
  }
  return pattern;
}

std::string CountSpec::to_string() const {
  switch(kind) {
    case Kind::OneStack: return "*";
    case Kind::AllMatching: return "++";
    case Kind::Fixed: break;
  }
  return std::to_string(amount);
}

LocationPattern parse_location(std::string_view token) {
  if(is_self_token(token)) return LocationPattern{LocationPattern::Kind::Self, std::string(token)};
  if(is_any_token(token)) return LocationPattern{LocationPattern::Kind::Any, std::string(token)};
  return LocationPattern::named(std::string(token));
}

std::optional<CountSpec> parse_count(std::string_view token) {
  if(token == "++") return CountSpec::all_matching();
  if(token == "*" || token == "+") return CountSpec::one_stack();
  if(token.empty()) return std::nullopt;
  if(!std::all_of(token.begin(), token.end(),
                  [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
    return std::nullopt;
  }
  int value = 0;
  auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
  if(ec == std::errc::result_out_of_range) {
    return CountSpec::fixed(std::numeric_limits<int>::max());
  }
  if(ec != std::errc() || ptr != token.data() + token.size()) return std::nullopt;
  return CountSpec::fixed(value);
}

MovePattern parse_pattern(std::string_view text) {
  std::string str(text);
  std::replace(str.begin(), str.end(), '\\', '/');

  if(is_self_token(str) || is_any_token(str)) {
    return bare_location(str);
  }

  auto slash = str.rfind('/');
  if(slash == std::string::npos || slash == 0 || slash + 1 == str.size()) {
    return bare_location(str);
  }

  MovePattern pattern;
  pattern.location = parse_location(std::string_view(str).substr(0, slash));
  std::string_view rest = std::string_view(str).substr(slash + 1);

  std::string_view item_token = rest;
  auto colon = rest.rfind(':');
  if(colon != std::string_view::npos) {
    auto suffix = rest.substr(colon + 1);
    if(suffix.empty()) {
      item_token = rest.substr(0, colon);
    } else if(auto count = parse_count(suffix)) {
      item_token = rest.substr(0, colon);
      pattern.count = *count;
    }
  }
  pattern.item = ItemPattern::parse(item_token);
  return pattern;
}

std::optional<QueryCommand> parse_query(std::string_view text) {
  if(text.substr(0, 2) != "q:") return std::nullopt;
  std::string_view body = text.substr(2);

  auto first = body.find(':');
  if(first == std::string_view::npos || first == 0) return std::nullopt;
  std::string_view item = body.substr(0, first);
  std::string_view remainder = body.substr(first + 1);

  QueryCommand command;
  auto second = remainder.find(':');
  std::string_view mode = remainder.substr(0, second);
  if(mode.empty()) return std::nullopt;
  if(second != std::string_view::npos) {
    auto param = remainder.substr(second + 1);
    if(param.empty()) return std::nullopt;
    command.param = std::string(param);
  }

  command.item = ItemPattern::parse(item);
  command.mode_text = lowered(mode);
  if(command.mode_text == "count") {
    command.mode = QueryCommand::Mode::Count;
  } else if(command.mode_text == "high") {
    command.mode = QueryCommand::Mode::High;
  } else if(command.mode_text == "low") {
    command.mode = QueryCommand::Mode::Low;
  } else if(command.mode_text == "bal") {
    command.mode = QueryCommand::Mode::Balance;
  }
  return command;
}
