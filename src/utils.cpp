#include "utils.hpp"
#include <algorithm>
#include <cctype>

std::string to_lower_copy(std::string_view text){
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return out;
}

std::string strip_chars(std::string_view text, std::string_view chars){
    std::string out;
    out.reserve(text.size());
    for(char c: text){
        if(chars.find(c) == std::string_view::npos) out.push_back(c);
    }
    return out;
}

std::string strip_namespace(std::string_view name){
    auto pos = name.find(':');
    if(pos == std::string_view::npos || pos == 0) return std::string(name);
    return std::string(name.substr(pos + 1));
}

bool contains(std::string_view haystack, std::string_view needle){
    return haystack.find(needle) != std::string_view::npos;
}

std::string trim_copy(std::string_view text){
    auto begin = std::find_if(text.begin(), text.end(),
                              [](unsigned char ch){ return !std::isspace(ch); });
    auto end = std::find_if(text.rbegin(), text.rend(),
                            [](unsigned char ch){ return !std::isspace(ch); }).base();
    if(begin >= end) return {};
    return std::string(begin, end);
}
