#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto settings: --key value, -alias value, bare flags for bool
// settings, and positional arguments bound to settings by index.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name,
                    std::string summary,
                    nlohmann::json argv_spec,
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION);

  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

  void add_usage_line(std::string line) { usage_lines_.push_back(std::move(line)); }

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::string summary_;
  nlohmann::json settings_spec_;
  std::vector<ArgvSpec> positional_specs_;
  std::vector<std::string> usage_lines_;
};
