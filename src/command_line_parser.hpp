#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "archwatch",
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","farm_root"}}
                    }));

  // Applies argv on top of `settings`. On failure `error` names the
  // offending token and the settings may be partially updated.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  void usage(const SettingsManager& settings) const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  static std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec);
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::vector<ArgvSpec> positional_specs_;
};
