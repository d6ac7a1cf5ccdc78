#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "skrins",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","watch_path"}},
                      {{"index",1},{"key","remote_host"}},
                      {{"index",2},{"key","remote_user"}},
                      {{"index",3},{"key","private_key"}},
                      {{"index",4},{"key","remote_path"}},
                      {{"index",5},{"key","base_url"}}
                    }));

  // Applies argv on top of whatever the settings already hold. Returns
  // false and fills error on the first bad token; nothing after it is applied.
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
  // Convenience for main(): prints the error with usage and exits(1).
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
