#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto settings. Options are "--key value", "--key=value",
// "-alias value", a bare "--flag" or "--no-flag" for booleans. Every other
// token is a URL or magnet link to queue once the engine is up.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "haul",
                             nlohmann::json settings_spec = SETTINGS_SPECIFICATION);

  // Returns the queued URLs in argv order. Throws std::invalid_argument
  // describing the first bad token.
  std::vector<std::string> parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);
  static std::string describe_default(const nlohmann::json& entry);

  std::string process_name_;
  nlohmann::json settings_spec_;
};
