#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  // positional_keys: settings assigned, in order, to bare arguments.
  CommandLineParser(std::string process_name,
                    std::string summary,
                    std::vector<std::string> positional_keys);

  // Applies argv onto settings. On failure returns false with a message in
  // error; settings may be partially updated.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  void usage(const SettingsManager& settings) const;

private:
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::string summary_;
  std::vector<std::string> positional_keys_;
};
