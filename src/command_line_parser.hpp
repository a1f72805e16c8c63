#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// ztalkd [tcp_port] [display_name] [--key value | --key=value | -alias value ...]
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "ztalkd",
                             std::vector<std::string> positional_keys = {"tcp_port", "display_name"});

  // Applies positional arguments and options to settings. Throws
  // CommandLineError on unknown options or invalid values.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

  // The --config/-c value, found before the settings file is loaded so that
  // command line values can override the file.
  static std::optional<std::string> find_config_path(int argc, char* argv[]);

private:
  static bool looks_like_option(const std::string& token);

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
