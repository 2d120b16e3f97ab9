#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Fills a SettingsManager from argv: "--key value", "-alias value", bare
// boolean flags, and positional arguments mapped to keys in order.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "lanshare",
                             std::vector<std::string> positional_keys = {"shared_folder", "port"});

  // Throws CommandLineError on unknown options or bad values.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  static bool looks_like_option(const std::string& token);

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
