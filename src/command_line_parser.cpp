#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name, std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() >= 2 && token[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(token[1])) || token[1] == '?');
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const auto& token = args[i];
    std::string error;

    if(looks_like_option(token)) {
      auto name = token.substr(token[1] == '-' ? 2 : 1);
      std::optional<std::string> inline_value;
      if(auto eq = name.find('='); eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name.erase(eq);
      }
      auto key = settings.resolve_key(name);
      if(!key) throw CommandLineError("Unknown option '" + token + "'");

      std::string value;
      if(inline_value) {
        value = *inline_value;
      } else if(settings.is_bool_setting(*key)) {
        // "--auth" alone means true; "--auth off" consumes the literal
        if(i + 1 < args.size() && SettingsManager::parse_bool(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) throw CommandLineError("Missing value for '" + token + "'");
        value = args[++i];
      }
      if(!settings.set_from_string(*key, value, error)) {
        throw CommandLineError("Invalid value for '" + token + "': " + error);
      }
      continue;
    }

    if(positional >= positional_keys_.size()) {
      throw CommandLineError("Unexpected argument '" + token + "'");
    }
    const auto& key = positional_keys_[positional++];
    if(!settings.set_from_string(key, token, error)) {
      throw CommandLineError("Invalid " + key + " '" + token + "': " + error);
    }
  }
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";

  print_out(nullptr, "{} - share a folder on the local network", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {}", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& spec : settings.specs()) {
    std::string hint = spec.type == "bool" ? "[on|off]" : "<" + spec.type + ">";
    std::ostringstream aliases;
    for(std::size_t i = 0; i < spec.aliases.size(); ++i) {
      aliases << (i == 0 ? " (" : ", ") << "-" << spec.aliases[i];
      if(i + 1 == spec.aliases.size()) aliases << ")";
    }
    auto fallback = spec.default_value.is_string() ? spec.default_value.get<std::string>()
                                                   : spec.default_value.dump();
    print_out(nullptr, "  --{:<18} {:<9} {}{}{}",
              spec.key, hint, spec.description, aliases.str(),
              fallback.empty() ? std::string() : " [default: " + fallback + "]");
  }
  print_out(nullptr, "");
}
