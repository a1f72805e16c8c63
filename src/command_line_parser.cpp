#include "command_line_parser.hpp"

#include <cctype>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name, std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return true;
  return token.size() >= 2 && token[0] == '-' &&
         !std::isdigit(static_cast<unsigned char>(token[1]));
}

std::optional<std::string> CommandLineParser::find_config_path(int argc, char* argv[]) {
  for(int i = 1; i < argc; ++i) {
    std::string token = argv[i];
    if(token.rfind("--config=", 0) == 0) return token.substr(9);
    if((token == "--config" || token == "-c") && i + 1 < argc) return std::string(argv[i + 1]);
  }
  return std::nullopt;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);

  auto apply = [&settings](const std::string& key, const std::string& value, const std::string& shown){
    std::string error;
    if(!settings.set_from_string(key, value, error)) {
      throw CommandLineError("Invalid value for " + shown + ": " + error);
    }
  };

  std::size_t positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(!looks_like_option(token)) {
      if(positional >= positional_keys_.size()) {
        throw CommandLineError("Unexpected positional argument '" + token + "'");
      }
      const auto& key = positional_keys_[positional++];
      apply(key, token, key);
      continue;
    }

    auto name = token.substr(token.rfind("--", 0) == 0 ? 2 : 1);
    std::optional<std::string> inline_value;
    auto eq = name.find('=');
    if(eq != std::string::npos) {
      inline_value = name.substr(eq + 1);
      name.resize(eq);
    }

    auto key = settings.resolve_key(name);
    if(!key) throw CommandLineError("Unknown option " + token);

    if(inline_value) {
      apply(*key, *inline_value, token);
    } else if(settings.is_bool_setting(*key)) {
      // a bare flag means true; a following boolean literal is its value
      std::string error;
      SettingsManager scratch;
      if(i + 1 < args.size() && !looks_like_option(args[i + 1]) &&
         scratch.set_from_string(*key, args[i + 1], error)) {
        apply(*key, args[++i], token);
      } else {
        apply(*key, "true", token);
      }
    } else {
      if(i + 1 >= args.size()) throw CommandLineError("Missing value for option " + token);
      apply(*key, args[++i], token);
    }
  }
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_;
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";
  print_out(nullptr, "{} - LAN peer discovery, chat and SSH session daemon", process_name_);
  print_out(nullptr, "Usage: {} [--key value ...]", synopsis);

  std::string section;
  for(const auto& def : settings.definitions()) {
    if(def.section != section) {
      section = def.section;
      print_out(nullptr, "");
      print_out(nullptr, "{} options:", section);
    }
    std::string aliases;
    for(const auto& alias : def.aliases) aliases += (aliases.empty() ? " (-" : ", -") + alias;
    if(!aliases.empty()) aliases += ")";
    auto fallback = def.default_as_string();
    print_out(nullptr, "  --{:<26} {:<12} {}{}{}", def.key, def.argument_hint(), def.description, aliases,
              fallback.empty() ? std::string() : " [default " + fallback + "]");
  }
  print_out(nullptr, "");
}
