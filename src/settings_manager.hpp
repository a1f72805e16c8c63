#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Every daemon setting: key, command line aliases, type, default, help
// section and whether `save` writes it to the settings file.
inline const nlohmann::json ZTALK_SETTINGS = nlohmann::json::array({
  {{"key","tcp_port"},                 {"aliases", {"port","p"}},        {"type","int"},    {"default",47801},           {"section","network"},   {"description","TCP port for reliable message frames (0 = any)"}},
  {{"key","listen_ip"},                {"aliases", {"li"}},              {"type","string"}, {"default","0.0.0.0"},       {"section","network"},   {"description","Interface/IP to bind the TCP listener"}},
  {{"key","multicast_group"},          {"aliases", {"mg"}},              {"type","string"}, {"default","239.255.42.99"}, {"section","network"},   {"description","IPv4 multicast group for beacons and broadcasts"}},
  {{"key","multicast_port"},           {"aliases", {"mp"}},              {"type","int"},    {"default",47800},           {"section","network"},   {"description","UDP port of the multicast group"}},
  {{"key","multicast_interface"},      {"aliases", {"mi"}},              {"type","string"}, {"default",""},              {"section","network"},   {"description","Local IPv4 address of the multicast interface (empty = default)"}},
  {{"key","multicast_ttl"},            {"aliases", {"ttl"}},             {"type","int"},    {"default",1},               {"section","network"},   {"description","Multicast hop limit"}},
  {{"key","multicast_loopback"},       {"aliases", {"loopback"}},        {"type","bool"},   {"default",true},            {"section","network"},   {"description","Deliver multicast to other daemons on this host"}},
  {{"key","connect_timeout_ms"},       {"aliases", {"cto"}},             {"type","int"},    {"default",3000},            {"section","network"},   {"description","TCP connect timeout for message frames"}},
  {{"key","write_timeout_ms"},         {"aliases", {"wto"}},             {"type","int"},    {"default",5000},            {"section","network"},   {"description","TCP write timeout for message frames"}},
  {{"key","peer_id"},                  {"aliases", {"id"}},              {"type","string"}, {"default",""},              {"section","discovery"}, {"description","Persistent 32 hex digit peer identity (generated when empty)"}},
  {{"key","display_name"},             {"aliases", {"name","n"}},        {"type","string"}, {"default",""},              {"section","discovery"}, {"description","Name announced to peers (default host-pid)"}},
  {{"key","heartbeat_interval_ms"},    {"aliases", {"heartbeat","hb"}},  {"type","int"},    {"default",5000},            {"section","discovery"}, {"description","Milliseconds between beacons and liveness sweeps"}},
  {{"key","offline_missed_intervals"}, {"aliases", {"omi"}},             {"type","int"},    {"default",3},               {"section","discovery"}, {"description","Missed heartbeats before a peer is offline"}},
  {{"key","eviction_grace_ms"},        {"aliases", {"grace"}},           {"type","int"},    {"default",60000},           {"section","discovery"}, {"description","Time an offline peer is kept before eviction"}},
  {{"key","dedup_capacity"},           {"aliases", {"dedup"}},           {"type","int"},    {"default",10000},           {"section","messaging"}, {"description","Recently seen message ids kept for de-duplication"}},
  {{"key","dedup_window_ms"},          {"aliases", {"dedup_window"}},    {"type","int"},    {"default",300000},          {"section","messaging"}, {"description","How long a message id stays in the de-duplication set"}},
  {{"key","message_history_limit"},    {"aliases", {"history"}},         {"type","int"},    {"default",1000},            {"section","messaging"}, {"description","Messages kept per conversation"}},
  {{"key","max_conversations"},        {"aliases", {"conversations"}}, {"type","int"},    {"default",256},             {"section","messaging"}, {"description","Private and group conversations kept before the idlest is dropped"}},
  {{"key","audio_notifications"},      {"aliases", {"audio","bell"}},    {"type","bool"},   {"default",false},           {"section","messaging"}, {"description","Play terminal bell on chat messages"}},
  {{"key","ssh_connect_timeout_ms"},   {"aliases", {"sshto"}},           {"type","int"},    {"default",10000},           {"section","ssh"},       {"description","SSH connect and handshake timeout"}},
  {{"key","ssh_reconnect_base_ms"},    {"aliases", {"sshrb"}},           {"type","int"},    {"default",1000},            {"section","ssh"},       {"description","First SSH reconnect delay, doubled per attempt"}},
  {{"key","ssh_reconnect_cap_ms"},     {"aliases", {"sshrc"}},           {"type","int"},    {"default",30000},           {"section","ssh"},       {"description","Upper bound for the SSH reconnect delay"}},
  {{"key","ssh_idle_timeout_s"},       {"aliases", {"sshidle"}},         {"type","int"},    {"default",900},             {"section","ssh"},       {"description","Disconnect idle SSH sessions after this many seconds (0 = never)"}},
  {{"key","ssh_output_buffer_chunks"}, {"aliases", {"sshbuf"}},          {"type","int"},    {"default",2048},            {"section","ssh"},       {"description","Output chunks retained per SSH connection"}},
  {{"key","ssh_profiles_file"},        {"aliases", {"profiles"}},        {"type","string"}, {"default",""},              {"section","ssh"},       {"description","SSH profile store (default ~/.ztalk/ssh_profiles.json)"}},
  {{"key","log_file"},                 {"aliases", {"log"}},             {"type","string"}, {"default",""},              {"section","logging"},   {"description","Rotating log file (empty = console only)"}},
  {{"key","verbose"},                  {"aliases", {"v"}},               {"type","bool"},   {"default",false},           {"section","logging"},   {"description","Enable verbose logging"}},
  {{"key","console"},                  {"aliases", {"interactive","i"}}, {"type","bool"},   {"default",true},            {"section","runtime"},   {"description","Run the interactive console"},        {"persistent", false}},
  {{"key","config"},                   {"aliases", {"c"}},               {"type","string"}, {"default",""},              {"section","runtime"},   {"description","Settings file (default ~/.ztalk/settings.json)"}, {"persistent", false}},
  {{"key","help"},                     {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},           {"section","runtime"},   {"description","Show command help and exit"},         {"persistent", false}},
  {{"key","save"},                     {"aliases", {"persist"}},         {"type","bool"},   {"default",false},           {"section","runtime"},   {"description","Persist current settings to disk"},   {"persistent", false}}
});

// Per-user state directory, ~/.ztalk, falling back to the working directory.
inline std::filesystem::path default_state_dir() {
  const char* home = std::getenv("HOME");
  if(home && *home) return std::filesystem::path(home) / ".ztalk";
  return std::filesystem::current_path() / ".ztalk";
}

enum class SettingType { Bool, Int, String };

struct SettingDef {
  std::string key;
  std::vector<std::string> aliases; // lower case
  SettingType type = SettingType::String;
  nlohmann::json default_value;
  std::string section;
  std::string description;
  bool persistent = true;

  // "<int>", "<string>" or "[true|false]" for help output
  std::string argument_hint() const;
  std::string default_as_string() const;
};

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& table);

  template<typename T>
  T get(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  // Settings file at settings_path(). load() keeps the current value of any
  // key the file does not mention or gets wrong.
  bool save() const;
  bool load();

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  const std::vector<SettingDef>& definitions() const { return defs_; }
  std::string value_as_string(const std::string& key) const;
  // Canonical key for a key or alias, case insensitive.
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json persistent_json() const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  static std::vector<SettingDef> parse_table(const nlohmann::json& table);
  const SettingDef* lookup(const std::string& token) const;

  bool store(const SettingDef& def, const nlohmann::json& value, std::string& error);
  static nlohmann::json parse_text(const SettingDef& def, const std::string& text, std::string& error);

  std::vector<SettingDef> defs_;
  nlohmann::json values_;
  std::filesystem::path path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::string SettingDef::argument_hint() const {
  switch(type) {
    case SettingType::Bool: return "[true|false]";
    case SettingType::Int: return "<int>";
    case SettingType::String: return "<string>";
  }
  return {};
}

inline std::string SettingDef::default_as_string() const {
  if(default_value.is_string()) return default_value.get<std::string>();
  if(default_value.is_boolean()) return default_value.get<bool>() ? "true" : "false";
  return default_value.dump();
}

inline std::vector<SettingDef> SettingsManager::parse_table(const nlohmann::json& table) {
  std::vector<SettingDef> result;
  for(const auto& entry : table) {
    SettingDef def;
    def.key = entry.at("key").get<std::string>();
    for(auto alias : entry.value("aliases", std::vector<std::string>{})) {
      def.aliases.push_back(to_lower(std::move(alias)));
    }
    auto type = entry.at("type").get<std::string>();
    if(type == "bool") def.type = SettingType::Bool;
    else if(type == "int") def.type = SettingType::Int;
    else if(type == "string") def.type = SettingType::String;
    else throw std::invalid_argument("setting '" + def.key + "' has unknown type '" + type + "'");
    def.default_value = entry.at("default");
    def.section = entry.value("section", "general");
    def.description = entry.value("description", "");
    def.persistent = entry.value("persistent", true);
    result.push_back(std::move(def));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(ZTALK_SETTINGS) {}

inline SettingsManager::SettingsManager(const nlohmann::json& table)
  : defs_(parse_table(table)),
    values_(nlohmann::json::object()) {
  for(const auto& def : defs_) values_[def.key] = def.default_value;
}

inline const SettingDef* SettingsManager::lookup(const std::string& token) const {
  auto lowered = to_lower(token);
  for(const auto& def : defs_) {
    if(to_lower(def.key) == lowered) return &def;
    if(std::find(def.aliases.begin(), def.aliases.end(), lowered) != def.aliases.end()) return &def;
  }
  return nullptr;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!values_.contains(key)) return "<unknown>";
  const auto& value = values_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* def = lookup(token)) return def->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* def = lookup(key);
  return def && def->type == SettingType::Bool;
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!path_override_.empty()) return path_override_;
  return default_state_dir() / "settings.json";
}

inline nlohmann::json SettingsManager::persistent_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& def : defs_) {
    if(def.persistent) doc[def.key] = values_.at(def.key);
  }
  return doc;
}

inline bool SettingsManager::load() {
  auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: not a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* def = lookup(item.key());
    if(!def) {
      print_err(nullptr, "Ignoring unknown setting '{}' in {}", item.key(), path.string());
      continue;
    }
    std::string error;
    if(!store(*def, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save() const {
  auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << persistent_json().dump(2) << "\n";
  return static_cast<bool>(out);
}

inline bool SettingsManager::store(const SettingDef& def, const nlohmann::json& value, std::string& error) {
  switch(def.type) {
    case SettingType::Bool:
      if(value.is_boolean()) {
        values_[def.key] = value.get<bool>();
        return true;
      }
      error = "expected boolean";
      return false;
    case SettingType::Int:
      if(value.is_number_integer()) {
        values_[def.key] = value.get<int>();
        return true;
      }
      error = "expected integer";
      return false;
    case SettingType::String:
      if(value.is_string()) {
        values_[def.key] = value.get<std::string>();
        return true;
      }
      error = "expected string";
      return false;
  }
  error = "unsupported type";
  return false;
}

inline nlohmann::json SettingsManager::parse_text(const SettingDef& def, const std::string& text, std::string& error) {
  auto clean = trim_copy(text);
  switch(def.type) {
    case SettingType::Bool: {
      auto v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
      if(v == "false" || v == "0" || v == "off" || v == "no") return false;
      error = "expected boolean (true|false|on|off)";
      return {};
    }
    case SettingType::Int: {
      std::size_t used = 0;
      int parsed = 0;
      try {
        parsed = std::stoi(clean, &used);
      } catch(const std::invalid_argument&) {
        used = 0;
      } catch(const std::out_of_range&) {
        used = 0;
      }
      if(used == 0 || used != clean.size()) {
        error = "expected integer, got '" + clean + "'";
        return {};
      }
      return parsed;
    }
    case SettingType::String:
      return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* def = lookup(key);
  if(!def) {
    error = "unknown setting '" + key + "'";
    return false;
  }
  auto parsed = parse_text(*def, value, error);
  if(!error.empty()) return false;
  return store(*def, parsed, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!values_.contains(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}
