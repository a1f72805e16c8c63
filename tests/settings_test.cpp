#include "command_line_parser.hpp"
#include "daemon_config.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <string>
#include <vector>

using namespace ztalk::test;

namespace {

// argv built from string literals, the way main() receives it.
class Argv {
public:
  Argv(std::initializer_list<std::string> args) : storage_(args) {
    for(auto& s : storage_) pointers_.push_back(s.data());
    pointers_.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(storage_.size()); }
  char** argv() { return pointers_.data(); }

private:
  std::vector<std::string> storage_;
  std::vector<char*> pointers_;
};

template<typename Fn>
bool throws_runtime_error(Fn fn, const std::string& needle = std::string()) {
  try {
    fn();
  } catch(const std::runtime_error& e) {
    return needle.empty() || std::string(e.what()).find(needle) != std::string::npos;
  }
  return false;
}

bool test_defaults(TestContext&) {
  SettingsManager settings;
  ZTALK_CHECK(settings.get<int>("tcp_port") == 47801);
  ZTALK_CHECK(settings.get<int>("multicast_port") == 47800);
  ZTALK_CHECK(settings.get<std::string>("multicast_group") == "239.255.42.99");
  ZTALK_CHECK(settings.get<int>("heartbeat_interval_ms") == 5000);
  ZTALK_CHECK(settings.get<bool>("console"));
  ZTALK_CHECK(!settings.help_requested());
  ZTALK_CHECK(!settings.save_requested());

  ZTALK_CHECK(settings.resolve_key("HB") == std::optional<std::string>("heartbeat_interval_ms"));
  ZTALK_CHECK(settings.is_bool_setting("bell"));
  ZTALK_CHECK(!settings.is_bool_setting("port"));
  ZTALK_CHECK(!settings.resolve_key("nonsense"));
  for(const auto& def : settings.definitions()) {
    if(def.key == "ssh_idle_timeout_s") ZTALK_CHECK(def.section == "ssh" && def.argument_hint() == "<int>");
    if(def.key == "console") ZTALK_CHECK(!def.persistent);
  }
  return true;
}

bool test_positional_and_aliases(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser;
  Argv args{"ztalkd", "4100", "alice", "-hb", "250", "--verbose", "-i", "false", "--SSHIDLE", "60"};
  parser.parse(args.argc(), args.argv(), settings);

  ZTALK_CHECK(settings.get<int>("tcp_port") == 4100);
  ZTALK_CHECK(settings.get<std::string>("display_name") == "alice");
  ZTALK_CHECK(settings.get<int>("heartbeat_interval_ms") == 250);
  ZTALK_CHECK(settings.get<bool>("verbose"));
  ZTALK_CHECK(!settings.get<bool>("console"));
  ZTALK_CHECK(settings.get<int>("ssh_idle_timeout_s") == 60);
  return true;
}

bool test_bad_command_lines(TestContext&) {
  CommandLineParser parser;
  auto parse = [&](std::initializer_list<std::string> list){
    SettingsManager settings;
    Argv args(list);
    parser.parse(args.argc(), args.argv(), settings);
  };
  auto rejected = [&](std::initializer_list<std::string> list){
    try {
      parse(list);
    } catch(const CommandLineError&) {
      return true;
    }
    return false;
  };
  ZTALK_CHECK(rejected({"ztalkd", "--no-such-option", "1"}));
  ZTALK_CHECK(rejected({"ztalkd", "--heartbeat"}));
  ZTALK_CHECK(rejected({"ztalkd", "--tcp_port", "many"}));
  ZTALK_CHECK(rejected({"ztalkd", "1", "name", "extra"}));
  ZTALK_CHECK(rejected({"ztalkd", "--heartbeat=fast"}));

  SettingsManager settings;
  Argv inline_values{"ztalkd", "--heartbeat=750", "--bell", "--name", "dora"};
  parser.parse(inline_values.argc(), inline_values.argv(), settings);
  ZTALK_CHECK(settings.get<int>("heartbeat_interval_ms") == 750);
  ZTALK_CHECK(settings.get<bool>("audio_notifications"));
  ZTALK_CHECK(settings.get<std::string>("display_name") == "dora");
  return true;
}

bool test_config_path_is_found_first(TestContext&) {
  Argv with{"ztalkd", "--name", "bob", "-c", "/tmp/elsewhere.json"};
  auto path = CommandLineParser::find_config_path(with.argc(), with.argv());
  ZTALK_CHECK(path && *path == "/tmp/elsewhere.json");
  Argv without{"ztalkd", "--name", "bob"};
  ZTALK_CHECK(!CommandLineParser::find_config_path(without.argc(), without.argv()));
  return true;
}

bool test_save_and_load(TestContext&) {
  auto dir = scratch_dir("settings");
  auto path = dir / "nested" / "settings.json";
  {
    SettingsManager settings;
    settings.set_settings_path(path);
    std::string error;
    ZTALK_CHECK(settings.set_from_string("display_name", "carol", error));
    ZTALK_CHECK(settings.set_from_string("console", "false", error));
    ZTALK_CHECK(!settings.set_from_string("multicast_ttl", "lots", error));
    ZTALK_CHECK(!error.empty());
    ZTALK_CHECK(settings.save());
  }
  std::ifstream in(path);
  auto doc = nlohmann::json::parse(in);
  ZTALK_CHECK(doc.at("display_name") == "carol");
  ZTALK_CHECK(!doc.contains("console"));

  SettingsManager reloaded;
  reloaded.set_settings_path(path);
  ZTALK_CHECK(reloaded.load());
  ZTALK_CHECK(reloaded.get<std::string>("display_name") == "carol");
  ZTALK_CHECK(reloaded.get<bool>("console"));
  return true;
}

bool test_daemon_config_from_defaults(TestContext&) {
  SettingsManager settings;
  std::string error;
  ZTALK_CHECK(settings.set_from_string("heartbeat_interval_ms", "200", error));
  ZTALK_CHECK(settings.set_from_string("offline_missed_intervals", "4", error));
  auto config = make_daemon_config(settings);

  ZTALK_CHECK(is_nil(config.peer_id));
  ZTALK_CHECK(!config.display_name.empty());
  ZTALK_CHECK(config.transport.tcp_port == 47801);
  ZTALK_CHECK(config.transport.multicast_port == 47800);
  ZTALK_CHECK(config.registry.heartbeat.count() == 200);
  ZTALK_CHECK(config.discovery.heartbeat.count() == 200);
  ZTALK_CHECK(config.registry.offline_after().count() == 800);
  ZTALK_CHECK(config.ssh.idle_timeout.count() == 900);
  ZTALK_CHECK(config.ssh_profiles_file.filename() == "ssh_profiles.json");
  return true;
}

bool test_daemon_config_rejects_bad_values(TestContext&) {
  auto with = [](const std::string& key, const std::string& value){
    return [key, value]{
      SettingsManager settings;
      std::string error;
      if(!settings.set_from_string(key, value, error)) throw std::logic_error(error);
      make_daemon_config(settings);
    };
  };
  ZTALK_CHECK(throws_runtime_error(with("peer_id", "not-hex"), "peer_id"));
  ZTALK_CHECK(throws_runtime_error(with("tcp_port", "70000"), "tcp_port"));
  ZTALK_CHECK(throws_runtime_error(with("multicast_port", "0"), "multicast_port"));
  ZTALK_CHECK(throws_runtime_error(with("heartbeat_interval_ms", "5"), "heartbeat_interval_ms"));
  ZTALK_CHECK(throws_runtime_error(with("multicast_group", "10.1.2.3"), "multicast_group"));
  ZTALK_CHECK(throws_runtime_error(with("listen_ip", "localhost:80"), "listen_ip"));
  ZTALK_CHECK(throws_runtime_error(with("ssh_reconnect_cap_ms", "10"), "ssh_reconnect_cap_ms"));
  ZTALK_CHECK(throws_runtime_error(with("display_name", std::string(300, 'x')), "display_name"));

  SettingsManager good;
  std::string error;
  auto id = random_uid();
  ZTALK_CHECK(good.set_from_string("peer_id", to_hex(id), error));
  ZTALK_CHECK(make_daemon_config(good).peer_id == id);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"defaults", test_defaults},
    {"positional_and_aliases", test_positional_and_aliases},
    {"bad_command_lines", test_bad_command_lines},
    {"config_path_is_found_first", test_config_path_is_found_first},
    {"save_and_load", test_save_and_load},
    {"daemon_config_from_defaults", test_daemon_config_from_defaults},
    {"daemon_config_rejects_bad_values", test_daemon_config_rejects_bad_values},
  };
  return run_tests("settings", std::move(tests), argc, argv);
}
