#include "console.hpp"

#include <cstdio>
#include <readline/history.h>
#include <readline/readline.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace {

void trim(std::string& value) {
  value = SettingsManager::trim_copy(value);
}

std::string rest_of(std::istringstream& iss) {
  std::string rest;
  std::getline(iss, rest);
  trim(rest);
  return rest;
}

std::string format_time(int64_t epoch_ms) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm local{};
  localtime_r(&seconds, &local);
  std::ostringstream oss;
  oss << std::put_time(&local, "%H:%M:%S");
  return oss.str();
}

// user@host[:port]
bool parse_target(const std::string& target, std::string& user, std::string& host, uint16_t& port) {
  auto at = target.find('@');
  if(at == std::string::npos || at == 0) return false;
  user = target.substr(0, at);
  host = target.substr(at + 1);
  port = 22;
  auto colon = host.rfind(':');
  if(colon != std::string::npos) {
    try {
      int value = std::stoi(host.substr(colon + 1));
      if(value <= 0 || value > 65535) return false;
      port = static_cast<uint16_t>(value);
    } catch(const std::exception&) {
      return false;
    }
    host.erase(colon);
  }
  return !host.empty();
}

} // namespace

Console::Console(ZtalkDaemon& daemon,
                 std::shared_ptr<SettingsManager> settings,
                 bool audio_notifications)
  : daemon_(daemon),
    settings_(std::move(settings)),
    audio_notifications_(audio_notifications) {}

Console::~Console() {
  stop();
}

void Console::run() {
  running_ = true;
  start_event_thread();
  std::cout << "ztalk " << short_hex(daemon_.peer_id()) << " as '" << daemon_.display_name()
            << "'. Type 'help' for commands.\n";
  while(running_) {
    auto input = read_command_line("> ");
    if(!input) break;
    if(input->empty()) continue;
    if(!execute_command(*input)) break;
  }
  running_ = false;
  stop_event_thread();
}

void Console::stop() {
  running_ = false;
  stop_event_thread();
}

std::optional<std::string> Console::read_command_line(const char* prompt) {
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  std::free(line);
  return result;
}

std::optional<std::string> Console::read_secret(const char* prompt) {
  std::cout << prompt << std::flush;
  termios original{};
  bool restore = false;
  if(isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &original) == 0) {
    termios silent = original;
    silent.c_lflag &= ~ECHO;
    restore = tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
  }
  std::string secret;
  bool ok = static_cast<bool>(std::getline(std::cin, secret));
  if(restore) tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
  std::cout << "\n";
  if(!ok) return std::nullopt;
  return secret;
}

void Console::start_event_thread() {
  if(event_thread_.joinable()) return;
  events_ = daemon_.subscribe();
  event_thread_ = std::thread([this]{ event_loop(); });
}

void Console::stop_event_thread() {
  if(events_) events_->close();
  if(event_thread_.joinable()) event_thread_.join();
  events_.reset();
}

void Console::event_loop() {
  auto events = events_;
  while(events && !events->closed()) {
    auto event = events->next(std::chrono::milliseconds(250));
    if(event) print_event(*event);
  }
}

void Console::print_event(const Event& event) {
  switch(event.type) {
    case EventType::MessageReceived:
      if(auto m = event.as<MessageEvent>()) {
        if(audio_notifications_) std::cout << '\a';
        print_message(m->message);
      }
      break;
    case EventType::OutputReceived:
      if(auto o = event.as<OutputEvent>()) {
        auto& out = o->chunk.stream == OutputStream::Stdout ? std::cout : std::cerr;
        out << o->chunk.data;
        if(!o->chunk.data.empty() && o->chunk.data.back() != '\n') out << "\n";
        out.flush();
        return;
      }
      break;
    default:
      std::cout << "* " << describe(event) << "\n";
      break;
  }
  std::cout << "> ";
  std::cout.flush();
}

void Console::print_message(const Message& message) {
  std::string from = message.sender_id == daemon_.peer_id() ? std::string("you")
                   : !message.sender_name.empty() ? message.sender_name
                   : peer_label(message.sender_id);
  std::cout << format_time(message.timestamp_ms) << " ";
  if(message.kind == MessageKind::Group && message.group_id) {
    auto g = daemon_.router().group(*message.group_id);
    std::cout << "[" << (g ? g->name : short_hex(*message.group_id)) << "] ";
  } else if(message.kind == MessageKind::Private) {
    std::cout << "[private] ";
  }
  std::cout << from << ": " << message.content;
  if(message.sender_id == daemon_.peer_id() && !message.delivered) std::cout << " (pending)";
  std::cout << "\n";
}

std::string Console::peer_label(const PeerId& id) const {
  if(auto p = daemon_.peer(id)) return p->display_name + " (" + short_hex(id) + ")";
  return short_hex(id);
}

std::optional<PeerId> Console::resolve_peer_id(const std::string& token) const {
  if(auto p = daemon_.resolve_peer(token)) return p->id;
  return std::nullopt;
}

std::optional<GroupId> Console::resolve_group(const std::string& token) const {
  if(token.empty()) return std::nullopt;
  std::optional<GroupId> match;
  int matches = 0;
  for(const auto& g : daemon_.groups()) {
    if(to_hex(g.id).compare(0, token.size(), token) == 0 || g.name == token) {
      match = g.id;
      ++matches;
    }
  }
  if(matches != 1) return std::nullopt;
  return match;
}

bool Console::execute_command(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;

  try {
    if(cmd == "send" || cmd == "say") {
      send_broadcast(rest_of(iss));
    } else if(cmd == "msg" || cmd == "pm") {
      send_private(rest_of(iss));
    } else if(cmd == "peers") {
      list_peers();
    } else if(cmd == "name") {
      rename(rest_of(iss));
    } else if(cmd == "group" || cmd == "g") {
      handle_group_command(rest_of(iss));
    } else if(cmd == "history") {
      handle_history_command(rest_of(iss));
    } else if(cmd == "ssh") {
      handle_ssh_command(rest_of(iss));
    } else if(cmd == "settings" || cmd == "s") {
      auto args = rest_of(iss);
      handle_settings_command(args.empty() ? "list" : args);
    } else if(cmd == "set") {
      auto args = rest_of(iss);
      handle_settings_command(args.empty() ? "list" : "set " + args);
    } else if(cmd == "get") {
      auto args = rest_of(iss);
      handle_settings_command(args.empty() ? "get" : "get " + args);
    } else if(cmd == "save") {
      handle_settings_command("save");
    } else if(cmd == "bell") {
      std::cout << '\a';
      std::cout.flush();
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit") {
      std::cout << "Quitting...\n";
      return false;
    } else {
      print_help();
      std::cout << "Unknown command: " << cmd << "\n";
    }
  } catch(const std::invalid_argument& e) {
    std::cout << "Error: " << e.what() << "\n";
  }
  return true;
}

void Console::print_help() {
  std::cout << "Available commands:\n";
  std::cout << "  help|h|?                           Show this help message\n";
  std::cout << "  quit|exit                          Exit the daemon\n";
  std::cout << "  peers                              List known peers\n";
  std::cout << "  name [new name]                    Show or change the announced name\n";
  std::cout << "  send|say <message>                 Broadcast a chat message\n";
  std::cout << "  msg <peer> <message>               Private message (peer id prefix or name)\n";
  std::cout << "  group list                         List groups and members\n";
  std::cout << "  group create <name> [peer ...]     Create a group\n";
  std::cout << "  group add|remove <group> <peer>    Change group membership\n";
  std::cout << "  group delete <group>               Forget a group locally\n";
  std::cout << "  group send <group> <message>       Message every group member\n";
  std::cout << "  history [peer|group <g>] [n]       Show recent messages (default broadcast)\n";
  std::cout << "  ssh connect user@host[:port] [-i key] [-r] [-n name]\n";
  std::cout << "                                     Open an SSH connection\n";
  std::cout << "  ssh list                           List SSH connections\n";
  std::cout << "  ssh exec <id> <command>            Run a command\n";
  std::cout << "  ssh cancel <id>                    Stop streaming the running command\n";
  std::cout << "  ssh abort <id>                     Cancel a connect in progress\n";
  std::cout << "  ssh output <id> [n]                Show buffered output\n";
  std::cout << "  ssh disconnect|reconnect|remove <id>\n";
  std::cout << "  ssh profiles                       List saved profiles\n";
  std::cout << "  ssh save <name> user@host[:port] [-i key]\n";
  std::cout << "  ssh open <profile>                 Connect using a saved profile\n";
  std::cout << "  ssh forget <profile>               Delete a saved profile\n";
  std::cout << "  settings [list|get|set|save|load]  Manage runtime settings\n";
  std::cout << "  set [key value]                    Shortcut for settings set (lists when empty)\n";
  std::cout << "  get <key>                          Shortcut for settings get\n";
  std::cout << "  save                               Shortcut for settings save\n";
  std::cout << "  bell                               Play notification bell\n";
}

void Console::list_peers() {
  auto peers = daemon_.peers();
  std::cout << to_hex(daemon_.peer_id()) << " (" << daemon_.display_name() << ") [you] tcp "
            << daemon_.tcp_port() << "\n";
  if(peers->empty()) {
    std::cout << "No peers discovered yet.\n";
    return;
  }
  auto now = PeerRegistry::Clock::now();
  for(const auto& p : *peers) {
    auto addr = p.best_address();
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - p.last_seen).count();
    std::cout << to_hex(p.id) << " (" << p.display_name << ") "
              << to_string(p.state) << " "
              << (addr ? addr->to_string() : std::string("-"))
              << " seen " << age << "s ago";
    auto unread = daemon_.router().unread_count(ConversationKey::with_peer(p.id));
    if(unread) std::cout << " [" << unread << " unread]";
    std::cout << "\n";
  }
}

void Console::rename(const std::string& args) {
  if(args.empty()) {
    std::cout << daemon_.display_name() << "\n";
    return;
  }
  if(args.size() > 255) {
    std::cout << "Name too long.\n";
    return;
  }
  daemon_.set_display_name(args);
  std::string error;
  if(settings_ && !settings_->set_from_string("display_name", args, error)) {
    std::cout << "Failed to update display_name setting: " << error << "\n";
  }
  std::cout << "Now announcing as '" << args << "'\n";
}

void Console::send_broadcast(const std::string& text) {
  if(text.empty()) {
    std::cout << "Usage: send <message>\n";
    return;
  }
  auto message = daemon_.send_message(MessageKind::Broadcast, text);
  print_message(message);
}

void Console::send_private(const std::string& args) {
  std::istringstream iss(args);
  std::string who;
  iss >> who;
  auto text = rest_of(iss);
  if(who.empty() || text.empty()) {
    std::cout << "Usage: msg <peer> <message>\n";
    return;
  }
  auto peer = resolve_peer_id(who);
  if(!peer) {
    std::cout << "No unique peer matches '" << who << "'.\n";
    return;
  }
  auto message = daemon_.send_message(MessageKind::Private, text, *peer);
  print_message(message);
}

void Console::handle_group_command(const std::string& args) {
  std::istringstream iss(args);
  std::string action;
  iss >> action;

  if(action.empty() || action == "list") {
    auto groups = daemon_.groups();
    if(groups.empty()) {
      std::cout << "No groups.\n";
      return;
    }
    for(const auto& g : groups) {
      std::cout << to_hex(g.id) << " '" << g.name << "' " << g.members.size() << " member(s)\n";
      for(const auto& member : g.members) {
        std::cout << "    " << (member == daemon_.peer_id() ? std::string("you") : peer_label(member)) << "\n";
      }
    }
    return;
  }

  if(action == "create") {
    std::string name;
    iss >> name;
    if(name.empty()) {
      std::cout << "Usage: group create <name> [peer ...]\n";
      return;
    }
    std::vector<PeerId> members;
    std::string token;
    while(iss >> token) {
      auto peer = resolve_peer_id(token);
      if(!peer) {
        std::cout << "No unique peer matches '" << token << "'.\n";
        return;
      }
      members.push_back(*peer);
    }
    auto g = daemon_.create_group(name, members);
    std::cout << "Created group '" << g.name << "' " << to_hex(g.id) << "\n";
    return;
  }

  std::string group_token;
  iss >> group_token;
  auto group = resolve_group(group_token);
  if(!group) {
    std::cout << "No unique group matches '" << group_token << "'.\n";
    return;
  }

  if(action == "add" || action == "remove") {
    std::string who;
    iss >> who;
    std::optional<PeerId> peer;
    if(who == "me") {
      peer = daemon_.peer_id();
    } else {
      peer = resolve_peer_id(who);
    }
    if(!peer) {
      std::cout << "No unique peer matches '" << who << "'.\n";
      return;
    }
    bool changed = action == "add" ? daemon_.router().add_group_member(*group, *peer)
                                   : daemon_.router().remove_group_member(*group, *peer);
    std::cout << (changed ? "Updated group.\n" : "Nothing to change.\n");
  } else if(action == "delete") {
    std::cout << (daemon_.router().delete_group(*group) ? "Group deleted.\n" : "Unknown group.\n");
  } else if(action == "send") {
    auto text = rest_of(iss);
    if(text.empty()) {
      std::cout << "Usage: group send <group> <message>\n";
      return;
    }
    auto message = daemon_.send_message(MessageKind::Group, text, std::nullopt, *group);
    print_message(message);
  } else {
    std::cout << "Unknown group action '" << action << "'.\n";
  }
}

void Console::handle_history_command(const std::string& args) {
  std::istringstream iss(args);
  std::vector<std::string> tokens;
  std::string token;
  while(iss >> token) tokens.push_back(token);

  std::size_t limit = 20;
  if(!tokens.empty() && std::all_of(tokens.back().begin(), tokens.back().end(), ::isdigit)) {
    limit = static_cast<std::size_t>(std::stoul(tokens.back()));
    tokens.pop_back();
  }

  ConversationKey key = ConversationKey::broadcast();
  if(tokens.size() == 2 && tokens[0] == "group") {
    auto group = resolve_group(tokens[1]);
    if(!group) {
      std::cout << "No unique group matches '" << tokens[1] << "'.\n";
      return;
    }
    key = ConversationKey::in_group(*group);
  } else if(tokens.size() == 1) {
    auto peer = resolve_peer_id(tokens[0]);
    if(!peer) {
      std::cout << "No unique peer matches '" << tokens[0] << "'.\n";
      return;
    }
    key = ConversationKey::with_peer(*peer);
  } else if(!tokens.empty()) {
    std::cout << "Usage: history [peer|group <g>] [n]\n";
    return;
  }

  auto messages = daemon_.history(key, limit);
  if(messages.empty()) {
    std::cout << "No messages.\n";
    return;
  }
  for(const auto& m : messages) {
    print_message(m);
    if(!m.read) daemon_.router().mark_read(m.id);
  }
}

void Console::handle_ssh_command(const std::string& args) {
  std::istringstream iss(args);
  std::string action;
  iss >> action;
  auto& ssh = daemon_.ssh();

  auto report = [](const SshError& error){
    if(error) std::cout << "Error: " << to_string(error.kind) << ": " << error.reason << "\n";
  };

  if(action.empty() || action == "list") {
    auto connections = daemon_.ssh_connections();
    if(connections.empty()) {
      std::cout << "No SSH connections.\n";
      return;
    }
    for(const auto& c : connections) {
      std::cout << c.id << " " << c.config.label() << " (" << c.config.username << "@"
                << c.config.host << ":" << c.config.port << ") " << to_string(c.state);
      if(c.last_error) std::cout << " [" << to_string(c.last_error.kind) << ": " << c.last_error.reason << "]";
      if(c.reconnect_attempts) std::cout << " retry " << c.reconnect_attempts;
      std::cout << " " << c.history.size() << " command(s)\n";
    }
    return;
  }

  if(action == "connect" || action == "save") {
    std::string name;
    if(action == "save") iss >> name;
    std::string target;
    iss >> target;
    SshConfig config;
    config.name = name;
    if(!parse_target(target, config.username, config.host, config.port)) {
      std::cout << "Usage: ssh " << action << (action == "save" ? " <name>" : "")
                << " user@host[:port] [-i key] [-r] [-n name]\n";
      return;
    }
    std::string opt;
    while(iss >> opt) {
      if(opt == "-i") {
        iss >> config.key_path;
        config.auth = SshAuthMethod::PublicKey;
      } else if(opt == "-r") {
        config.auto_reconnect = true;
      } else if(opt == "-n") {
        iss >> config.name;
      } else {
        std::cout << "Unknown option '" << opt << "'.\n";
        return;
      }
    }
    if(action == "save") {
      SshProfile profile;
      profile.name = config.name;
      profile.host = config.host;
      profile.port = config.port;
      profile.username = config.username;
      profile.key_path = config.key_path;
      auto saved = ssh.save_profile(profile);
      std::cout << "Saved profile " << saved.id << " '" << saved.name << "'\n";
      return;
    }
    auto secret = read_secret(config.auth == SshAuthMethod::Password ? "Password: " : "Key passphrase: ");
    if(!secret) return;
    SshError error;
    auto id = daemon_.connect_ssh(config, *secret, error);
    if(error) {
      report(error);
      return;
    }
    std::cout << "Connecting " << id << "\n";
    return;
  }

  if(action == "profiles") {
    auto profiles = daemon_.ssh_profiles();
    if(profiles.empty()) {
      std::cout << "No saved profiles.\n";
      return;
    }
    for(const auto& p : profiles) {
      std::cout << p.id << " '" << p.name << "' " << p.username << "@" << p.host << ":" << p.port;
      if(!p.key_path.empty()) std::cout << " key " << p.key_path;
      std::cout << "\n";
    }
    return;
  }

  std::string id;
  iss >> id;
  if(id.empty()) {
    std::cout << "Usage: ssh " << action << " <id>\n";
    return;
  }

  if(action == "open") {
    auto profile = ssh.profile(id);
    if(!profile) {
      std::cout << "Unknown profile '" << id << "'.\n";
      return;
    }
    auto secret = read_secret(profile->key_path.empty() ? "Password: " : "Key passphrase: ");
    if(!secret) return;
    SshError error;
    auto connection = ssh.connect_from_profile(id, *secret, error);
    if(error) {
      report(error);
      return;
    }
    std::cout << "Connecting " << connection << "\n";
  } else if(action == "forget") {
    std::cout << (ssh.delete_profile(id) ? "Profile deleted.\n" : "Unknown profile.\n");
  } else if(action == "exec") {
    auto command = rest_of(iss);
    if(command.empty()) {
      std::cout << "Usage: ssh exec <id> <command>\n";
      return;
    }
    SshError error;
    auto stream = daemon_.execute_command(id, command, error);
    if(error) {
      report(error);
      return;
    }
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_[id] = stream;
  } else if(action == "cancel") {
    std::shared_ptr<CommandStream> stream;
    {
      std::lock_guard<std::mutex> lock(streams_mutex_);
      auto it = streams_.find(id);
      if(it != streams_.end()) stream = it->second;
    }
    std::cout << (ssh.cancel_command(stream) ? "Cancelled.\n" : "No running command.\n");
  } else if(action == "abort") {
    report(ssh.cancel_connect(id));
  } else if(action == "output") {
    std::size_t limit = 50;
    std::string n;
    if(iss >> n) {
      try {
        limit = static_cast<std::size_t>(std::stoul(n));
      } catch(const std::exception&) {
        std::cout << "Invalid count '" << n << "'.\n";
        return;
      }
    }
    for(const auto& chunk : ssh.output(id, limit)) {
      auto& out = chunk.stream == OutputStream::Stdout ? std::cout : std::cerr;
      out << chunk.data;
    }
    std::cout.flush();
  } else if(action == "disconnect") {
    report(daemon_.disconnect_ssh(id));
  } else if(action == "reconnect") {
    report(ssh.reconnect(id));
  } else if(action == "remove") {
    report(ssh.remove(id));
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_.erase(id);
  } else {
    std::cout << "Unknown ssh action '" << action << "'.\n";
  }
}

void Console::handle_settings_command(const std::string& args) {
  if(!settings_) {
    std::cout << "Settings manager unavailable.\n";
    return;
  }

  std::istringstream iss(args);
  std::string action;
  iss >> action;

  if(action.empty() || action == "list") {
    std::string section;
    for(const auto& def : settings_->definitions()) {
      if(def.section != section) {
        section = def.section;
        std::cout << "[" << section << "]\n";
      }
      std::cout << "  " << std::left << std::setw(26) << def.key << " " << settings_->value_as_string(def.key) << "\n";
    }
    return;
  }

  if(action == "get") {
    std::string key;
    iss >> key;
    if(key.empty()) {
      std::cout << "Usage: settings get <key>\n";
      return;
    }
    auto resolved = settings_->resolve_key(key);
    if(!resolved) {
      std::cout << "Unknown setting '" << key << "'.\n";
      return;
    }
    std::cout << *resolved << " = " << settings_->value_as_string(*resolved) << "\n";
    return;
  }

  if(action == "set") {
    std::string key;
    iss >> key;
    auto value = rest_of(iss);
    if(key.empty() || value.empty()) {
      std::cout << "Usage: settings set <key> <value>\n";
      return;
    }
    auto resolved = settings_->resolve_key(key);
    if(!resolved) {
      std::cout << "Unknown setting '" << key << "'.\n";
      return;
    }
    std::string error;
    if(settings_->set_from_string(*resolved, value, error)) {
      apply_setting_side_effects(*resolved);
      std::cout << *resolved << " = " << settings_->value_as_string(*resolved) << "\n";
    } else {
      std::cout << "Failed to set " << *resolved << ": " << error << "\n";
    }
    return;
  }

  if(action == "save") {
    if(settings_->save()) {
      std::cout << "Saved settings to " << settings_->settings_path() << "\n";
    } else {
      std::cout << "Failed to save settings.\n";
    }
    return;
  }

  if(action == "load") {
    if(settings_->load()) {
      apply_setting_side_effects("audio_notifications");
      apply_setting_side_effects("display_name");
      std::cout << "Loaded settings from " << settings_->settings_path() << "\n";
    } else {
      std::cout << "Settings file not found.\n";
    }
    return;
  }

  std::cout << "Unknown settings action '" << action << "'.\n";
}

void Console::apply_setting_side_effects(const std::string& key) {
  if(key == "audio_notifications") {
    audio_notifications_ = settings_->get<bool>("audio_notifications");
  } else if(key == "display_name") {
    auto name = settings_->get<std::string>("display_name");
    if(!name.empty() && name != daemon_.display_name()) daemon_.set_display_name(name);
  } else if(key == "verbose") {
    spdlog::set_level(settings_->get<bool>("verbose") ? spdlog::level::debug : spdlog::level::info);
  } else {
    std::cout << "(" << key << " takes effect after restart)\n";
  }
}
