#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "settings_manager.hpp"
#include "ztalk_daemon.hpp"

// Interactive operator shell. Commands go through the daemon's observer API;
// a second thread prints events as they arrive.
class Console {
public:
  Console(ZtalkDaemon& daemon,
          std::shared_ptr<SettingsManager> settings,
          bool audio_notifications = false);
  ~Console();

  Console(const Console&) = delete;
  Console& operator=(const Console&) = delete;

  // Reads commands until quit or end of input.
  void run();
  void stop();

  // One command line; returns false for quit.
  bool execute_command(const std::string& line);

private:
  std::optional<std::string> read_command_line(const char* prompt);
  std::optional<std::string> read_secret(const char* prompt);

  void start_event_thread();
  void stop_event_thread();
  void event_loop();
  void print_event(const Event& event);

  void print_help();
  void list_peers();
  void rename(const std::string& args);
  void send_broadcast(const std::string& text);
  void send_private(const std::string& args);
  void handle_group_command(const std::string& args);
  void handle_history_command(const std::string& args);
  void handle_ssh_command(const std::string& args);
  void handle_settings_command(const std::string& args);
  void apply_setting_side_effects(const std::string& key);

  std::optional<GroupId> resolve_group(const std::string& token) const;
  std::optional<PeerId> resolve_peer_id(const std::string& token) const;
  std::string peer_label(const PeerId& id) const;
  void print_message(const Message& message);

  ZtalkDaemon& daemon_;
  std::shared_ptr<SettingsManager> settings_;
  std::atomic<bool> running_{false};
  std::atomic<bool> audio_notifications_{false};

  std::shared_ptr<Subscription> events_;
  std::thread event_thread_;

  // latest running command per connection, for "ssh cancel"
  std::mutex streams_mutex_;
  std::map<std::string, std::shared_ptr<CommandStream>> streams_;
};
