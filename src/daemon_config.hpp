#pragma once
#include <filesystem>
#include <string>

#include "discovery_engine.hpp"
#include "log.hpp"
#include "message_router.hpp"
#include "peer_registry.hpp"
#include "settings_manager.hpp"
#include "ssh_session_manager.hpp"
#include "transport.hpp"
#include "utils.hpp"

// Typed view of the settings table, one block per component.
struct DaemonConfig {
  PeerId peer_id{};
  std::string display_name;

  TransportConfig transport;
  RegistryConfig registry;
  DiscoveryConfig discovery;
  RouterConfig router;
  SshManagerConfig ssh;

  // empty disables profile persistence
  std::filesystem::path ssh_profiles_file;
  LogOptions log;
  bool audio_notifications = false;
};

// Throws std::runtime_error naming the offending key when a value is out of
// range. An empty peer_id setting yields a nil peer_id; the caller decides
// whether to generate one.
DaemonConfig make_daemon_config(const SettingsManager& settings);

// host-pid, used when no display name is configured.
std::string default_display_name();
