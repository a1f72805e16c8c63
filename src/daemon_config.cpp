#include "daemon_config.hpp"

#include <unistd.h>

#include <limits>
#include <stdexcept>

namespace {

int int_in_range(const SettingsManager& settings, const std::string& key, int min, int max) {
  int value = settings.get<int>(key);
  if(value < min || value > max) {
    throw std::runtime_error(fmt::format("Invalid {} '{}' (expected {}..{})", key, value, min, max));
  }
  return value;
}

uint16_t port_setting(const SettingsManager& settings, const std::string& key, bool allow_zero) {
  return static_cast<uint16_t>(int_in_range(settings, key, allow_zero ? 0 : 1, 65535));
}

} // namespace

std::string default_display_name() {
  char hostname[256] = {0};
  if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0') {
    return "ztalk-" + std::to_string(getpid());
  }
  return std::string(hostname) + "-" + std::to_string(getpid());
}

DaemonConfig make_daemon_config(const SettingsManager& settings) {
  constexpr int kIntMax = std::numeric_limits<int>::max();
  DaemonConfig config;

  auto peer_id = settings.get<std::string>("peer_id");
  if(!peer_id.empty()) {
    auto parsed = uid_from_hex(peer_id);
    if(!parsed) {
      throw std::runtime_error("Invalid peer_id '" + peer_id + "' (expected 32 hex digits)");
    }
    config.peer_id = *parsed;
  }
  config.display_name = settings.get<std::string>("display_name");
  if(config.display_name.empty()) config.display_name = default_display_name();
  if(config.display_name.size() > 255) {
    throw std::runtime_error("Invalid display_name (longer than 255 bytes)");
  }

  auto& transport = config.transport;
  transport.listen_ip = settings.get<std::string>("listen_ip");
  transport.tcp_port = port_setting(settings, "tcp_port", true);
  transport.multicast_group = settings.get<std::string>("multicast_group");
  transport.multicast_port = port_setting(settings, "multicast_port", false);
  transport.multicast_interface = settings.get<std::string>("multicast_interface");
  transport.multicast_ttl = int_in_range(settings, "multicast_ttl", 0, 255);
  transport.multicast_loopback = settings.get<bool>("multicast_loopback");
  transport.connect_timeout = std::chrono::milliseconds(int_in_range(settings, "connect_timeout_ms", 1, kIntMax));
  transport.write_timeout = std::chrono::milliseconds(int_in_range(settings, "write_timeout_ms", 1, kIntMax));

  std::error_code ec;
  asio::ip::make_address(transport.listen_ip, ec);
  if(ec) throw std::runtime_error("Invalid listen_ip '" + transport.listen_ip + "': " + ec.message());
  auto group = asio::ip::make_address(transport.multicast_group, ec);
  if(ec || !group.is_v4() || !group.is_multicast()) {
    throw std::runtime_error("Invalid multicast_group '" + transport.multicast_group +
                             "' (expected an IPv4 multicast address)");
  }
  if(!transport.multicast_interface.empty()) {
    auto iface = asio::ip::make_address(transport.multicast_interface, ec);
    if(ec || !iface.is_v4()) {
      throw std::runtime_error("Invalid multicast_interface '" + transport.multicast_interface + "'");
    }
  }

  auto heartbeat = std::chrono::milliseconds(int_in_range(settings, "heartbeat_interval_ms", 10, kIntMax));
  config.registry.heartbeat = heartbeat;
  config.registry.offline_missed_intervals = int_in_range(settings, "offline_missed_intervals", 1, 1000);
  config.registry.eviction_grace = std::chrono::milliseconds(int_in_range(settings, "eviction_grace_ms", 0, kIntMax));
  config.discovery.heartbeat = heartbeat;

  config.router.dedup_capacity = static_cast<std::size_t>(int_in_range(settings, "dedup_capacity", 1, kIntMax));
  config.router.dedup_window = std::chrono::milliseconds(int_in_range(settings, "dedup_window_ms", 1, kIntMax));
  config.router.history_limit = static_cast<std::size_t>(int_in_range(settings, "message_history_limit", 1, kIntMax));
  config.router.max_conversations = static_cast<std::size_t>(int_in_range(settings, "max_conversations", 1, kIntMax));

  config.ssh.connect_timeout = std::chrono::milliseconds(int_in_range(settings, "ssh_connect_timeout_ms", 1, kIntMax));
  config.ssh.reconnect_base = std::chrono::milliseconds(int_in_range(settings, "ssh_reconnect_base_ms", 1, kIntMax));
  config.ssh.reconnect_cap = std::chrono::milliseconds(int_in_range(settings, "ssh_reconnect_cap_ms", 1, kIntMax));
  if(config.ssh.reconnect_cap < config.ssh.reconnect_base) {
    throw std::runtime_error("ssh_reconnect_cap_ms must not be below ssh_reconnect_base_ms");
  }
  config.ssh.idle_timeout = std::chrono::seconds(int_in_range(settings, "ssh_idle_timeout_s", 0, kIntMax));
  config.ssh.output_buffer_chunks = static_cast<std::size_t>(int_in_range(settings, "ssh_output_buffer_chunks", 1, kIntMax));

  auto profiles = settings.get<std::string>("ssh_profiles_file");
  config.ssh_profiles_file = profiles.empty() ? default_state_dir() / "ssh_profiles.json"
                                              : std::filesystem::path(profiles);

  config.log.verbose = settings.get<bool>("verbose");
  config.log.log_file = settings.get<std::string>("log_file");
  config.audio_notifications = settings.get<bool>("audio_notifications");
  return config;
}
