#pragma once

#include <asio.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "daemon_config.hpp"
#include "discovery_engine.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "message_router.hpp"
#include "peer_registry.hpp"
#include "ssh_session_manager.hpp"
#include "transport.hpp"

// Owns every component once, plus the io_context and its thread. The public
// methods are the observer API used by the console and by embedders.
class ZtalkDaemon {
public:
  struct Options {
    // empty uses libssh
    SshTransportFactory ssh_transport_factory;
    // empty uses a JSON file at DaemonConfig::ssh_profiles_file
    std::shared_ptr<SshProfileStore> profile_store;
    // stop on SIGINT/SIGTERM
    bool handle_signals = false;
  };

  explicit ZtalkDaemon(DaemonConfig config, Options options = Options{});
  ~ZtalkDaemon();

  ZtalkDaemon(const ZtalkDaemon&) = delete;
  ZtalkDaemon& operator=(const ZtalkDaemon&) = delete;

  // Binds the sockets and starts the io thread. Throws std::runtime_error
  // when the listener cannot be opened.
  void start();
  // Blocks until stop() or request_stop() is called, then stops.
  void run();
  // Must not be called from the io thread.
  void stop();
  // Safe from any thread, including signal handlers running on the io thread.
  void request_stop();
  bool running() const { return started_; }

  // Events
  std::shared_ptr<EventBus> bus() const { return bus_; }
  std::shared_ptr<Subscription> subscribe(std::vector<EventType> types = {},
                                          std::size_t capacity = EventBus::kDefaultCapacity);

  // Peers
  std::shared_ptr<const PeerRegistry::PeerList> peers() const;
  std::optional<Peer> peer(const PeerId& id) const;
  // Resolves a full id, a unique id prefix or a unique display name.
  std::optional<Peer> resolve_peer(const std::string& token) const;
  void set_display_name(std::string name);
  std::string display_name() const;

  // Messages and groups
  Message send_message(MessageKind kind,
                       std::string content,
                       std::optional<PeerId> recipient = std::nullopt,
                       std::optional<GroupId> group = std::nullopt,
                       DeliveryCallback callback = nullptr);
  Group create_group(const std::string& name, const std::vector<PeerId>& members);
  std::vector<Group> groups() const;
  std::vector<Message> history(const ConversationKey& key, std::size_t limit = 0) const;

  // SSH
  std::string connect_ssh(const SshConfig& config, const std::string& secret, SshError& error);
  std::shared_ptr<CommandStream> execute_command(const std::string& connection_id,
                                                 const std::string& command,
                                                 SshError& error);
  SshError disconnect_ssh(const std::string& connection_id);
  std::vector<SshConnectionInfo> ssh_connections() const;
  std::vector<SshProfile> ssh_profiles() const;

  const PeerId& peer_id() const { return config_.peer_id; }
  uint16_t tcp_port() const;
  const DaemonConfig& config() const { return config_; }

  MessageRouter& router() { return *router_; }
  SshSessionManager& ssh() { return *ssh_; }
  PeerRegistry& registry() { return *registry_; }
  DiscoveryEngine& discovery() { return *discovery_; }
  Transport& transport() { return *transport_; }

  std::shared_ptr<Logger> logger() const { return logger_; }
  // Attaches the listener to the logger of every component.
  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

private:
  void shutdown_on_io_thread();
  void wait_for_signals();

  DaemonConfig config_;
  Options options_;

  std::shared_ptr<Logger> logger_;
  std::vector<std::shared_ptr<Logger>> component_loggers_;
  std::mutex listeners_mutex_;
  std::vector<std::pair<LogListenerHandle, std::vector<LogListenerHandle>>> listeners_;
  LogListenerHandle next_listener_ = 1;

  asio::io_context io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::unique_ptr<asio::signal_set> signals_;
  std::thread io_thread_;

  std::shared_ptr<EventBus> bus_;
  std::unique_ptr<PeerRegistry> registry_;
  std::unique_ptr<Transport> transport_;
  std::unique_ptr<DiscoveryEngine> discovery_;
  std::unique_ptr<MessageRouter> router_;
  std::unique_ptr<SshSessionManager> ssh_;

  std::atomic<bool> started_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_ = false;
};
