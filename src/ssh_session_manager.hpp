#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "event_bus.hpp"
#include "log.hpp"
#include "ssh_transport.hpp"
#include "ssh_types.hpp"

struct SshManagerConfig {
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds reconnect_base{1000};
  std::chrono::milliseconds reconnect_cap{30000};
  // zero disables
  std::chrono::seconds idle_timeout{900};
  std::chrono::milliseconds keepalive_interval{30000};
  std::size_t output_buffer_chunks = 2048;
};

// Persistence hook for SSH profiles.
class SshProfileStore {
public:
  virtual ~SshProfileStore() = default;
  virtual std::vector<SshProfile> load(std::string& error) = 0;
  virtual bool save(const std::vector<SshProfile>& profiles, std::string& error) = 0;
};

// Output of one executed command, in arrival order.
class CommandStream {
public:
  CommandStream(uint64_t id, std::string connection_id, std::string command);

  uint64_t id() const { return id_; }
  const std::string& connection_id() const { return connection_id_; }
  const std::string& command() const { return command_; }

  // Next chunk, waiting up to timeout. Empty on timeout, or once the
  // command finished and every chunk was taken.
  std::optional<OutputChunk> next(std::chrono::milliseconds timeout);
  std::vector<OutputChunk> drain();
  // Waits until the command finished. Returns false on timeout.
  bool wait(std::chrono::milliseconds timeout) const;

  bool finished() const;
  bool cancelled() const { return cancel_; }
  std::optional<int> exit_status() const;
  SshError error() const;

private:
  friend class SshSessionManager;

  void push(const OutputChunk& chunk);
  void finish(std::optional<int> exit_status, SshError error);

  const uint64_t id_;
  const std::string connection_id_;
  const std::string command_;
  std::atomic<bool> cancel_{false};

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::deque<OutputChunk> chunks_;
  bool finished_ = false;
  std::optional<int> exit_status_;
  SshError error_;
};

// Pool of SSH client connections. Each connection is a state machine run by
// its own worker thread; the public API only posts requests to it.
class SshSessionManager {
public:
  SshSessionManager(SshManagerConfig config,
                    SshTransportFactory factory,
                    std::shared_ptr<EventBus> bus,
                    std::shared_ptr<SshProfileStore> store = nullptr,
                    std::shared_ptr<Logger> logger = nullptr);
  ~SshSessionManager();

  SshSessionManager(const SshSessionManager&) = delete;
  SshSessionManager& operator=(const SshSessionManager&) = delete;

  // Starts connecting and returns the new connection id, or an empty string
  // with error set when the config is unusable. For public key auth the
  // secret is the key passphrase.
  std::string connect(const SshConfig& config, const std::string& secret, SshError& error);

  std::shared_ptr<CommandStream> execute(const std::string& connection_id,
                                         const std::string& command,
                                         SshError& error);
  // Stops streaming; the connection stays Connected.
  bool cancel_command(const std::shared_ptr<CommandStream>& stream);
  SshError cancel_connect(const std::string& connection_id);
  SshError disconnect(const std::string& connection_id);
  // Manual reconnect from Error or Disconnected. An empty secret reuses the
  // one given at connect time.
  SshError reconnect(const std::string& connection_id, const std::string& secret = {});
  SshError remove(const std::string& connection_id);

  std::optional<SshConnectionInfo> info(const std::string& connection_id) const;
  std::vector<SshConnectionInfo> connections() const;
  std::vector<OutputChunk> output(const std::string& connection_id, std::size_t limit = 0) const;
  // Blocks until the connection is in one of the given states.
  std::optional<SshState> wait_for_state(const std::string& connection_id,
                                         const std::vector<SshState>& states,
                                         std::chrono::milliseconds timeout) const;

  SshProfile save_profile(SshProfile profile);
  bool delete_profile(const std::string& profile_id);
  std::vector<SshProfile> profiles() const;
  std::optional<SshProfile> profile(const std::string& profile_id) const;
  std::string connect_from_profile(const std::string& profile_id,
                                   const std::string& secret,
                                   SshError& error);

  void shutdown();

private:
  struct Connection;

  std::shared_ptr<Connection> find(const std::string& connection_id) const;
  void run_worker(const std::shared_ptr<Connection>& conn);
  bool connect_once(const std::shared_ptr<Connection>& conn);
  void auto_reconnect(const std::shared_ptr<Connection>& conn);
  void run_command(const std::shared_ptr<Connection>& conn, const std::shared_ptr<CommandStream>& stream);
  void close_session(const std::shared_ptr<Connection>& conn, SshState final_state);
  void transition(const std::shared_ptr<Connection>& conn, SshState to, SshError error = {});
  void record_output(const std::shared_ptr<Connection>& conn, const OutputChunk& chunk);
  void persist_profiles_locked();
  std::chrono::milliseconds backoff_delay(int attempt) const;

  SshManagerConfig config_;
  SshTransportFactory factory_;
  std::shared_ptr<EventBus> bus_;
  std::shared_ptr<SshProfileStore> store_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Connection>> connections_;
  uint64_t next_connection_ = 1;
  std::atomic<uint64_t> next_command_{1};

  mutable std::mutex profiles_mutex_;
  std::vector<SshProfile> profiles_;
};
