#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "ssh_types.hpp"

using SshChunkSink = std::function<void(OutputStream stream, std::string data)>;

// Blocking client side of one SSH connection. A transport is driven by a
// single worker thread; interrupt() is the only call allowed from others.
class SshTransport {
public:
  using Deadline = std::chrono::steady_clock::time_point;

  virtual ~SshTransport() = default;

  // TCP connect to config.host:config.port.
  virtual SshError open(const SshConfig& config, Deadline deadline) = 0;
  // Key exchange and user authentication over the opened socket. For
  // public key auth a non-empty secret is the key passphrase.
  virtual SshError authenticate(const SshConfig& config,
                                const std::string& secret,
                                Deadline deadline) = 0;
  // Runs one command, streaming output to sink until it exits or cancel is
  // set. exit_status is valid when the returned error is None.
  virtual SshError execute(const std::string& command,
                           const SshChunkSink& sink,
                           const std::atomic<bool>& cancel,
                           int& exit_status) = 0;
  // Cheap liveness check while idle.
  virtual bool alive() = 0;
  virtual void close() = 0;
  // Aborts a blocking open or authenticate.
  virtual void interrupt() = 0;
};

using SshTransportFactory = std::function<std::unique_ptr<SshTransport>()>;
