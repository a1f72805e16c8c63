#pragma once
#include <asio.hpp>
#include <libssh/libssh.h>

#include <atomic>
#include <memory>
#include <string>

#include "log.hpp"
#include "ssh_transport.hpp"

// SshTransport over libssh. The TCP connection is made with asio so that it
// honours the deadline and interrupt(); libssh then runs on a duplicate of
// the socket descriptor in non-blocking mode.
class LibsshTransport : public SshTransport {
public:
  explicit LibsshTransport(std::shared_ptr<Logger> logger = nullptr);
  ~LibsshTransport() override;

  SshError open(const SshConfig& config, Deadline deadline) override;
  SshError authenticate(const SshConfig& config,
                        const std::string& secret,
                        Deadline deadline) override;
  SshError execute(const std::string& command,
                   const SshChunkSink& sink,
                   const std::atomic<bool>& cancel,
                   int& exit_status) override;
  bool alive() override;
  void close() override;
  void interrupt() override { interrupted_ = true; }

  static SshTransportFactory factory(std::shared_ptr<Logger> logger = nullptr);

private:
  SshError verify_host_key();
  SshError session_error(SshErrorKind kind, const char* what) const;

  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  ssh_session session_ = nullptr;
  std::string host_;
  std::atomic<bool> interrupted_{false};
};
