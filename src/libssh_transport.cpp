#include "libssh_transport.hpp"

#include <unistd.h>

#include <mutex>
#include <thread>

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
constexpr auto kExitStatusGrace = std::chrono::seconds(2);

SshError classify_connect_error(const std::error_code& ec) {
  if(ec == asio::error::connection_refused) return {SshErrorKind::Refused, ec.message()};
  if(ec == asio::error::timed_out) return {SshErrorKind::Timeout, ec.message()};
  return {SshErrorKind::Unreachable, ec.message()};
}

void free_channel(ssh_channel channel) {
  ssh_channel_close(channel);
  ssh_channel_free(channel);
}

} // namespace

LibsshTransport::LibsshTransport(std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("libssh")),
    socket_(io_) {
  static std::once_flag init_once;
  std::call_once(init_once, []{ ssh_init(); });
}

LibsshTransport::~LibsshTransport() {
  close();
}

SshTransportFactory LibsshTransport::factory(std::shared_ptr<Logger> logger) {
  return [logger]() -> std::unique_ptr<SshTransport> {
    return std::make_unique<LibsshTransport>(logger);
  };
}

SshError LibsshTransport::session_error(SshErrorKind kind, const char* what) const {
  std::string reason(what);
  if(session_) {
    reason += ": ";
    reason += ssh_get_error(session_);
  }
  return {kind, reason};
}

SshError LibsshTransport::open(const SshConfig& config, Deadline deadline) {
  close();
  host_ = config.host;

  std::error_code result = asio::error::would_block;
  bool abandoned = false;
  asio::ip::tcp::resolver resolver(io_);
  resolver.async_resolve(config.host, std::to_string(config.port),
    [&](const std::error_code& ec, asio::ip::tcp::resolver::results_type results){
      if(ec) {
        result = ec;
        return;
      }
      // the resolve may finish after the deadline loop gave up
      if(abandoned || interrupted_ || std::chrono::steady_clock::now() >= deadline) {
        result = asio::error::operation_aborted;
        return;
      }
      asio::async_connect(socket_, results,
        [&](const std::error_code& connect_ec, const asio::ip::tcp::endpoint&){
          result = connect_ec;
        });
    });

  io_.restart();
  while(result == asio::error::would_block) {
    if(interrupted_ || std::chrono::steady_clock::now() >= deadline) {
      abandoned = true;
      resolver.cancel();
      std::error_code ignored;
      socket_.close(ignored);
      io_.restart();
      io_.run();
      if(interrupted_) return {SshErrorKind::Cancelled, "connect cancelled"};
      return {SshErrorKind::Timeout, "connect to " + config.host + " timed out"};
    }
    io_.run_for(std::chrono::milliseconds(50));
    if(io_.stopped() && result == asio::error::would_block) io_.restart();
  }
  if(result) return classify_connect_error(result);
  logger_->debug("tcp connected to {}:{}", config.host, config.port);
  return {};
}

SshError LibsshTransport::authenticate(const SshConfig& config,
                                       const std::string& secret,
                                       Deadline deadline) {
  if(!socket_.is_open()) return {SshErrorKind::NotConnected, "socket not open"};

  session_ = ssh_new();
  if(!session_) return {SshErrorKind::ProtocolError, "cannot allocate ssh session"};

  // libssh closes the descriptor it is given; keep asio's copy separate.
  socket_t fd = ::dup(socket_.native_handle());
  if(fd < 0) return {SshErrorKind::ProtocolError, "cannot duplicate socket"};
  unsigned int port = config.port;
  ssh_options_set(session_, SSH_OPTIONS_HOST, config.host.c_str());
  ssh_options_set(session_, SSH_OPTIONS_PORT, &port);
  ssh_options_set(session_, SSH_OPTIONS_USER, config.username.c_str());
  ssh_options_set(session_, SSH_OPTIONS_FD, &fd);
  ssh_set_blocking(session_, 0);

  auto wait_again = [&]() -> SshError {
    if(interrupted_) return {SshErrorKind::Cancelled, "handshake cancelled"};
    if(std::chrono::steady_clock::now() >= deadline) {
      return {SshErrorKind::Timeout, "handshake with " + config.host + " timed out"};
    }
    std::this_thread::sleep_for(kPollInterval);
    return {};
  };

  int rc;
  while((rc = ssh_connect(session_)) == SSH_AGAIN) {
    if(auto err = wait_again()) return err;
  }
  if(rc != SSH_OK) return session_error(SshErrorKind::ProtocolError, "handshake failed");

  if(auto err = verify_host_key()) return err;

  if(config.auth == SshAuthMethod::Password) {
    while((rc = ssh_userauth_password(session_, nullptr, secret.c_str())) == SSH_AUTH_AGAIN) {
      if(auto err = wait_again()) return err;
    }
  } else {
    ssh_key raw_key = nullptr;
    if(ssh_pki_import_privkey_file(config.key_path.c_str(),
                                   secret.empty() ? nullptr : secret.c_str(),
                                   nullptr, nullptr, &raw_key) != SSH_OK) {
      return {SshErrorKind::AuthenticationFailed, "cannot load private key " + config.key_path};
    }
    std::unique_ptr<ssh_key_struct, void(*)(ssh_key)> key(raw_key, &ssh_key_free);
    while((rc = ssh_userauth_publickey(session_, nullptr, key.get())) == SSH_AUTH_AGAIN) {
      if(auto err = wait_again()) return err;
    }
  }
  if(rc == SSH_AUTH_ERROR) return session_error(SshErrorKind::ProtocolError, "authentication error");
  if(rc != SSH_AUTH_SUCCESS) {
    return {SshErrorKind::AuthenticationFailed, "authentication rejected for " + config.username};
  }
  return {};
}

SshError LibsshTransport::verify_host_key() {
  switch(ssh_session_is_known_server(session_)) {
    case SSH_KNOWN_HOSTS_OK:
      return {};
    case SSH_KNOWN_HOSTS_CHANGED:
      return {SshErrorKind::ProtocolError, "host key for " + host_ + " has changed"};
    case SSH_KNOWN_HOSTS_OTHER:
      return {SshErrorKind::ProtocolError, "host key type for " + host_ + " has changed"};
    case SSH_KNOWN_HOSTS_NOT_FOUND:
    case SSH_KNOWN_HOSTS_UNKNOWN:
      logger_->warn("accepting unknown host key for {}", host_);
      if(ssh_session_update_known_hosts(session_) != SSH_OK) {
        logger_->warn("could not record host key for {}: {}", host_, ssh_get_error(session_));
      }
      return {};
    case SSH_KNOWN_HOSTS_ERROR:
      break;
  }
  return session_error(SshErrorKind::ProtocolError, "host key check failed");
}

SshError LibsshTransport::execute(const std::string& command,
                                  const SshChunkSink& sink,
                                  const std::atomic<bool>& cancel,
                                  int& exit_status) {
  exit_status = 0;
  if(!session_) return {SshErrorKind::NotConnected, "no session"};

  ssh_channel raw = ssh_channel_new(session_);
  if(!raw) return session_error(SshErrorKind::ConnectionLost, "cannot create channel");
  std::unique_ptr<ssh_channel_struct, void(*)(ssh_channel)> channel(raw, &free_channel);

  int rc;
  while((rc = ssh_channel_open_session(channel.get())) == SSH_AGAIN) {
    if(cancel) return {SshErrorKind::Cancelled, "command cancelled"};
    std::this_thread::sleep_for(kPollInterval);
  }
  if(rc != SSH_OK) {
    return session_error(ssh_is_connected(session_) ? SshErrorKind::CommandFailed
                                                    : SshErrorKind::ConnectionLost,
                         "cannot open session channel");
  }
  while((rc = ssh_channel_request_exec(channel.get(), command.c_str())) == SSH_AGAIN) {
    if(cancel) return {SshErrorKind::Cancelled, "command cancelled"};
    std::this_thread::sleep_for(kPollInterval);
  }
  if(rc != SSH_OK) return session_error(SshErrorKind::CommandFailed, "exec request failed");

  char buf[4096];
  for(;;) {
    if(cancel) {
      ssh_channel_send_eof(channel.get());
      return {SshErrorKind::Cancelled, "command cancelled"};
    }
    bool got = false;
    for(int is_stderr = 0; is_stderr < 2; ++is_stderr) {
      int n = ssh_channel_read_nonblocking(channel.get(), buf, sizeof(buf), is_stderr);
      if(n == SSH_ERROR) return session_error(SshErrorKind::ConnectionLost, "channel read failed");
      if(n > 0) {
        got = true;
        sink(is_stderr ? OutputStream::Stderr : OutputStream::Stdout,
             std::string(buf, static_cast<std::size_t>(n)));
      }
    }
    if(got) continue;
    if(ssh_channel_is_eof(channel.get()) || ssh_channel_is_closed(channel.get())) break;
    if(!ssh_is_connected(session_)) return {SshErrorKind::ConnectionLost, "session closed by remote"};
    std::this_thread::sleep_for(kPollInterval);
  }

  // the exit-status request may trail the EOF
  auto until = std::chrono::steady_clock::now() + kExitStatusGrace;
  int status = ssh_channel_get_exit_status(channel.get());
  while(status == -1 && !ssh_channel_is_closed(channel.get()) &&
        std::chrono::steady_clock::now() < until) {
    ssh_channel_poll(channel.get(), 0);
    std::this_thread::sleep_for(kPollInterval);
    status = ssh_channel_get_exit_status(channel.get());
  }
  if(status == -1) {
    logger_->debug("no exit status for '{}'", command);
    status = 0;
  }
  exit_status = status;
  return {};
}

bool LibsshTransport::alive() {
  if(!session_) return false;
  if(ssh_send_ignore(session_, "keepalive") != SSH_OK) return false;
  return ssh_is_connected(session_) == 1;
}

void LibsshTransport::close() {
  if(session_) {
    ssh_disconnect(session_);
    ssh_free(session_);
    session_ = nullptr;
  }
  std::error_code ignored;
  socket_.close(ignored);
}
