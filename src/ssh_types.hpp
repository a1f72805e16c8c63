#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class SshState {
  Idle,
  Connecting,
  Connected,
  Disconnecting,
  Disconnected,
  Error
};

enum class SshErrorKind {
  None,
  AuthenticationFailed,
  ConnectionLost,
  CommandFailed,
  Timeout,
  Unreachable,
  Refused,
  Cancelled,
  NotConnected,
  UnknownConnection,
  InvalidConfig,
  InvalidState,
  ProtocolError
};

const char* to_string(SshState state);
const char* to_string(SshErrorKind kind);

struct SshError {
  SshErrorKind kind = SshErrorKind::None;
  std::string reason;

  explicit operator bool() const { return kind != SshErrorKind::None; }
};

enum class OutputStream { Stdout, Stderr };

struct OutputChunk {
  OutputStream stream = OutputStream::Stdout;
  std::string data;
  std::chrono::system_clock::time_point at{};
  uint64_t command_id = 0;
  // set on the trailing marker chunk of a command that exited non-zero
  std::optional<int> exit_status;
};

enum class SshAuthMethod { Password, PublicKey };

struct SshConfig {
  std::string name;
  std::string host;
  uint16_t port = 22;
  std::string username;
  SshAuthMethod auth = SshAuthMethod::Password;
  std::string key_path;
  bool auto_reconnect = false;
  int max_reconnect_attempts = 3;
  // zero uses the manager default
  std::chrono::milliseconds connect_timeout{0};

  std::string label() const {
    return name.empty() ? username + "@" + host : name;
  }
};

// Snapshot handed to observers; never contains credentials.
struct SshConnectionInfo {
  std::string id;
  SshConfig config;
  SshState state = SshState::Idle;
  SshError last_error;
  std::chrono::system_clock::time_point last_activity{};
  std::vector<std::string> history;
  std::size_t buffered_chunks = 0;
  int reconnect_attempts = 0;
};

struct SshProfile {
  std::string id;
  std::string name;
  std::string host;
  uint16_t port = 22;
  std::string username;
  std::string key_path;
};
