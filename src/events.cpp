#include "events.hpp"

#include <spdlog/fmt/fmt.h>

const char* to_string(EventType type) {
  switch(type) {
    case EventType::PeerAdded: return "peer-added";
    case EventType::PeerUpdated: return "peer-updated";
    case EventType::PeerStateChanged: return "peer-state-changed";
    case EventType::PeerRemoved: return "peer-removed";
    case EventType::MessageReceived: return "message-received";
    case EventType::MessageSendFailed: return "message-send-failed";
    case EventType::ConnectionStateChanged: return "connection-state-changed";
    case EventType::OutputReceived: return "output-received";
  }
  return "unknown";
}

const char* to_string(SshState state) {
  switch(state) {
    case SshState::Idle: return "idle";
    case SshState::Connecting: return "connecting";
    case SshState::Connected: return "connected";
    case SshState::Disconnecting: return "disconnecting";
    case SshState::Disconnected: return "disconnected";
    case SshState::Error: return "error";
  }
  return "unknown";
}

const char* to_string(SshErrorKind kind) {
  switch(kind) {
    case SshErrorKind::None: return "none";
    case SshErrorKind::AuthenticationFailed: return "authentication failed";
    case SshErrorKind::ConnectionLost: return "connection lost";
    case SshErrorKind::CommandFailed: return "command failed";
    case SshErrorKind::Timeout: return "timeout";
    case SshErrorKind::Unreachable: return "unreachable";
    case SshErrorKind::Refused: return "refused";
    case SshErrorKind::Cancelled: return "cancelled";
    case SshErrorKind::NotConnected: return "not connected";
    case SshErrorKind::UnknownConnection: return "unknown connection";
    case SshErrorKind::InvalidConfig: return "invalid config";
    case SshErrorKind::InvalidState: return "invalid state";
    case SshErrorKind::ProtocolError: return "protocol error";
  }
  return "unknown";
}

std::string describe(const Event& event) {
  switch(event.type) {
    case EventType::PeerAdded:
    case EventType::PeerUpdated:
    case EventType::PeerRemoved:
      if(auto p = event.as<PeerEvent>()) {
        auto addr = p->peer.best_address();
        return fmt::format("{} {} ({}) {}", to_string(event.type),
                           p->peer.display_name, short_hex(p->peer.id),
                           addr ? addr->to_string() : std::string("-"));
      }
      break;
    case EventType::PeerStateChanged:
      if(auto p = event.as<PeerEvent>()) {
        return fmt::format("peer {} ({}) {} -> {}", p->peer.display_name,
                           short_hex(p->peer.id),
                           to_string(p->previous_state), to_string(p->peer.state));
      }
      break;
    case EventType::MessageReceived:
      if(auto m = event.as<MessageEvent>()) {
        const auto& msg = m->message;
        auto from = msg.sender_name.empty() ? short_hex(msg.sender_id) : msg.sender_name;
        if(msg.kind == MessageKind::Group && msg.group_id) {
          return fmt::format("[group {}] {}: {}", short_hex(*msg.group_id), from, msg.content);
        }
        return fmt::format("[{}] {}: {}", to_string(msg.kind), from, msg.content);
      }
      break;
    case EventType::MessageSendFailed:
      if(auto f = event.as<SendFailedEvent>()) {
        return fmt::format("message {} to {} failed: {}", short_hex(f->message_id),
                           short_hex(f->peer_id), to_string(f->reason));
      }
      break;
    case EventType::ConnectionStateChanged:
      if(auto c = event.as<ConnectionStateEvent>()) {
        if(c->error) {
          return fmt::format("ssh {} {} -> {} ({}: {})", c->connection_id,
                             to_string(c->from), to_string(c->to),
                             to_string(c->error.kind), c->error.reason);
        }
        return fmt::format("ssh {} {} -> {}", c->connection_id,
                           to_string(c->from), to_string(c->to));
      }
      break;
    case EventType::OutputReceived:
      if(auto o = event.as<OutputEvent>()) {
        return fmt::format("ssh {} {}: {}", o->connection_id,
                           o->chunk.stream == OutputStream::Stdout ? "out" : "err",
                           o->chunk.data);
      }
      break;
  }
  return to_string(event.type);
}
