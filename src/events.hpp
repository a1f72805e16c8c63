#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "message.hpp"
#include "peer.hpp"
#include "ssh_types.hpp"
#include "transport_error.hpp"

enum class EventType : uint8_t {
  PeerAdded,
  PeerUpdated,
  PeerStateChanged,
  PeerRemoved,
  MessageReceived,
  MessageSendFailed,
  ConnectionStateChanged,
  OutputReceived
};

const char* to_string(EventType type);

struct PeerEvent {
  Peer peer;
  // only meaningful for PeerStateChanged
  PeerState previous_state = PeerState::Online;
};

struct MessageEvent {
  Message message;
};

struct SendFailedEvent {
  MessageId message_id{};
  PeerId peer_id{};
  TransportError reason = TransportError::None;
};

struct ConnectionStateEvent {
  std::string connection_id;
  SshState from = SshState::Idle;
  SshState to = SshState::Idle;
  SshError error;
};

struct OutputEvent {
  std::string connection_id;
  OutputChunk chunk;
};

using EventPayload = std::variant<PeerEvent,
                                  MessageEvent,
                                  SendFailedEvent,
                                  ConnectionStateEvent,
                                  OutputEvent>;

struct Event {
  EventType type = EventType::PeerAdded;
  std::chrono::steady_clock::time_point at = std::chrono::steady_clock::now();
  EventPayload payload;

  template<typename T>
  const T* as() const { return std::get_if<T>(&payload); }
};

inline Event make_event(EventType type, EventPayload payload) {
  Event e;
  e.type = type;
  e.payload = std::move(payload);
  return e;
}

// One-line human readable summary, used by the console and debug logs.
std::string describe(const Event& event);
