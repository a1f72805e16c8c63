#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "utils.hpp"

enum class MessageKind : uint8_t {
  Broadcast = 1,
  Private = 2,
  Group = 3,
  // membership events for a group; content is a JSON document
  GroupControl = 4
};

const char* to_string(MessageKind kind);
bool is_valid_kind(uint8_t raw);
bool kind_has_target(MessageKind kind);

struct Message {
  MessageId id{};
  MessageKind kind = MessageKind::Broadcast;
  PeerId sender_id{};
  std::optional<PeerId> recipient_id;
  std::optional<GroupId> group_id;
  std::string content;
  int64_t timestamp_ms = 0; // sender-local wall clock

  // local bookkeeping, never on the wire
  std::string sender_name;
  bool delivered = false;
  bool read = false;

  // exactly one of recipient/group for targeted kinds, none for broadcast
  bool has_valid_target() const;
  // recipient or group id, whichever the kind uses
  std::optional<Uid> target() const;
};

bool same_wire_fields(const Message& a, const Message& b);
