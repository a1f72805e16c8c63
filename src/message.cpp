#include "message.hpp"

const char* to_string(MessageKind kind) {
  switch(kind) {
    case MessageKind::Broadcast: return "broadcast";
    case MessageKind::Private: return "private";
    case MessageKind::Group: return "group";
    case MessageKind::GroupControl: return "group-control";
  }
  return "unknown";
}

bool is_valid_kind(uint8_t raw) {
  return raw >= static_cast<uint8_t>(MessageKind::Broadcast) &&
         raw <= static_cast<uint8_t>(MessageKind::GroupControl);
}

bool kind_has_target(MessageKind kind) {
  return kind != MessageKind::Broadcast;
}

bool Message::has_valid_target() const {
  switch(kind) {
    case MessageKind::Broadcast:
      return !recipient_id && !group_id;
    case MessageKind::Private:
      return recipient_id && !group_id;
    case MessageKind::Group:
    case MessageKind::GroupControl:
      return group_id && !recipient_id;
  }
  return false;
}

std::optional<Uid> Message::target() const {
  if(recipient_id) return recipient_id;
  if(group_id) return group_id;
  return std::nullopt;
}

bool same_wire_fields(const Message& a, const Message& b) {
  return a.id == b.id &&
         a.kind == b.kind &&
         a.sender_id == b.sender_id &&
         a.recipient_id == b.recipient_id &&
         a.group_id == b.group_id &&
         a.content == b.content &&
         a.timestamp_ms == b.timestamp_ms;
}
