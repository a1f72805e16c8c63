#include "message_router.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace {

// Generous allowance for the fixed part of a message body.
constexpr std::size_t kMaxContentSize = kMaxFrameSize - 128;

} // namespace

MessageRouter::MessageRouter(MessageTransport& transport,
                             PeerRegistry& registry,
                             std::shared_ptr<EventBus> bus,
                             PeerId local_id,
                             RouterConfig config,
                             std::shared_ptr<Logger> logger)
  : transport_(transport),
    registry_(registry),
    bus_(std::move(bus)),
    local_id_(local_id),
    config_(config),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("router")),
    dedup_(config.dedup_capacity, config.dedup_window) {
  if(config_.history_limit == 0) config_.history_limit = 1;
  if(config_.max_conversations == 0) config_.max_conversations = 1;
}

Message MessageRouter::make_message(MessageKind kind, std::string content) const {
  Message m;
  m.id = random_uid();
  m.kind = kind;
  m.sender_id = local_id_;
  m.content = std::move(content);
  m.timestamp_ms = epoch_millis_now();
  m.read = true;
  return m;
}

ConversationKey MessageRouter::conversation_for(const Message& message, const PeerId& local_id) {
  switch(message.kind) {
    case MessageKind::Private:
      if(message.sender_id == local_id && message.recipient_id) {
        return ConversationKey::with_peer(*message.recipient_id);
      }
      return ConversationKey::with_peer(message.sender_id);
    case MessageKind::Group:
    case MessageKind::GroupControl:
      return ConversationKey::in_group(message.group_id.value_or(GroupId{}));
    case MessageKind::Broadcast:
      break;
  }
  return ConversationKey::broadcast();
}

Message MessageRouter::send(MessageKind kind,
                            std::string content,
                            std::optional<PeerId> recipient,
                            std::optional<GroupId> group,
                            DeliveryCallback callback) {
  if(kind == MessageKind::GroupControl) {
    throw std::invalid_argument("group control messages are generated internally");
  }
  auto message = make_message(kind, std::move(content));
  message.recipient_id = recipient;
  message.group_id = group;
  if(!message.has_valid_target()) {
    throw std::invalid_argument(std::string("invalid target for ") + to_string(kind) + " message");
  }
  if(message.content.size() > kMaxContentSize) {
    throw std::invalid_argument("message content too large");
  }

  switch(kind) {
    case MessageKind::Broadcast: {
      auto datagram = encode_message_datagram(message);
      if(datagram.size() > kMaxDatagramSize) {
        throw std::invalid_argument("broadcast does not fit in one datagram");
      }
      message.delivered = true;
      record(ConversationKey::broadcast(), message);
      {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.sent;
      }
      transport_.send_datagram(std::move(datagram));
      if(callback) callback(message.id, PeerId{}, TransportError::None);
      break;
    }
    case MessageKind::Private: {
      if(*recipient == local_id_) {
        throw std::invalid_argument("cannot send a private message to the local peer");
      }
      record(ConversationKey::with_peer(*recipient), message);
      send_to_peer(message, *recipient, std::move(callback));
      break;
    }
    case MessageKind::Group: {
      auto g = groups_.group(*group);
      if(!g) {
        throw std::invalid_argument("unknown group " + short_hex(*group));
      }
      record(ConversationKey::in_group(*group), message);
      for(const auto& member : g->members) {
        if(member == local_id_) continue;
        send_to_peer(message, member, callback);
      }
      break;
    }
    case MessageKind::GroupControl:
      break;
  }
  return message;
}

void MessageRouter::send_to_peer(const Message& message, const PeerId& peer, DeliveryCallback callback) {
  auto address = registry_.best_address(peer);
  if(!address) {
    report_failure(message.id, peer, TransportError::Unreachable, callback);
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.sent;
  }
  auto key = conversation_for(message, local_id_);
  auto id = message.id;
  auto result = transport_.send_reliable(*address, encode_frame(message),
    [this, key, id, peer, callback](TransportError error){
      if(error == TransportError::None) {
        mark_delivered(key, id);
        if(callback) callback(id, peer, TransportError::None);
      } else {
        report_failure(id, peer, error, callback);
      }
    });
  if(result != TransportError::None) {
    report_failure(id, peer, result, callback);
  }
}

void MessageRouter::report_failure(const MessageId& id, const PeerId& peer,
                                   TransportError reason, const DeliveryCallback& callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.send_failures;
  }
  logger_->warn("message {} to {} failed: {}", short_hex(id), short_hex(peer), to_string(reason));
  if(bus_) {
    SendFailedEvent payload;
    payload.message_id = id;
    payload.peer_id = peer;
    payload.reason = reason;
    bus_->publish(make_event(EventType::MessageSendFailed, payload));
  }
  if(callback) callback(id, peer, reason);
}

void MessageRouter::handle_frame(const uint8_t* body, std::size_t size, const PeerAddress& from) {
  Message message;
  auto status = decode_message_body(body, size, message);
  if(status != DecodeStatus::Ok) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.malformed;
    }
    logger_->warn("dropping frame from {}: {}", from.to_string(), to_string(status));
    return;
  }
  handle_inbound(std::move(message), from, false);
}

void MessageRouter::handle_datagram(const uint8_t* body, std::size_t size, const PeerAddress& from) {
  Message message;
  auto status = decode_message_body(body, size, message);
  if(status != DecodeStatus::Ok || message.kind != MessageKind::Broadcast) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.malformed;
    }
    logger_->debug("dropping datagram message from {}: {}", from.to_string(),
                   status == DecodeStatus::Ok ? "not a broadcast" : to_string(status));
    return;
  }
  handle_inbound(std::move(message), from, true);
}

void MessageRouter::handle_inbound(Message message, const PeerAddress& from, bool via_multicast) {
  if(message.sender_id == local_id_) return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!dedup_.check_and_insert(message.id, DedupCache::Clock::now())) {
      ++stats_.duplicates;
      logger_->debug("duplicate message {} from {}", short_hex(message.id), from.to_string());
      return;
    }
    ++stats_.received;
  }

  registry_.touch(message.sender_id, PeerRegistry::Clock::now());
  if(auto peer = registry_.find(message.sender_id)) {
    message.sender_name = peer->display_name;
  }

  switch(message.kind) {
    case MessageKind::Private:
      if(*message.recipient_id != local_id_) {
        logger_->debug("private message {} for {} is not ours", short_hex(message.id),
                       short_hex(*message.recipient_id));
        return;
      }
      break;
    case MessageKind::GroupControl:
      apply_group_control(message);
      return;
    case MessageKind::Group: {
      auto g = groups_.group(*message.group_id);
      if(!g || !g->has_member(message.sender_id)) {
        {
          std::lock_guard<std::mutex> lock(mutex_);
          ++stats_.rejected;
        }
        logger_->debug("dropping group message {} from {}: {}", short_hex(message.id),
                       short_hex(message.sender_id),
                       g ? "sender is not a member" : "unknown group " + short_hex(*message.group_id));
        return;
      }
      break;
    }
    case MessageKind::Broadcast:
      break;
  }

  logger_->debug("{} message {} from {} via {}", to_string(message.kind), short_hex(message.id),
                 from.to_string(), via_multicast ? "multicast" : "tcp");
  message.delivered = true;
  message.read = false;
  record(conversation_for(message, local_id_), message);
  if(bus_) bus_->publish(make_event(EventType::MessageReceived, MessageEvent{message}));
}

void MessageRouter::apply_group_control(const Message& message) {
  std::string error;
  auto control = parse_group_control(message.content, error);
  if(!control) {
    logger_->warn("bad group control from {}: {}", short_hex(message.sender_id), error);
    return;
  }
  if(control->group_id != *message.group_id) {
    logger_->warn("group control from {} names a different group", short_hex(message.sender_id));
    return;
  }
  auto added = groups_.merge(*control);
  if(added) {
    auto g = groups_.group(control->group_id);
    logger_->info("group '{}' ({}) updated by {}, {} member(s)", g->name, short_hex(g->id),
                  message.sender_name.empty() ? short_hex(message.sender_id) : message.sender_name,
                  g->members.size());
  }
}

MembershipEvent MessageRouter::next_event(const GroupId& group, MembershipOp op, const PeerId& member) const {
  MembershipEvent e;
  e.event_id = random_uid();
  e.op = op;
  e.member = member;
  e.origin = local_id_;
  e.timestamp_ms = epoch_millis_now();
  // stay after everything this replica already applied
  for(const auto& existing : groups_.log(group)) {
    e.timestamp_ms = std::max(e.timestamp_ms, existing.timestamp_ms + 1);
  }
  return e;
}

Group MessageRouter::create_group(const std::string& name, const std::vector<PeerId>& members) {
  auto id = random_uid();
  groups_.ensure_group(id, name, epoch_millis_now());
  std::set<PeerId> unique(members.begin(), members.end());
  unique.insert(local_id_);
  for(const auto& member : unique) {
    if(is_nil(member)) continue;
    groups_.append(id, next_event(id, MembershipOp::Add, member));
  }
  logger_->info("created group '{}' ({}) with {} member(s)", name, short_hex(id), unique.size());
  announce_group(id);
  return *groups_.group(id);
}

bool MessageRouter::add_group_member(const GroupId& group, const PeerId& peer) {
  auto g = groups_.group(group);
  if(!g || g->has_member(peer) || is_nil(peer)) return false;
  groups_.append(group, next_event(group, MembershipOp::Add, peer));
  announce_group(group);
  return true;
}

bool MessageRouter::remove_group_member(const GroupId& group, const PeerId& peer) {
  auto g = groups_.group(group);
  if(!g || !g->has_member(peer)) return false;
  groups_.append(group, next_event(group, MembershipOp::Remove, peer));
  announce_group(group, {peer});
  return true;
}

bool MessageRouter::delete_group(const GroupId& group) {
  if(!groups_.remove_group(group)) return false;
  clear_history(ConversationKey::in_group(group));
  return true;
}

void MessageRouter::announce_group(const GroupId& group, std::vector<PeerId> extra_targets) {
  auto control = groups_.control(group);
  auto g = groups_.group(group);
  if(!control || !g) return;
  auto message = make_message(MessageKind::GroupControl, to_json(*control).dump());
  message.group_id = group;
  std::set<PeerId> targets(g->members.begin(), g->members.end());
  targets.insert(extra_targets.begin(), extra_targets.end());
  for(const auto& peer : targets) {
    if(peer == local_id_) continue;
    send_to_peer(message, peer, nullptr);
  }
}

void MessageRouter::record(const ConversationKey& key, const Message& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(key.kind != ConversationKind::Broadcast && history_.find(key) == history_.end()) {
    evict_idle_conversation_locked();
  }
  auto& q = history_[key];
  q.push_back(message);
  while(q.size() > config_.history_limit) q.pop_front();
  last_activity_[key] = ++activity_counter_;
}

void MessageRouter::evict_idle_conversation_locked() {
  std::size_t kept = 0;
  auto oldest = last_activity_.end();
  for(auto it = last_activity_.begin(); it != last_activity_.end(); ++it) {
    if(it->first.kind == ConversationKind::Broadcast) continue;
    ++kept;
    if(oldest == last_activity_.end() || it->second < oldest->second) oldest = it;
  }
  if(kept < config_.max_conversations || oldest == last_activity_.end()) return;
  logger_->debug("dropping history of idle {} conversation {}",
                 oldest->first.kind == ConversationKind::Group ? "group" : "private",
                 short_hex(oldest->first.id));
  history_.erase(oldest->first);
  last_activity_.erase(oldest);
}

void MessageRouter::mark_delivered(const ConversationKey& key, const MessageId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = history_.find(key);
  if(it == history_.end()) return;
  for(auto& m : it->second) {
    if(m.id == id) {
      m.delivered = true;
      return;
    }
  }
}

std::vector<Message> MessageRouter::history(const ConversationKey& key, std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = history_.find(key);
  if(it == history_.end()) return {};
  const auto& q = it->second;
  auto start = (limit == 0 || limit >= q.size()) ? q.begin() : q.end() - static_cast<std::ptrdiff_t>(limit);
  return std::vector<Message>(start, q.end());
}

std::vector<ConversationKey> MessageRouter::conversations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConversationKey> out;
  for(const auto& [key, q] : history_) {
    if(!q.empty()) out.push_back(key);
  }
  return out;
}

void MessageRouter::clear_history(const ConversationKey& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  history_.erase(key);
  last_activity_.erase(key);
}

void MessageRouter::clear_all_history() {
  std::lock_guard<std::mutex> lock(mutex_);
  history_.clear();
  last_activity_.clear();
}

bool MessageRouter::mark_read(const MessageId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for(auto& [key, q] : history_) {
    for(auto& m : q) {
      if(m.id == id) {
        m.read = true;
        return true;
      }
    }
  }
  return false;
}

std::size_t MessageRouter::unread_count(const ConversationKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = history_.find(key);
  if(it == history_.end()) return 0;
  return static_cast<std::size_t>(std::count_if(it->second.begin(), it->second.end(),
    [](const Message& m){ return !m.read; }));
}

MessageRouter::Stats MessageRouter::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}
