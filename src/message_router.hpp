#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "dedup_cache.hpp"
#include "event_bus.hpp"
#include "group_registry.hpp"
#include "log.hpp"
#include "message.hpp"
#include "peer_registry.hpp"
#include "transport.hpp"

struct RouterConfig {
  std::size_t dedup_capacity = 10000;
  std::chrono::milliseconds dedup_window{300000};
  std::size_t history_limit = 1000;
  // Private and group conversations kept; the least recently active one is
  // dropped to make room. The broadcast conversation is never evicted.
  std::size_t max_conversations = 256;
};

enum class ConversationKind : uint8_t { Broadcast, Private, Group };

struct ConversationKey {
  ConversationKind kind = ConversationKind::Broadcast;
  // peer id for Private, group id for Group, nil for Broadcast
  Uid id{};

  static ConversationKey broadcast() { return {}; }
  static ConversationKey with_peer(const PeerId& peer) { return {ConversationKind::Private, peer}; }
  static ConversationKey in_group(const GroupId& group) { return {ConversationKind::Group, group}; }

  bool operator<(const ConversationKey& other) const {
    if(kind != other.kind) return kind < other.kind;
    return id < other.id;
  }
};

// Reports the outcome for one target of a send. peer is nil for broadcasts.
using DeliveryCallback = std::function<void(const MessageId& message,
                                            const PeerId& peer,
                                            TransportError result)>;

class MessageRouter {
public:
  MessageRouter(MessageTransport& transport,
                PeerRegistry& registry,
                std::shared_ptr<EventBus> bus,
                PeerId local_id,
                RouterConfig config,
                std::shared_ptr<Logger> logger = nullptr);

  // Builds a message with a fresh id and hands it to the transport. Throws
  // std::invalid_argument when the kind and targets do not match or the
  // group is unknown. Delivery failures are reported through
  // MessageSendFailed events and the callback, never thrown.
  Message send(MessageKind kind,
               std::string content,
               std::optional<PeerId> recipient = std::nullopt,
               std::optional<GroupId> group = std::nullopt,
               DeliveryCallback callback = nullptr);

  Message broadcast(std::string content) {
    return send(MessageKind::Broadcast, std::move(content));
  }
  Message send_private(const PeerId& peer, std::string content, DeliveryCallback callback = nullptr) {
    return send(MessageKind::Private, std::move(content), peer, std::nullopt, std::move(callback));
  }
  Message send_group(const GroupId& group, std::string content, DeliveryCallback callback = nullptr) {
    return send(MessageKind::Group, std::move(content), std::nullopt, group, std::move(callback));
  }

  // Group membership. The local identity is always a member of groups it
  // creates. Changes are announced to every affected member.
  Group create_group(const std::string& name, const std::vector<PeerId>& members);
  bool add_group_member(const GroupId& group, const PeerId& peer);
  bool remove_group_member(const GroupId& group, const PeerId& peer);
  bool delete_group(const GroupId& group);
  std::vector<Group> groups() const { return groups_.groups(); }
  std::optional<Group> group(const GroupId& id) const { return groups_.group(id); }

  // Inbound paths, called by the transport handlers.
  void handle_frame(const uint8_t* body, std::size_t size, const PeerAddress& from);
  void handle_datagram(const uint8_t* body, std::size_t size, const PeerAddress& from);

  // Newest last; limit 0 returns everything retained.
  std::vector<Message> history(const ConversationKey& key, std::size_t limit = 0) const;
  std::vector<ConversationKey> conversations() const;
  void clear_history(const ConversationKey& key);
  void clear_all_history();
  bool mark_read(const MessageId& id);
  std::size_t unread_count(const ConversationKey& key) const;

  const PeerId& local_id() const { return local_id_; }

  struct Stats {
    uint64_t sent = 0;
    uint64_t received = 0;
    uint64_t duplicates = 0;
    uint64_t malformed = 0;
    uint64_t send_failures = 0;
    // group messages for groups we do not know or from non-members
    uint64_t rejected = 0;
  };
  Stats stats() const;

private:
  void handle_inbound(Message message, const PeerAddress& from, bool via_multicast);
  void apply_group_control(const Message& message);
  void announce_group(const GroupId& group, std::vector<PeerId> extra_targets = {});
  void send_to_peer(const Message& message, const PeerId& peer, DeliveryCallback callback);
  void report_failure(const MessageId& id, const PeerId& peer,
                      TransportError reason, const DeliveryCallback& callback);
  MembershipEvent next_event(const GroupId& group, MembershipOp op, const PeerId& member) const;
  void record(const ConversationKey& key, const Message& message);
  void evict_idle_conversation_locked();
  void mark_delivered(const ConversationKey& key, const MessageId& id);
  Message make_message(MessageKind kind, std::string content) const;
  static ConversationKey conversation_for(const Message& message, const PeerId& local_id);

  MessageTransport& transport_;
  PeerRegistry& registry_;
  std::shared_ptr<EventBus> bus_;
  const PeerId local_id_;
  RouterConfig config_;
  std::shared_ptr<Logger> logger_;

  GroupRegistry groups_;

  mutable std::mutex mutex_;
  DedupCache dedup_;
  std::map<ConversationKey, std::deque<Message>> history_;
  std::map<ConversationKey, uint64_t> last_activity_;
  uint64_t activity_counter_ = 0;
  Stats stats_;
};
