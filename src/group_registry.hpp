#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils.hpp"

enum class MembershipOp : uint8_t { Add, Remove };

struct MembershipEvent {
  Uid event_id{};
  MembershipOp op = MembershipOp::Add;
  PeerId member{};
  int64_t timestamp_ms = 0;
  PeerId origin{};
};

struct Group {
  GroupId id{};
  std::string name;
  std::set<PeerId> members;
  int64_t created_at_ms = 0;

  bool has_member(const PeerId& peer) const { return members.count(peer) != 0; }
};

// Control document carried by GroupControl messages: group identity plus
// the membership log known to the sender.
struct GroupControl {
  GroupId group_id{};
  std::string name;
  int64_t created_at_ms = 0;
  std::vector<MembershipEvent> events;
};

nlohmann::json to_json(const GroupControl& control);
// Returns nullopt (and fills error) for documents that do not describe a group.
std::optional<GroupControl> parse_group_control(const std::string& text, std::string& error);

// Groups keyed by id. Membership is never stored directly; it is the
// replay of the append-only event log ordered by (timestamp, event id), so
// every replica that saw the same events agrees regardless of arrival order.
class GroupRegistry {
public:
  // Creates the group if unknown. Returns false when it already existed.
  bool ensure_group(const GroupId& id, const std::string& name, int64_t created_at_ms);
  // Returns false for unknown groups and already-applied events.
  bool append(const GroupId& id, const MembershipEvent& event);
  // ensure_group plus append for every event; returns the count of new events.
  std::size_t merge(const GroupControl& control);
  bool remove_group(const GroupId& id);

  std::optional<Group> group(const GroupId& id) const;
  std::vector<Group> groups() const;
  std::vector<MembershipEvent> log(const GroupId& id) const;
  std::optional<GroupControl> control(const GroupId& id) const;

private:
  struct Entry {
    Group group;
    std::vector<MembershipEvent> log;
    std::set<Uid> event_ids;
  };

  bool append_locked(Entry& entry, const MembershipEvent& event);
  static void replay(Entry& entry);

  mutable std::mutex mutex_;
  std::map<GroupId, Entry> groups_;
};
