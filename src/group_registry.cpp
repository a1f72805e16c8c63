#include "group_registry.hpp"

#include <algorithm>

using json = nlohmann::json;

nlohmann::json to_json(const GroupControl& control) {
  json events = json::array();
  for(const auto& e : control.events) {
    events.push_back({
      {"id", to_hex(e.event_id)},
      {"op", e.op == MembershipOp::Add ? "add" : "remove"},
      {"member", to_hex(e.member)},
      {"ts", e.timestamp_ms},
      {"origin", to_hex(e.origin)}
    });
  }
  return json{
    {"group", to_hex(control.group_id)},
    {"name", control.name},
    {"created_at", control.created_at_ms},
    {"events", events}
  };
}

std::optional<GroupControl> parse_group_control(const std::string& text, std::string& error) {
  try {
    auto doc = json::parse(text);
    GroupControl out;
    auto group = uid_from_hex(doc.at("group").get<std::string>());
    if(!group || is_nil(*group)) {
      error = "bad group id";
      return std::nullopt;
    }
    out.group_id = *group;
    out.name = doc.value("name", "");
    out.created_at_ms = doc.value("created_at", int64_t{0});
    for(const auto& item : doc.at("events")) {
      MembershipEvent e;
      auto id = uid_from_hex(item.at("id").get<std::string>());
      auto member = uid_from_hex(item.at("member").get<std::string>());
      auto origin = uid_from_hex(item.value("origin", std::string(32, '0')));
      auto op = item.at("op").get<std::string>();
      if(!id || !member || !origin || (op != "add" && op != "remove")) {
        error = "bad membership event";
        return std::nullopt;
      }
      e.event_id = *id;
      e.member = *member;
      e.origin = *origin;
      e.op = op == "add" ? MembershipOp::Add : MembershipOp::Remove;
      e.timestamp_ms = item.at("ts").get<int64_t>();
      out.events.push_back(e);
    }
    return out;
  } catch(const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

bool GroupRegistry::ensure_group(const GroupId& id, const std::string& name, int64_t created_at_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(groups_.count(id)) return false;
  Entry entry;
  entry.group.id = id;
  entry.group.name = name;
  entry.group.created_at_ms = created_at_ms;
  groups_.emplace(id, std::move(entry));
  return true;
}

bool GroupRegistry::append(const GroupId& id, const MembershipEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(id);
  if(it == groups_.end()) return false;
  if(!append_locked(it->second, event)) return false;
  replay(it->second);
  return true;
}

std::size_t GroupRegistry::merge(const GroupControl& control) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(control.group_id);
  if(it == groups_.end()) {
    Entry entry;
    entry.group.id = control.group_id;
    entry.group.name = control.name;
    entry.group.created_at_ms = control.created_at_ms;
    it = groups_.emplace(control.group_id, std::move(entry)).first;
  } else if(it->second.group.name.empty()) {
    it->second.group.name = control.name;
  }
  std::size_t added = 0;
  for(const auto& e : control.events) {
    if(append_locked(it->second, e)) ++added;
  }
  if(added) replay(it->second);
  return added;
}

bool GroupRegistry::remove_group(const GroupId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return groups_.erase(id) != 0;
}

std::optional<Group> GroupRegistry::group(const GroupId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(id);
  if(it == groups_.end()) return std::nullopt;
  return it->second.group;
}

std::vector<Group> GroupRegistry::groups() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Group> out;
  out.reserve(groups_.size());
  for(const auto& [id, entry] : groups_) out.push_back(entry.group);
  return out;
}

std::vector<MembershipEvent> GroupRegistry::log(const GroupId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(id);
  if(it == groups_.end()) return {};
  return it->second.log;
}

std::optional<GroupControl> GroupRegistry::control(const GroupId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(id);
  if(it == groups_.end()) return std::nullopt;
  GroupControl out;
  out.group_id = id;
  out.name = it->second.group.name;
  out.created_at_ms = it->second.group.created_at_ms;
  out.events = it->second.log;
  return out;
}

bool GroupRegistry::append_locked(Entry& entry, const MembershipEvent& event) {
  if(!entry.event_ids.insert(event.event_id).second) return false;
  auto pos = std::upper_bound(entry.log.begin(), entry.log.end(), event,
    [](const MembershipEvent& a, const MembershipEvent& b){
      if(a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms < b.timestamp_ms;
      return a.event_id < b.event_id;
    });
  entry.log.insert(pos, event);
  return true;
}

void GroupRegistry::replay(Entry& entry) {
  std::set<PeerId> members;
  for(const auto& e : entry.log) {
    if(e.op == MembershipOp::Add) members.insert(e.member);
    else members.erase(e.member);
  }
  entry.group.members = std::move(members);
}
