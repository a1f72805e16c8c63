#include "peer_registry.hpp"

#include <algorithm>

const char* to_string(PeerState state) {
  switch(state) {
    case PeerState::Online: return "online";
    case PeerState::Stale: return "stale";
    case PeerState::Offline: return "offline";
  }
  return "unknown";
}

namespace {

Event peer_event(EventType type, const Peer& peer, PeerState previous = PeerState::Online) {
  PeerEvent payload;
  payload.peer = peer;
  payload.previous_state = previous;
  return make_event(type, std::move(payload));
}

} // namespace

PeerRegistry::PeerRegistry(RegistryConfig config,
                           std::shared_ptr<EventBus> bus,
                           std::shared_ptr<Logger> logger)
  : config_(config),
    bus_(std::move(bus)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("registry")),
    snapshot_(std::make_shared<const PeerList>()) {
  if(config_.offline_missed_intervals < 1) config_.offline_missed_intervals = 1;
  if(config_.max_addresses == 0) config_.max_addresses = 1;
}

void PeerRegistry::upsert(const PeerId& id,
                          const PeerAddress& address,
                          const std::string& display_name,
                          Clock::time_point now) {
  std::vector<Event> events;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto it = peers_.find(id);
    if(it == peers_.end()) {
      Peer peer;
      peer.id = id;
      peer.display_name = display_name;
      peer.addresses.push_back(address);
      peer.last_seen = now;
      peer.state = PeerState::Online;
      logger_->info("new peer {} ({}) at {}", display_name, short_hex(id), address.to_string());
      events.push_back(peer_event(EventType::PeerAdded, peer));
      peers_.emplace(id, std::move(peer));
    } else {
      auto& peer = it->second;
      bool changed = false;
      if(peer.display_name != display_name) {
        logger_->warn("peer {} renamed '{}' -> '{}'", short_hex(id), peer.display_name, display_name);
        peer.display_name = display_name;
        changed = true;
      }
      auto pos = std::find(peer.addresses.begin(), peer.addresses.end(), address);
      if(pos != peer.addresses.begin()) {
        if(pos != peer.addresses.end()) peer.addresses.erase(pos);
        peer.addresses.insert(peer.addresses.begin(), address);
        if(peer.addresses.size() > config_.max_addresses) {
          peer.addresses.resize(config_.max_addresses);
        }
        changed = true;
      }
      peer.last_seen = now;
      if(changed) events.push_back(peer_event(EventType::PeerUpdated, peer));
      if(peer.state != PeerState::Online) {
        auto previous = peer.state;
        peer.state = PeerState::Online;
        logger_->info("peer {} ({}) back online", peer.display_name, short_hex(id));
        events.push_back(peer_event(EventType::PeerStateChanged, peer, previous));
      }
    }
    publish_snapshot_locked();
  }
  emit(events);
}

bool PeerRegistry::touch(const PeerId& id, Clock::time_point now) {
  std::vector<Event> events;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto it = peers_.find(id);
    if(it == peers_.end()) return false;
    auto& peer = it->second;
    peer.last_seen = now;
    if(peer.state != PeerState::Online) {
      auto previous = peer.state;
      peer.state = PeerState::Online;
      events.push_back(peer_event(EventType::PeerStateChanged, peer, previous));
    }
    publish_snapshot_locked();
  }
  emit(events);
  return true;
}

void PeerRegistry::mark_sweep(Clock::time_point now) {
  std::vector<Event> events;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    bool mutated = false;
    for(auto it = peers_.begin(); it != peers_.end();) {
      auto& peer = it->second;
      auto elapsed = now - peer.last_seen;
      if(elapsed >= config_.evict_after()) {
        logger_->info("evicting peer {} ({})", peer.display_name, short_hex(peer.id));
        events.push_back(peer_event(EventType::PeerRemoved, peer, peer.state));
        it = peers_.erase(it);
        mutated = true;
        continue;
      }
      auto next = peer.state;
      if(elapsed >= config_.offline_after()) {
        next = PeerState::Offline;
      } else if(elapsed > config_.stale_after()) {
        next = PeerState::Stale;
      }
      if(next != peer.state) {
        auto previous = peer.state;
        peer.state = next;
        logger_->debug("peer {} ({}) {} -> {}", peer.display_name, short_hex(peer.id),
                       to_string(previous), to_string(next));
        events.push_back(peer_event(EventType::PeerStateChanged, peer, previous));
        mutated = true;
      }
      ++it;
    }
    if(mutated) publish_snapshot_locked();
  }
  emit(events);
}

std::shared_ptr<const PeerRegistry::PeerList> PeerRegistry::snapshot() const {
  return std::atomic_load(&snapshot_);
}

std::optional<Peer> PeerRegistry::find(const PeerId& id) const {
  auto list = snapshot();
  auto it = std::find_if(list->begin(), list->end(), [&](const Peer& p){ return p.id == id; });
  if(it == list->end()) return std::nullopt;
  return *it;
}

std::optional<PeerAddress> PeerRegistry::best_address(const PeerId& id) const {
  auto peer = find(id);
  if(!peer) return std::nullopt;
  auto addr = peer->best_address();
  if(!addr) return std::nullopt;
  return *addr;
}

std::size_t PeerRegistry::size() const {
  return snapshot()->size();
}

void PeerRegistry::publish_snapshot_locked() {
  auto list = std::make_shared<PeerList>();
  list->reserve(peers_.size());
  for(const auto& [id, peer] : peers_) list->push_back(peer);
  std::sort(list->begin(), list->end(), [](const Peer& a, const Peer& b){
    if(a.display_name != b.display_name) return a.display_name < b.display_name;
    return a.id < b.id;
  });
  std::atomic_store(&snapshot_, std::shared_ptr<const PeerList>(std::move(list)));
}

void PeerRegistry::emit(std::vector<Event>& events) {
  if(!bus_) return;
  for(auto& e : events) bus_->publish(e);
}
