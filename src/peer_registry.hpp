#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "event_bus.hpp"
#include "log.hpp"
#include "peer.hpp"

struct RegistryConfig {
  std::chrono::milliseconds heartbeat{5000};
  int offline_missed_intervals = 3;
  std::chrono::milliseconds eviction_grace{60000};
  std::size_t max_addresses = 4;

  // half an interval of slack so a beacon that arrives a little late does not flap the state
  std::chrono::milliseconds stale_after() const { return heartbeat + heartbeat / 2; }
  std::chrono::milliseconds offline_after() const { return heartbeat * offline_missed_intervals; }
  std::chrono::milliseconds evict_after() const { return offline_after() + eviction_grace; }
};

// Authoritative set of known peers. All mutation happens under one writer
// mutex; readers take the published snapshot and never block writers.
class PeerRegistry {
public:
  using Clock = std::chrono::steady_clock;
  using PeerList = std::vector<Peer>;

  PeerRegistry(RegistryConfig config,
               std::shared_ptr<EventBus> bus,
               std::shared_ptr<Logger> logger = nullptr);

  // Insert or refresh a peer. The address moves to the front of the list.
  void upsert(const PeerId& id,
              const PeerAddress& address,
              const std::string& display_name,
              Clock::time_point now);

  // Liveness refresh without address information. Returns false for
  // unknown peers.
  bool touch(const PeerId& id, Clock::time_point now);

  void mark_sweep(Clock::time_point now);

  std::shared_ptr<const PeerList> snapshot() const;
  std::optional<Peer> find(const PeerId& id) const;
  std::optional<PeerAddress> best_address(const PeerId& id) const;
  std::size_t size() const;

  const RegistryConfig& config() const { return config_; }

private:
  void publish_snapshot_locked();
  void emit(std::vector<Event>& events);

  RegistryConfig config_;
  std::shared_ptr<EventBus> bus_;
  std::shared_ptr<Logger> logger_;

  std::mutex write_mutex_;
  std::unordered_map<PeerId, Peer, UidHash> peers_;
  // read through std::atomic_load
  std::shared_ptr<const PeerList> snapshot_;
};
