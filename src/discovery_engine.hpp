#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "log.hpp"
#include "peer_registry.hpp"
#include "transport.hpp"

struct DiscoveryConfig {
  std::chrono::milliseconds heartbeat{5000};
};

// Announces the local identity on the multicast channel and feeds received
// beacons into the registry. Also drives the registry liveness sweep.
class DiscoveryEngine {
public:
  DiscoveryEngine(asio::io_context& io,
                  MessageTransport& transport,
                  PeerRegistry& registry,
                  PeerId local_id,
                  std::string display_name,
                  DiscoveryConfig config,
                  std::shared_ptr<Logger> logger = nullptr);
  ~DiscoveryEngine();

  // start/stop run on the io thread or before it runs.
  void start();
  void stop();
  bool running() const { return running_; }

  void announce();
  void set_display_name(std::string name);
  std::string display_name() const;

  void handle_beacon(const uint8_t* body, std::size_t size, const PeerAddress& from);

  const PeerId& local_id() const { return local_id_; }
  uint64_t beacons_sent() const { return beacons_sent_; }
  uint64_t beacons_accepted() const { return beacons_accepted_; }

private:
  void schedule_beacon();
  void schedule_sweep();

  asio::io_context& io_;
  MessageTransport& transport_;
  PeerRegistry& registry_;
  const PeerId local_id_;
  DiscoveryConfig config_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex name_mutex_;
  std::string display_name_;

  asio::steady_timer beacon_timer_;
  asio::steady_timer sweep_timer_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> beacons_sent_{0};
  std::atomic<uint64_t> beacons_accepted_{0};
};
