#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "utils.hpp"

struct PeerAddress {
  std::string ip;
  uint16_t port = 0;

  bool operator==(const PeerAddress& other) const { return port == other.port && ip == other.ip; }
  bool operator!=(const PeerAddress& other) const { return !(*this == other); }
  std::string to_string() const { return ip + ":" + std::to_string(port); }
};

enum class PeerState { Online, Stale, Offline };

const char* to_string(PeerState state);

struct Peer {
  PeerId id{};
  std::string display_name;
  std::vector<PeerAddress> addresses; // most recently confirmed first
  std::chrono::steady_clock::time_point last_seen{};
  PeerState state = PeerState::Online;

  const PeerAddress* best_address() const {
    return addresses.empty() ? nullptr : &addresses.front();
  }
};
