#include "discovery_engine.hpp"
#include "event_bus.hpp"
#include "peer_registry.hpp"
#include "recording_transport.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <chrono>
#include <vector>

using namespace ztalk::test;
using namespace std::chrono_literals;

namespace {

RegistryConfig fast_config() {
  RegistryConfig config;
  config.heartbeat = 100ms;
  config.offline_missed_intervals = 3;
  config.eviction_grace = 500ms;
  return config;
}

Bytes beacon_body(const PeerId& id, const std::string& name, uint16_t port) {
  Beacon b;
  b.peer_id = id;
  b.display_name = name;
  b.tcp_port = port;
  return datagram_body(encode_beacon_datagram(b));
}

bool test_upsert_adds_online_peer(TestContext& ctx) {
  auto bus = EventBus::create();
  auto sub = bus->subscribe();
  auto logger = std::make_shared<Logger>("registry");
  ctx.logs.attach(logger);
  PeerRegistry registry(fast_config(), bus, logger);

  auto id = random_uid();
  auto now = PeerRegistry::Clock::now();
  registry.upsert(id, PeerAddress{"10.0.0.5", 4000}, "bob", now);
  registry.upsert(id, PeerAddress{"10.0.0.5", 4000}, "bob", now + 10ms);

  ZTALK_CHECK(registry.size() == 1);
  auto peer = registry.find(id);
  ZTALK_CHECK(peer);
  ZTALK_CHECK(peer->state == PeerState::Online);
  ZTALK_CHECK(peer->addresses.size() == 1);

  auto events = drain(*sub);
  ZTALK_CHECK(count_type(events, EventType::PeerAdded) == 1);
  ZTALK_CHECK(count_type(events, EventType::PeerUpdated) == 0);
  ZTALK_CHECK(ctx.logs.contains("new peer bob"));
  return true;
}

bool test_address_moves_to_front(TestContext&) {
  auto config = fast_config();
  config.max_addresses = 2;
  PeerRegistry registry(config, nullptr);
  auto id = random_uid();
  auto now = PeerRegistry::Clock::now();
  registry.upsert(id, PeerAddress{"10.0.0.1", 1}, "carol", now);
  registry.upsert(id, PeerAddress{"10.0.0.2", 2}, "carol", now);
  registry.upsert(id, PeerAddress{"10.0.0.3", 3}, "carol", now);
  registry.upsert(id, PeerAddress{"10.0.0.2", 2}, "carol", now);

  auto peer = registry.find(id);
  ZTALK_CHECK(peer);
  ZTALK_CHECK(peer->addresses.size() == 2);
  ZTALK_CHECK(peer->addresses[0] == (PeerAddress{"10.0.0.2", 2}));
  ZTALK_CHECK(peer->addresses[1] == (PeerAddress{"10.0.0.3", 3}));
  auto best = registry.best_address(id);
  ZTALK_CHECK(best && best->port == 2);
  return true;
}

bool test_liveness_transitions_and_eviction(TestContext&) {
  auto bus = EventBus::create();
  auto sub = bus->subscribe({EventType::PeerStateChanged, EventType::PeerRemoved});
  PeerRegistry registry(fast_config(), bus);
  auto id = random_uid();
  auto t0 = PeerRegistry::Clock::now();
  registry.upsert(id, PeerAddress{"10.0.0.9", 9}, "dave", t0);

  registry.mark_sweep(t0 + 50ms);
  ZTALK_CHECK(registry.find(id)->state == PeerState::Online);
  // a beacon running a little late is not yet missed
  registry.mark_sweep(t0 + 120ms);
  ZTALK_CHECK(registry.find(id)->state == PeerState::Online);
  registry.mark_sweep(t0 + 150ms);
  ZTALK_CHECK(registry.find(id)->state == PeerState::Online);

  registry.mark_sweep(t0 + 160ms);
  ZTALK_CHECK(registry.find(id)->state == PeerState::Stale);

  registry.mark_sweep(t0 + 300ms);
  ZTALK_CHECK(registry.find(id)->state == PeerState::Offline);
  ZTALK_CHECK(registry.size() == 1);

  registry.mark_sweep(t0 + 799ms);
  ZTALK_CHECK(registry.size() == 1);
  registry.mark_sweep(t0 + 800ms);
  ZTALK_CHECK(registry.size() == 0);
  ZTALK_CHECK(!registry.find(id));

  auto events = drain(*sub);
  ZTALK_CHECK(count_type(events, EventType::PeerStateChanged) == 2);
  ZTALK_CHECK(count_type(events, EventType::PeerRemoved) == 1);
  auto removed = events.back().as<PeerEvent>();
  ZTALK_CHECK(removed && removed->peer.id == id);
  return true;
}

bool test_touch_revives_offline_peer(TestContext&) {
  auto bus = EventBus::create();
  auto sub = bus->subscribe({EventType::PeerStateChanged});
  PeerRegistry registry(fast_config(), bus);
  auto id = random_uid();
  auto t0 = PeerRegistry::Clock::now();
  registry.upsert(id, PeerAddress{"10.0.0.7", 7}, "erin", t0);
  registry.mark_sweep(t0 + 400ms);
  ZTALK_CHECK(registry.find(id)->state == PeerState::Offline);

  ZTALK_CHECK(registry.touch(id, t0 + 410ms));
  ZTALK_CHECK(registry.find(id)->state == PeerState::Online);
  ZTALK_CHECK(!registry.touch(random_uid(), t0));

  auto events = drain(*sub);
  ZTALK_CHECK(events.size() == 2);
  auto revived = events.back().as<PeerEvent>();
  ZTALK_CHECK(revived && revived->previous_state == PeerState::Offline);
  return true;
}

bool test_snapshot_is_stable_and_sorted(TestContext&) {
  PeerRegistry registry(fast_config(), nullptr);
  auto now = PeerRegistry::Clock::now();
  registry.upsert(random_uid(), PeerAddress{"10.0.0.1", 1}, "zed", now);
  auto before = registry.snapshot();
  registry.upsert(random_uid(), PeerAddress{"10.0.0.2", 2}, "amy", now);
  auto after = registry.snapshot();

  ZTALK_CHECK(before->size() == 1);
  ZTALK_CHECK(after->size() == 2);
  ZTALK_CHECK((*after)[0].display_name == "amy");
  ZTALK_CHECK((*after)[1].display_name == "zed");
  return true;
}

bool test_discovery_accepts_beacons(TestContext& ctx) {
  asio::io_context io;
  RecordingTransport transport;
  PeerRegistry registry(fast_config(), nullptr);
  auto local = random_uid();
  auto logger = std::make_shared<Logger>("discovery");
  ctx.logs.attach(logger);
  DiscoveryEngine discovery(io, transport, registry, local, "me", DiscoveryConfig{100ms}, logger);

  auto remote = random_uid();
  auto body = beacon_body(remote, "frank", 45678);
  discovery.handle_beacon(body.data(), body.size(), PeerAddress{"192.168.1.20", 47800});

  auto peer = registry.find(remote);
  ZTALK_CHECK(peer);
  ZTALK_CHECK(peer->display_name == "frank");
  ZTALK_CHECK(peer->best_address()->ip == "192.168.1.20");
  ZTALK_CHECK(peer->best_address()->port == 45678);

  // own beacons come back through multicast loopback
  auto own = beacon_body(local, "me", 1000);
  discovery.handle_beacon(own.data(), own.size(), PeerAddress{"127.0.0.1", 47800});
  ZTALK_CHECK(!registry.find(local));

  auto no_port = beacon_body(random_uid(), "portless", 0);
  discovery.handle_beacon(no_port.data(), no_port.size(), PeerAddress{"192.168.1.21", 47800});

  auto future = beacon_body(random_uid(), "future", 1);
  future[0] = kProtocolVersion + 1;
  discovery.handle_beacon(future.data(), future.size(), PeerAddress{"192.168.1.22", 47800});

  ZTALK_CHECK(registry.size() == 1);
  ZTALK_CHECK(discovery.beacons_accepted() == 1);
  ZTALK_CHECK(ctx.logs.contains("protocol version"));
  return true;
}

bool test_announce_carries_identity(TestContext&) {
  asio::io_context io;
  RecordingTransport transport;
  transport.set_tcp_port(43210);
  PeerRegistry registry(fast_config(), nullptr);
  auto local = random_uid();
  DiscoveryEngine discovery(io, transport, registry, local, "me", DiscoveryConfig{100ms});

  discovery.announce();
  discovery.set_display_name("renamed");
  discovery.announce();

  auto sent = transport.beacons();
  ZTALK_CHECK(sent.size() == 2);
  DatagramType type{};
  const uint8_t* body = nullptr;
  std::size_t size = 0;
  ZTALK_CHECK(unwrap_datagram(sent[1].data(), sent[1].size(), type, body, size) == DecodeStatus::Ok);
  ZTALK_CHECK(type == DatagramType::Beacon);
  Beacon beacon;
  ZTALK_CHECK(decode_beacon_body(body, size, beacon) == DecodeStatus::Ok);
  ZTALK_CHECK(beacon.peer_id == local);
  ZTALK_CHECK(beacon.display_name == "renamed");
  ZTALK_CHECK(beacon.tcp_port == 43210);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"upsert_adds_online_peer", test_upsert_adds_online_peer},
    {"address_moves_to_front", test_address_moves_to_front},
    {"liveness_transitions_and_eviction", test_liveness_transitions_and_eviction},
    {"touch_revives_offline_peer", test_touch_revives_offline_peer},
    {"snapshot_is_stable_and_sorted", test_snapshot_is_stable_and_sorted},
    {"discovery_accepts_beacons", test_discovery_accepts_beacons},
    {"announce_carries_identity", test_announce_carries_identity},
  };
  return run_tests("peer registry", std::move(tests), argc, argv);
}
