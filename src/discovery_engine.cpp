#include "discovery_engine.hpp"

DiscoveryEngine::DiscoveryEngine(asio::io_context& io,
                                 MessageTransport& transport,
                                 PeerRegistry& registry,
                                 PeerId local_id,
                                 std::string display_name,
                                 DiscoveryConfig config,
                                 std::shared_ptr<Logger> logger)
  : io_(io),
    transport_(transport),
    registry_(registry),
    local_id_(local_id),
    config_(config),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")),
    display_name_(std::move(display_name)),
    beacon_timer_(io),
    sweep_timer_(io) {
  if(config_.heartbeat.count() <= 0) {
    config_.heartbeat = std::chrono::milliseconds(5000);
  }
}

DiscoveryEngine::~DiscoveryEngine() {
  stop();
}

void DiscoveryEngine::start() {
  if(running_) return;
  running_ = true;
  logger_->info("announcing {} as '{}' every {} ms", short_hex(local_id_),
                display_name(), config_.heartbeat.count());
  announce();
  schedule_beacon();
  schedule_sweep();
}

void DiscoveryEngine::stop() {
  if(!running_) return;
  running_ = false;
  beacon_timer_.cancel();
  sweep_timer_.cancel();
}

void DiscoveryEngine::schedule_beacon() {
  beacon_timer_.expires_after(config_.heartbeat);
  beacon_timer_.async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    announce();
    schedule_beacon();
  });
}

void DiscoveryEngine::schedule_sweep() {
  sweep_timer_.expires_after(config_.heartbeat);
  sweep_timer_.async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    registry_.mark_sweep(PeerRegistry::Clock::now());
    schedule_sweep();
  });
}

void DiscoveryEngine::announce() {
  Beacon beacon;
  beacon.peer_id = local_id_;
  beacon.display_name = display_name();
  beacon.tcp_port = transport_.tcp_port();
  transport_.send_beacon(encode_beacon_datagram(beacon));
  ++beacons_sent_;
}

void DiscoveryEngine::set_display_name(std::string name) {
  {
    std::lock_guard<std::mutex> lock(name_mutex_);
    if(name == display_name_) return;
    display_name_ = std::move(name);
  }
  logger_->info("display name is now '{}'", display_name());
  if(running_) announce();
}

std::string DiscoveryEngine::display_name() const {
  std::lock_guard<std::mutex> lock(name_mutex_);
  return display_name_;
}

void DiscoveryEngine::handle_beacon(const uint8_t* body, std::size_t size, const PeerAddress& from) {
  Beacon beacon;
  auto status = decode_beacon_body(body, size, beacon);
  if(status == DecodeStatus::VersionMismatch) {
    logger_->debug("ignoring beacon from {} with protocol version {}", from.ip, beacon.protocol_version);
    return;
  }
  if(status != DecodeStatus::Ok) {
    logger_->debug("bad beacon from {}: {}", from.ip, to_string(status));
    return;
  }
  if(beacon.peer_id == local_id_) return;
  if(beacon.tcp_port == 0) {
    logger_->debug("beacon from {} without a tcp port", from.ip);
    return;
  }
  ++beacons_accepted_;
  registry_.upsert(beacon.peer_id, PeerAddress{from.ip, beacon.tcp_port},
                   beacon.display_name, PeerRegistry::Clock::now());
}
