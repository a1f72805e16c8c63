#include "transport.hpp"

#include <stdexcept>
#include <vector>

const char* to_string(TransportError error) {
  switch(error) {
    case TransportError::None: return "ok";
    case TransportError::Unreachable: return "unreachable";
    case TransportError::Timeout: return "timeout";
    case TransportError::Refused: return "refused";
    case TransportError::Malformed: return "malformed";
  }
  return "unknown";
}

TransportError classify_transport_error(const std::error_code& ec) {
  if(!ec) return TransportError::None;
  if(ec == asio::error::connection_refused) return TransportError::Refused;
  if(ec == asio::error::timed_out) return TransportError::Timeout;
  return TransportError::Unreachable;
}

namespace {

PeerAddress to_peer_address(const asio::ip::address& address, uint16_t port) {
  PeerAddress out;
  out.ip = address.is_v6() && address.to_v6().is_v4_mapped()
    ? asio::ip::make_address_v4(asio::ip::v4_mapped, address.to_v6()).to_string()
    : address.to_string();
  out.port = port;
  return out;
}

uint32_t read_be32(const std::array<uint8_t, kFrameLengthSize>& b) {
  return (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) | uint32_t(b[3]);
}

} // namespace

// One accepted TCP stream. Reads length-prefixed frames until the remote
// closes or sends something malformed.
class Transport::InboundSession : public std::enable_shared_from_this<InboundSession> {
public:
  InboundSession(Transport& owner, tcp::socket socket, PeerAddress remote)
    : owner_(owner), socket_(std::move(socket)), remote_(std::move(remote)) {}

  void start() { read_header(); }

  void close() {
    if(closed_) return;
    closed_ = true;
    std::error_code ec;
    socket_.close(ec);
    owner_.sessions_.erase(shared_from_this());
  }

private:
  void read_header() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_),
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          if(ec != asio::error::eof && ec != asio::error::operation_aborted) {
            owner_.logger_->debug("inbound {} read error: {}", remote_.to_string(), ec.message());
          }
          close();
          return;
        }
        auto size = read_be32(header_);
        if(size < kChecksumSize || size > kMaxFrameSize) {
          owner_.logger_->warn("inbound {} sent frame of {} bytes, closing", remote_.to_string(), size);
          close();
          return;
        }
        read_payload(size);
      });
  }

  void read_payload(uint32_t size) {
    payload_.resize(size);
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(payload_),
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          owner_.logger_->debug("inbound {} truncated frame: {}", remote_.to_string(), ec.message());
          close();
          return;
        }
        std::size_t body_size = 0;
        auto status = unwrap_frame_payload(payload_.data(), payload_.size(), body_size);
        if(status != DecodeStatus::Ok) {
          owner_.logger_->warn("inbound {} malformed frame ({}), closing",
                               remote_.to_string(), to_string(status));
          close();
          return;
        }
        if(owner_.frame_handler_) owner_.frame_handler_(payload_.data(), body_size, remote_);
        if(!closed_) read_header();
      });
  }

  Transport& owner_;
  tcp::socket socket_;
  PeerAddress remote_;
  std::array<uint8_t, kFrameLengthSize> header_{};
  std::vector<uint8_t> payload_;
  bool closed_ = false;
};

// One outgoing TCP stream per remote endpoint. Frames are written in the
// order they were queued; a failure fails everything still queued.
class Transport::OutboundLink : public std::enable_shared_from_this<OutboundLink> {
public:
  OutboundLink(Transport& owner, std::string key, tcp::endpoint endpoint)
    : owner_(owner),
      key_(std::move(key)),
      endpoint_(std::move(endpoint)),
      socket_(owner.io_),
      timer_(owner.io_) {}

  void enqueue(std::shared_ptr<Bytes> frame, SendCallback callback) {
    write_queue_.push_back(Pending{std::move(frame), std::move(callback)});
    if(!connected_ && !connecting_) {
      do_connect();
    } else if(connected_ && !writing_) {
      do_write();
    }
  }

  void close(TransportError reason) { fail(reason); }

private:
  struct Pending {
    std::shared_ptr<Bytes> frame;
    SendCallback callback;
  };

  // A wait that already completed cannot be cancelled, so each arm gets a
  // generation and stale completions are ignored.
  void arm_timer(std::chrono::milliseconds timeout) {
    timed_out_ = false;
    auto generation = ++timer_generation_;
    timer_.expires_after(timeout);
    auto self = shared_from_this();
    timer_.async_wait([this, self, generation](const std::error_code& ec){
      if(ec || closed_ || generation != timer_generation_) return;
      timed_out_ = true;
      std::error_code ignored;
      socket_.close(ignored);
    });
  }

  void disarm_timer() {
    ++timer_generation_;
    timer_.cancel();
  }

  void do_connect() {
    connecting_ = true;
    arm_timer(owner_.config_.connect_timeout);
    auto self = shared_from_this();
    socket_.async_connect(endpoint_, [this, self](std::error_code ec){
      disarm_timer();
      connecting_ = false;
      if(closed_) return;
      if(ec) {
        auto reason = timed_out_ ? TransportError::Timeout : classify_transport_error(ec);
        owner_.logger_->debug("connect to {} failed: {}", key_, timed_out_ ? "timed out" : ec.message());
        fail(reason);
        return;
      }
      connected_ = true;
      std::error_code ignored;
      socket_.set_option(tcp::no_delay(true), ignored);
      watch_remote();
      do_write();
    });
  }

  void do_write() {
    if(write_queue_.empty()) {
      writing_ = false;
      return;
    }
    writing_ = true;
    arm_timer(owner_.config_.write_timeout);
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(*write_queue_.front().frame),
      [this, self](std::error_code ec, std::size_t){
        disarm_timer();
        if(closed_) return;
        if(ec) {
          auto reason = timed_out_ ? TransportError::Timeout : classify_transport_error(ec);
          owner_.logger_->debug("write to {} failed: {}", key_, timed_out_ ? "timed out" : ec.message());
          fail(reason);
          return;
        }
        auto done = std::move(write_queue_.front());
        write_queue_.pop_front();
        if(done.callback) done.callback(TransportError::None);
        if(!closed_) do_write();
      });
  }

  // The remote never writes on this stream; a completed read means it went away.
  void watch_remote() {
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(&sink_byte_, 1), [this, self](std::error_code ec, std::size_t){
      if(closed_) return;
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        owner_.logger_->debug("link to {} closed by remote", key_);
        fail(TransportError::Unreachable);
        return;
      }
      watch_remote();
    });
  }

  void fail(TransportError reason) {
    if(closed_) return;
    closed_ = true;
    disarm_timer();
    std::error_code ignored;
    socket_.close(ignored);
    auto pending = std::move(write_queue_);
    write_queue_.clear();
    owner_.drop_link(key_, this);
    for(auto& p : pending) {
      if(p.callback) p.callback(reason);
    }
  }

  Transport& owner_;
  std::string key_;
  tcp::endpoint endpoint_;
  tcp::socket socket_;
  asio::steady_timer timer_;
  std::deque<Pending> write_queue_;
  uint8_t sink_byte_ = 0;
  bool connecting_ = false;
  bool connected_ = false;
  bool writing_ = false;
  bool timed_out_ = false;
  uint64_t timer_generation_ = 0;
  bool closed_ = false;
};

Transport::Transport(asio::io_context& io,
                     TransportConfig config,
                     std::shared_ptr<Logger> logger)
  : io_(io),
    config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("transport")) {
}

Transport::~Transport() {
  stop();
}

void Transport::start() {
  if(running_) return;

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(config_.listen_ip);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", config_.listen_ip, e.what());
    throw std::runtime_error("invalid listen_ip '" + config_.listen_ip + "'");
  }

  try {
    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(listen_address, config_.tcp_port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_tcp_port_ = acceptor_->local_endpoint().port();
  } catch(const std::system_error& e) {
    acceptor_.reset();
    throw std::runtime_error(fmt::format("cannot listen on {}:{}: {}",
                                         config_.listen_ip, config_.tcp_port, e.what()));
  }

  if(config_.enable_multicast) {
    open_multicast();
  }

  running_ = true;
  logger_->info("listening on tcp {}:{}", config_.listen_ip, bound_tcp_port_);
  do_accept();
  if(multicast_socket_) do_receive_datagram();
}

void Transport::open_multicast() {
  asio::ip::address group;
  try {
    group = asio::ip::make_address(config_.multicast_group);
  } catch(const std::exception& e) {
    throw std::runtime_error("invalid multicast_group '" + config_.multicast_group + "': " + e.what());
  }
  if(!group.is_v4() || !group.is_multicast()) {
    throw std::runtime_error("multicast_group '" + config_.multicast_group + "' is not an IPv4 multicast address");
  }
  multicast_endpoint_ = udp::endpoint(group, config_.multicast_port);

  auto socket = std::make_unique<udp::socket>(io_);
  try {
    socket->open(udp::v4());
    socket->set_option(udp::socket::reuse_address(true));
    socket->bind(udp::endpoint(asio::ip::address_v4::any(), config_.multicast_port));
  } catch(const std::system_error& e) {
    throw std::runtime_error(fmt::format("cannot bind multicast port {}: {}",
                                         config_.multicast_port, e.what()));
  }

  std::error_code ec;
  if(config_.multicast_interface.empty()) {
    socket->set_option(asio::ip::multicast::join_group(group), ec);
  } else {
    auto iface = asio::ip::make_address_v4(config_.multicast_interface, ec);
    if(!ec) socket->set_option(asio::ip::multicast::join_group(group.to_v4(), iface), ec);
    if(!ec) socket->set_option(asio::ip::multicast::outbound_interface(iface), ec);
  }
  if(ec) {
    logger_->warn("Failed to join multicast group {}: {}", config_.multicast_group, ec.message());
  }
  socket->set_option(asio::ip::multicast::hops(config_.multicast_ttl), ec);
  if(ec) logger_->warn("Failed to set multicast ttl: {}", ec.message());
  socket->set_option(asio::ip::multicast::enable_loopback(config_.multicast_loopback), ec);
  if(ec) logger_->warn("Failed to set multicast loopback: {}", ec.message());

  multicast_socket_ = std::move(socket);
  logger_->info("joined multicast {}:{}", config_.multicast_group, config_.multicast_port);
}

void Transport::stop() {
  if(!running_) return;
  running_ = false;

  std::error_code ec;
  if(acceptor_) acceptor_->close(ec);
  acceptor_.reset();
  if(multicast_socket_) multicast_socket_->close(ec);
  multicast_socket_.reset();

  auto sessions = sessions_;
  for(auto& s : sessions) s->close();
  sessions_.clear();

  auto links = links_;
  for(auto& [key, link] : links) link->close(TransportError::Unreachable);
  links_.clear();
  logger_->debug("transport stopped");
}

void Transport::do_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(!running_) return;
      if(ec) {
        logger_->error("Accept error: {}", ec.message());
      } else {
        std::error_code remote_ec;
        auto remote = socket.remote_endpoint(remote_ec);
        if(!remote_ec) {
          auto from = to_peer_address(remote.address(), remote.port());
          logger_->debug("Accepted connection from {}", from.to_string());
          auto session = std::make_shared<InboundSession>(*this, std::move(socket), from);
          sessions_.insert(session);
          session->start();
        }
      }
      do_accept();
    });
}

void Transport::do_receive_datagram() {
  if(!multicast_socket_) return;
  multicast_socket_->async_receive_from(asio::buffer(datagram_buf_), datagram_sender_,
    [this](std::error_code ec, std::size_t size){
      if(!running_ || ec == asio::error::operation_aborted) return;
      if(ec) {
        logger_->warn("multicast receive error: {}", ec.message());
      } else {
        DatagramType type{};
        const uint8_t* body = nullptr;
        std::size_t body_size = 0;
        auto from = to_peer_address(datagram_sender_.address(), datagram_sender_.port());
        auto status = unwrap_datagram(datagram_buf_.data(), size, type, body, body_size);
        if(status != DecodeStatus::Ok) {
          logger_->debug("dropping datagram from {}: {}", from.to_string(), to_string(status));
        } else if(datagram_handler_) {
          datagram_handler_(type, body, body_size, from);
        }
      }
      do_receive_datagram();
    });
}

void Transport::send_beacon(Bytes payload) {
  send_multicast(std::make_shared<Bytes>(std::move(payload)));
}

void Transport::send_datagram(Bytes payload) {
  if(payload.size() > kMaxDatagramSize) {
    logger_->warn("datagram of {} bytes exceeds the multicast limit, dropped", payload.size());
    return;
  }
  send_multicast(std::make_shared<Bytes>(std::move(payload)));
}

void Transport::send_multicast(std::shared_ptr<Bytes> payload) {
  asio::post(io_, [this, payload]{
    if(!running_ || !multicast_socket_) return;
    multicast_socket_->async_send_to(asio::buffer(*payload), multicast_endpoint_,
      [this, payload](std::error_code ec, std::size_t){
        if(ec && ec != asio::error::operation_aborted) {
          logger_->warn("multicast send failed: {}", ec.message());
        }
      });
  });
}

TransportError Transport::send_reliable(const PeerAddress& address,
                                        Bytes frame,
                                        SendCallback callback) {
  if(frame.size() < kFrameLengthSize + kChecksumSize ||
     frame.size() > kFrameLengthSize + kMaxFrameSize) {
    return TransportError::Malformed;
  }
  std::error_code ec;
  auto ip = asio::ip::make_address(address.ip, ec);
  if(ec || address.port == 0) {
    return TransportError::Unreachable;
  }
  tcp::endpoint endpoint(ip, address.port);
  auto shared = std::make_shared<Bytes>(std::move(frame));
  asio::post(io_, [this, endpoint, shared, callback = std::move(callback)]() mutable {
    enqueue_reliable(endpoint, std::move(shared), std::move(callback));
  });
  return TransportError::None;
}

void Transport::enqueue_reliable(const tcp::endpoint& endpoint,
                                 std::shared_ptr<Bytes> frame,
                                 SendCallback callback) {
  if(!running_) {
    if(callback) callback(TransportError::Unreachable);
    return;
  }
  auto key = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
  auto it = links_.find(key);
  if(it == links_.end()) {
    it = links_.emplace(key, std::make_shared<OutboundLink>(*this, key, endpoint)).first;
  }
  auto link = it->second;
  link->enqueue(std::move(frame), std::move(callback));
}

void Transport::drop_link(const std::string& key, const OutboundLink* link) {
  auto it = links_.find(key);
  if(it != links_.end() && it->second.get() == link) links_.erase(it);
}
