#pragma once
#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

#include "log.hpp"
#include "peer.hpp"
#include "protocol.hpp"
#include "transport_error.hpp"

struct TransportConfig {
  std::string listen_ip = "0.0.0.0";
  uint16_t tcp_port = 0;
  bool enable_multicast = true;
  std::string multicast_group = "239.255.42.99";
  uint16_t multicast_port = 47800;
  // empty lets the kernel pick the interface
  std::string multicast_interface;
  int multicast_ttl = 1;
  bool multicast_loopback = true;
  std::chrono::milliseconds connect_timeout{3000};
  std::chrono::milliseconds write_timeout{5000};
};

using DatagramHandler = std::function<void(DatagramType type,
                                           const uint8_t* body, std::size_t size,
                                           const PeerAddress& from)>;
using FrameHandler = std::function<void(const uint8_t* body, std::size_t size,
                                        const PeerAddress& from)>;
using SendCallback = std::function<void(TransportError)>;

// What the router needs from the network. Implementations must be safe to
// call from any thread.
class MessageTransport {
public:
  virtual ~MessageTransport() = default;

  virtual void send_beacon(Bytes payload) = 0;
  virtual void send_datagram(Bytes payload) = 0;
  // A non-None return means the frame was rejected up front and the
  // callback will not run. Otherwise the callback reports the outcome.
  virtual TransportError send_reliable(const PeerAddress& address,
                                       Bytes frame,
                                       SendCallback callback) = 0;
  virtual uint16_t tcp_port() const = 0;
};

class Transport : public MessageTransport {
public:
  Transport(asio::io_context& io,
            TransportConfig config,
            std::shared_ptr<Logger> logger = nullptr);
  ~Transport() override;

  Transport(const Transport&) = delete;
  Transport& operator=(const Transport&) = delete;

  void set_datagram_handler(DatagramHandler handler) { datagram_handler_ = std::move(handler); }
  void set_frame_handler(FrameHandler handler) { frame_handler_ = std::move(handler); }

  // Opens the sockets. Throws std::runtime_error when the listener cannot be
  // bound. Failing to join the multicast group is logged and tolerated.
  void start();
  // Must run on the io thread, or while the io_context is not running.
  void stop();

  bool running() const { return running_; }

  void send_beacon(Bytes payload) override;
  void send_datagram(Bytes payload) override;
  TransportError send_reliable(const PeerAddress& address,
                               Bytes frame,
                               SendCallback callback) override;
  uint16_t tcp_port() const override { return bound_tcp_port_; }

  std::size_t outbound_link_count() const { return links_.size(); }

private:
  using tcp = asio::ip::tcp;
  using udp = asio::ip::udp;

  class InboundSession;
  class OutboundLink;

  void open_multicast();
  void do_receive_datagram();
  void do_accept();
  void send_multicast(std::shared_ptr<Bytes> payload);
  void enqueue_reliable(const tcp::endpoint& endpoint,
                        std::shared_ptr<Bytes> frame,
                        SendCallback callback);
  void drop_link(const std::string& key, const OutboundLink* link);

  asio::io_context& io_;
  TransportConfig config_;
  std::shared_ptr<Logger> logger_;

  DatagramHandler datagram_handler_;
  FrameHandler frame_handler_;

  std::atomic<bool> running_{false};
  uint16_t bound_tcp_port_ = 0;

  std::unique_ptr<udp::socket> multicast_socket_;
  udp::endpoint multicast_endpoint_;
  udp::endpoint datagram_sender_;
  std::array<uint8_t, kMaxDatagramSize> datagram_buf_{};

  std::unique_ptr<tcp::acceptor> acceptor_;
  std::set<std::shared_ptr<InboundSession>> sessions_;
  std::map<std::string, std::shared_ptr<OutboundLink>> links_;
};
