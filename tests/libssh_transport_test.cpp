#include "libssh_transport.hpp"
#include "stalled_listener.hpp"
#include "test_runner_utils.hpp"

#include <asio.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace ztalk::test;
using namespace std::chrono_literals;

namespace {

SshConfig loopback_target(uint16_t port) {
  SshConfig config;
  config.host = "127.0.0.1";
  config.port = port;
  config.username = "deploy";
  return config;
}

bool test_open_times_out_on_unanswered_connect(TestContext& ctx) {
  StalledListener stalled;
  auto logger = std::make_shared<Logger>("libssh");
  ctx.logs.attach(logger);
  LibsshTransport transport(logger);

  auto started = std::chrono::steady_clock::now();
  auto error = transport.open(loopback_target(stalled.port()), started + 300ms);
  auto elapsed = std::chrono::steady_clock::now() - started;
  ZTALK_CHECK(error.kind == SshErrorKind::Timeout);
  ZTALK_CHECK(elapsed >= 300ms);
  ZTALK_CHECK(elapsed < 2s);
  ZTALK_CHECK(!ctx.logs.contains("tcp connected"));

  auto auth = transport.authenticate(loopback_target(stalled.port()), "pw", std::chrono::steady_clock::now() + 1s);
  ZTALK_CHECK(auth.kind == SshErrorKind::NotConnected);
  return true;
}

bool test_open_with_expired_deadline(TestContext&) {
  StalledListener stalled;
  LibsshTransport transport;
  auto error = transport.open(loopback_target(stalled.port()), std::chrono::steady_clock::now() - 1ms);
  ZTALK_CHECK(error.kind == SshErrorKind::Timeout);
  return true;
}

bool test_interrupt_cancels_open(TestContext&) {
  StalledListener stalled;
  LibsshTransport transport;
  std::thread interrupter([&]{
    std::this_thread::sleep_for(100ms);
    transport.interrupt();
  });
  auto started = std::chrono::steady_clock::now();
  auto error = transport.open(loopback_target(stalled.port()), started + 5s);
  auto elapsed = std::chrono::steady_clock::now() - started;
  interrupter.join();
  ZTALK_CHECK(error.kind == SshErrorKind::Cancelled);
  ZTALK_CHECK(elapsed < 2s);
  return true;
}

bool test_closed_port_is_refused(TestContext&) {
  uint16_t closed_port = 0;
  {
    asio::io_context io;
    asio::ip::tcp::acceptor released(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    closed_port = released.local_endpoint().port();
  }
  LibsshTransport transport;
  auto error = transport.open(loopback_target(closed_port), std::chrono::steady_clock::now() + 2s);
  ZTALK_CHECK(error.kind == SshErrorKind::Refused);
  return true;
}

bool test_handshake_with_non_ssh_server_fails(TestContext&) {
  asio::io_context io;
  asio::ip::tcp::acceptor listener(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  std::thread server([&]{
    asio::ip::tcp::socket peer(io);
    std::error_code ec;
    listener.accept(peer, ec);
    if(ec) return;
    std::string reply = "HTTP/1.1 400 Bad Request\r\n\r\n";
    asio::write(peer, asio::buffer(reply), ec);
    peer.close(ec);
  });

  LibsshTransport transport;
  auto config = loopback_target(listener.local_endpoint().port());
  auto deadline = std::chrono::steady_clock::now() + 3s;
  auto opened = transport.open(config, deadline);
  SshError error = opened;
  if(!opened) {
    error = transport.authenticate(config, "pw", deadline);
  } else {
    // release the accept so the server thread can finish
    asio::ip::tcp::socket stand_in(io);
    std::error_code ec;
    stand_in.connect(listener.local_endpoint(), ec);
  }
  server.join();
  ZTALK_CHECK(!opened);
  ZTALK_CHECK(error.kind == SshErrorKind::ProtocolError);
  transport.close();
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"open_times_out_on_unanswered_connect", test_open_times_out_on_unanswered_connect},
    {"open_with_expired_deadline", test_open_with_expired_deadline},
    {"interrupt_cancels_open", test_interrupt_cancels_open},
    {"closed_port_is_refused", test_closed_port_is_refused},
    {"handshake_with_non_ssh_server_fails", test_handshake_with_non_ssh_server_fails},
  };
  return run_tests("libssh transport", std::move(tests), argc, argv);
}
