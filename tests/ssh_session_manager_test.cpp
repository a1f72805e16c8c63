#include "event_bus.hpp"
#include "json_profile_store.hpp"
#include "ssh_session_manager.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace ztalk::test;
using namespace std::chrono_literals;

namespace {

// Drop: the server hangs up mid-step
enum class Step { Succeed, Fail, Block, Drop };

// Knobs shared by every transport one factory hands out.
struct FakeSshServer {
  std::atomic<int> transports_created{0};
  std::atomic<Step> open_step{Step::Succeed};
  std::atomic<Step> auth_step{Step::Succeed};
  // opens allowed to succeed before every later one is unreachable; -1 is unlimited
  std::atomic<int> open_successes_left{-1};
  std::atomic<bool> lose_on_execute{false};
  std::atomic<bool> alive{true};
  std::atomic<int> chunks_per_command{3};
  std::atomic<int> chunk_delay_ms{5};
  std::atomic<int> running_commands{0};
  std::atomic<int> max_running_commands{0};
  std::atomic<int> closes{0};
};

class FakeSshTransport : public SshTransport {
public:
  explicit FakeSshTransport(std::shared_ptr<FakeSshServer> server) : server_(std::move(server)) {}

  SshError open(const SshConfig&, Deadline deadline) override {
    if(server_->open_step == Step::Block) return block_until(deadline);
    if(server_->open_step == Step::Fail) return {SshErrorKind::Refused, "connection refused"};
    int left = server_->open_successes_left.load();
    if(left == 0) return {SshErrorKind::Unreachable, "no route to host"};
    if(left > 0) --server_->open_successes_left;
    return {};
  }

  SshError authenticate(const SshConfig&, const std::string& secret, Deadline deadline) override {
    if(server_->auth_step == Step::Block) return block_until(deadline);
    if(server_->auth_step == Step::Drop) return {SshErrorKind::ConnectionLost, "connection reset during authentication"};
    if(server_->auth_step == Step::Fail || secret == "wrong") {
      return {SshErrorKind::AuthenticationFailed, "permission denied"};
    }
    return {};
  }

  SshError execute(const std::string& command,
                   const SshChunkSink& sink,
                   const std::atomic<bool>& cancel,
                   int& exit_status) override {
    if(server_->lose_on_execute) return {SshErrorKind::ConnectionLost, "socket closed"};
    int running = ++server_->running_commands;
    int seen = server_->max_running_commands.load();
    while(running > seen && !server_->max_running_commands.compare_exchange_weak(seen, running)) {}

    for(int i = 0; i < server_->chunks_per_command && !cancel; ++i) {
      sink(i % 2 == 0 ? OutputStream::Stdout : OutputStream::Stderr,
           command + ":" + std::to_string(i) + "\n");
      std::this_thread::sleep_for(std::chrono::milliseconds(server_->chunk_delay_ms.load()));
    }
    --server_->running_commands;
    exit_status = command.rfind("exit ", 0) == 0 ? std::stoi(command.substr(5)) : 0;
    return {};
  }

  bool alive() override { return server_->alive; }

  void close() override { ++server_->closes; }

  void interrupt() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      interrupted_ = true;
    }
    cv_.notify_all();
  }

private:
  SshError block_until(Deadline deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this]{ return interrupted_; });
    if(interrupted_) return {SshErrorKind::Cancelled, "interrupted"};
    return {SshErrorKind::Timeout, "timed out"};
  }

  std::shared_ptr<FakeSshServer> server_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool interrupted_ = false;
};

SshTransportFactory factory_for(const std::shared_ptr<FakeSshServer>& server) {
  return [server]() -> std::unique_ptr<SshTransport> {
    ++server->transports_created;
    return std::make_unique<FakeSshTransport>(server);
  };
}

SshManagerConfig quick_config() {
  SshManagerConfig config;
  config.connect_timeout = 2000ms;
  config.reconnect_base = 10ms;
  config.reconnect_cap = 40ms;
  config.idle_timeout = std::chrono::seconds(0);
  config.keepalive_interval = 0ms;
  return config;
}

SshConfig target() {
  SshConfig config;
  config.host = "build-box";
  config.port = 22;
  config.username = "deploy";
  return config;
}

struct Fixture {
  explicit Fixture(SshManagerConfig config = quick_config())
    : server(std::make_shared<FakeSshServer>()),
      bus(EventBus::create()),
      events(bus->subscribe({EventType::ConnectionStateChanged})),
      logger(std::make_shared<Logger>("ssh")),
      manager(config, factory_for(server), bus, nullptr, logger) {}

  std::string connect(SshConfig config = target(), const std::string& secret = "hunter2") {
    SshError error;
    auto id = manager.connect(config, secret, error);
    ZTALK_CHECK(!error);
    ZTALK_CHECK(!id.empty());
    return id;
  }

  std::string connect_and_wait() {
    auto id = connect();
    auto state = manager.wait_for_state(id, {SshState::Connected, SshState::Error}, 3s);
    ZTALK_CHECK(state && *state == SshState::Connected);
    return id;
  }

  std::vector<SshState> transitions_to() {
    std::vector<SshState> out;
    for(const auto& e : drain(*events, 20ms)) {
      if(auto c = e.as<ConnectionStateEvent>()) out.push_back(c->to);
    }
    return out;
  }

  std::shared_ptr<FakeSshServer> server;
  std::shared_ptr<EventBus> bus;
  std::shared_ptr<Subscription> events;
  std::shared_ptr<Logger> logger;
  SshSessionManager manager;
};

std::string joined(const std::vector<OutputChunk>& chunks) {
  std::string out;
  for(const auto& c : chunks) out += c.data;
  return out;
}

bool test_rejects_invalid_configs(TestContext&) {
  Fixture f;
  SshError error;
  auto no_host = target();
  no_host.host.clear();
  ZTALK_CHECK(f.manager.connect(no_host, "", error).empty());
  ZTALK_CHECK(error.kind == SshErrorKind::InvalidConfig);

  auto both = target();
  both.key_path = "/home/deploy/.ssh/id_ed25519";
  ZTALK_CHECK(f.manager.connect(both, "pw", error).empty());
  ZTALK_CHECK(error.kind == SshErrorKind::InvalidConfig);

  auto keyless = target();
  keyless.auth = SshAuthMethod::PublicKey;
  ZTALK_CHECK(f.manager.connect(keyless, "", error).empty());
  ZTALK_CHECK(error.kind == SshErrorKind::InvalidConfig);

  ZTALK_CHECK(f.manager.connections().empty());
  ZTALK_CHECK(f.server->transports_created == 0);
  return true;
}

bool test_connect_and_run_command(TestContext&) {
  Fixture f;
  auto id = f.connect_and_wait();
  auto states = f.transitions_to();
  ZTALK_CHECK((states == std::vector<SshState>{SshState::Connecting, SshState::Connected}));

  SshError error;
  auto stream = f.manager.execute(id, "uptime", error);
  ZTALK_CHECK(stream && !error);
  ZTALK_CHECK(stream->wait(3s));
  ZTALK_CHECK(!stream->error());
  ZTALK_CHECK(stream->exit_status() && *stream->exit_status() == 0);
  auto chunks = stream->drain();
  ZTALK_CHECK(chunks.size() == 3);
  ZTALK_CHECK(chunks[1].stream == OutputStream::Stderr);
  ZTALK_CHECK(joined(chunks) == "uptime:0\nuptime:1\nuptime:2\n");

  auto info = f.manager.info(id);
  ZTALK_CHECK(info && info->history.size() == 1 && info->history[0] == "uptime");
  ZTALK_CHECK(f.manager.output(id).size() == 3);
  ZTALK_CHECK(f.manager.output(id, 1).size() == 1);
  return true;
}

bool test_connect_timeout(TestContext&) {
  Fixture f;
  f.server->open_step = Step::Block;
  auto config = target();
  config.connect_timeout = 100ms;
  auto started = std::chrono::steady_clock::now();
  auto id = f.connect(config);
  auto state = f.manager.wait_for_state(id, {SshState::Error}, 3s);
  auto elapsed = std::chrono::steady_clock::now() - started;
  ZTALK_CHECK(state && *state == SshState::Error);
  ZTALK_CHECK(elapsed >= 100ms);
  ZTALK_CHECK(f.manager.info(id)->last_error.kind == SshErrorKind::Timeout);
  return true;
}

bool test_auth_failure_is_not_retried(TestContext& ctx) {
  Fixture f;
  ctx.logs.attach(f.logger);
  auto config = target();
  config.auto_reconnect = true;
  auto id = f.connect(config, "wrong");
  auto state = f.manager.wait_for_state(id, {SshState::Error}, 3s);
  ZTALK_CHECK(state && *state == SshState::Error);
  ZTALK_CHECK(f.manager.info(id)->last_error.kind == SshErrorKind::AuthenticationFailed);
  std::this_thread::sleep_for(150ms);
  ZTALK_CHECK(f.server->transports_created == 1);
  ZTALK_CHECK(!ctx.logs.contains("reconnect attempt"));

  SshError error;
  ZTALK_CHECK(!f.manager.execute(id, "ls", error));
  ZTALK_CHECK(error.kind == SshErrorKind::NotConnected);
  return true;
}

bool test_reconnect_attempts_are_bounded(TestContext& ctx) {
  Fixture f;
  ctx.logs.attach(f.logger);
  f.server->open_successes_left = 1;
  f.server->lose_on_execute = true;
  auto config = target();
  config.auto_reconnect = true;
  config.max_reconnect_attempts = 3;
  auto id = f.connect(config);
  ZTALK_CHECK(f.manager.wait_for_state(id, {SshState::Connected}, 3s) == SshState::Connected);

  SshError error;
  auto stream = f.manager.execute(id, "make", error);
  ZTALK_CHECK(stream);
  ZTALK_CHECK(stream->wait(3s));
  ZTALK_CHECK(stream->error().kind == SshErrorKind::ConnectionLost);

  ZTALK_CHECK(ctx.logs.wait_for_substring("giving up after 3", 5s));
  ZTALK_CHECK(f.server->transports_created == 4);
  auto info = f.manager.info(id);
  ZTALK_CHECK(info->state == SshState::Error);
  ZTALK_CHECK(info->reconnect_attempts == 3);
  return true;
}

bool test_failed_first_connect_is_not_retried(TestContext& ctx) {
  Fixture f;
  ctx.logs.attach(f.logger);
  f.server->auth_step = Step::Drop;
  auto config = target();
  config.auto_reconnect = true;
  config.max_reconnect_attempts = 3;
  auto id = f.connect(config);
  auto state = f.manager.wait_for_state(id, {SshState::Error}, 3s);
  ZTALK_CHECK(state && *state == SshState::Error);
  // several backoff periods pass without another attempt
  std::this_thread::sleep_for(200ms);
  ZTALK_CHECK(f.server->transports_created == 1);
  ZTALK_CHECK(!ctx.logs.contains("reconnect attempt"));
  auto info = f.manager.info(id);
  ZTALK_CHECK(info->state == SshState::Error);
  ZTALK_CHECK(info->last_error.kind == SshErrorKind::ConnectionLost);
  ZTALK_CHECK(info->reconnect_attempts == 0);
  auto states = f.transitions_to();
  ZTALK_CHECK((states == std::vector<SshState>{SshState::Connecting, SshState::Error}));
  return true;
}

bool test_reconnect_recovers(TestContext&) {
  Fixture f;
  f.server->lose_on_execute = true;
  auto config = target();
  config.auto_reconnect = true;
  auto id = f.connect(config);
  ZTALK_CHECK(f.manager.wait_for_state(id, {SshState::Connected}, 3s) == SshState::Connected);
  f.transitions_to();

  SshError error;
  auto lost = f.manager.execute(id, "make", error);
  ZTALK_CHECK(lost && lost->wait(3s));
  f.server->lose_on_execute = false;
  ZTALK_CHECK(wait_for_condition([&]{
    auto info = f.manager.info(id);
    return info && info->state == SshState::Connected && f.server->transports_created == 2;
  }, 3s));
  auto states = f.transitions_to();
  ZTALK_CHECK(!states.empty() && states.front() == SshState::Error);
  ZTALK_CHECK(states.back() == SshState::Connected);

  auto ok = f.manager.execute(id, "make", error);
  ZTALK_CHECK(ok && ok->wait(3s) && !ok->error());
  return true;
}

bool test_commands_are_serialized(TestContext&) {
  Fixture f;
  f.server->chunks_per_command = 4;
  f.server->chunk_delay_ms = 10;
  auto id = f.connect_and_wait();

  SshError error;
  std::vector<std::shared_ptr<CommandStream>> streams;
  for(const char* cmd : {"a", "b", "c"}) {
    streams.push_back(f.manager.execute(id, cmd, error));
    ZTALK_CHECK(streams.back());
  }
  for(auto& s : streams) ZTALK_CHECK(s->wait(5s));
  ZTALK_CHECK(f.server->max_running_commands == 1);

  auto all = joined(f.manager.output(id));
  ZTALK_CHECK(all == "a:0\na:1\na:2\na:3\nb:0\nb:1\nb:2\nb:3\nc:0\nc:1\nc:2\nc:3\n");
  ZTALK_CHECK(streams[0]->id() < streams[1]->id());
  return true;
}

bool test_nonzero_exit_marker(TestContext&) {
  Fixture f;
  f.server->chunks_per_command = 1;
  auto id = f.connect_and_wait();
  SshError error;
  auto stream = f.manager.execute(id, "exit 3", error);
  ZTALK_CHECK(stream && stream->wait(3s));
  ZTALK_CHECK(stream->exit_status() && *stream->exit_status() == 3);
  ZTALK_CHECK(stream->error().kind == SshErrorKind::CommandFailed);

  auto chunks = stream->drain();
  ZTALK_CHECK(chunks.size() == 2);
  ZTALK_CHECK(chunks.back().stream == OutputStream::Stderr);
  ZTALK_CHECK(chunks.back().data == "[exit status 3]\n");
  ZTALK_CHECK(chunks.back().exit_status && *chunks.back().exit_status == 3);
  ZTALK_CHECK(!chunks.front().exit_status);
  ZTALK_CHECK(f.manager.info(id)->state == SshState::Connected);
  return true;
}

bool test_cancel_command_keeps_session(TestContext&) {
  Fixture f;
  f.server->chunks_per_command = 500;
  f.server->chunk_delay_ms = 5;
  auto id = f.connect_and_wait();
  SshError error;
  auto stream = f.manager.execute(id, "tail -f log", error);
  ZTALK_CHECK(stream);
  ZTALK_CHECK(stream->next(3s));
  ZTALK_CHECK(f.manager.cancel_command(stream));
  ZTALK_CHECK(stream->wait(3s));
  ZTALK_CHECK(stream->error().kind == SshErrorKind::Cancelled);
  ZTALK_CHECK(!f.manager.cancel_command(stream));
  ZTALK_CHECK(f.manager.info(id)->state == SshState::Connected);
  return true;
}

bool test_cancel_connect_before_tcp(TestContext&) {
  Fixture f;
  f.server->open_step = Step::Block;
  auto id = f.connect();
  ZTALK_CHECK(f.manager.wait_for_state(id, {SshState::Connecting}, 3s) == SshState::Connecting);
  ZTALK_CHECK(!f.manager.cancel_connect(id));
  ZTALK_CHECK(f.manager.wait_for_state(id, {SshState::Idle, SshState::Error}, 3s) == SshState::Idle);
  ZTALK_CHECK(f.manager.cancel_connect(id).kind == SshErrorKind::InvalidState);
  ZTALK_CHECK(f.manager.cancel_connect("ssh-99").kind == SshErrorKind::UnknownConnection);
  return true;
}

bool test_cancel_connect_after_tcp(TestContext&) {
  Fixture f;
  f.server->auth_step = Step::Block;
  auto id = f.connect();
  ZTALK_CHECK(f.manager.wait_for_state(id, {SshState::Connecting}, 3s) == SshState::Connecting);
  std::this_thread::sleep_for(20ms);
  ZTALK_CHECK(!f.manager.cancel_connect(id));
  ZTALK_CHECK(f.manager.wait_for_state(id, {SshState::Idle, SshState::Error}, 3s) == SshState::Error);
  ZTALK_CHECK(f.manager.info(id)->last_error.kind == SshErrorKind::Cancelled);
  return true;
}

bool test_disconnect_is_idempotent(TestContext&) {
  Fixture f;
  auto id = f.connect_and_wait();
  f.transitions_to();

  ZTALK_CHECK(!f.manager.disconnect(id));
  ZTALK_CHECK(f.manager.wait_for_state(id, {SshState::Disconnected}, 3s) == SshState::Disconnected);
  ZTALK_CHECK(!f.manager.disconnect(id));
  ZTALK_CHECK(!f.manager.disconnect(id));
  std::this_thread::sleep_for(50ms);

  auto states = f.transitions_to();
  ZTALK_CHECK((states == std::vector<SshState>{SshState::Disconnecting, SshState::Disconnected}));
  ZTALK_CHECK(f.server->closes == 1);
  ZTALK_CHECK(f.manager.disconnect("ssh-404").kind == SshErrorKind::UnknownConnection);

  ZTALK_CHECK(!f.manager.reconnect(id));
  ZTALK_CHECK(f.manager.wait_for_state(id, {SshState::Connected}, 3s) == SshState::Connected);
  ZTALK_CHECK(f.manager.reconnect(id).kind == SshErrorKind::InvalidState);
  return true;
}

bool test_idle_timeout_disconnects(TestContext&) {
  auto config = quick_config();
  config.idle_timeout = std::chrono::seconds(1);
  Fixture f(config);
  auto id = f.connect_and_wait();
  ZTALK_CHECK(f.manager.wait_for_state(id, {SshState::Disconnected}, 500ms) == SshState::Connected);
  ZTALK_CHECK(f.manager.wait_for_state(id, {SshState::Disconnected}, 3s) == SshState::Disconnected);
  return true;
}

bool test_keepalive_failure_marks_lost(TestContext&) {
  auto config = quick_config();
  config.keepalive_interval = 30ms;
  Fixture f(config);
  auto id = f.connect_and_wait();
  f.server->alive = false;
  ZTALK_CHECK(f.manager.wait_for_state(id, {SshState::Error}, 3s) == SshState::Error);
  ZTALK_CHECK(f.manager.info(id)->last_error.kind == SshErrorKind::ConnectionLost);
  return true;
}

bool test_remove_and_shutdown(TestContext&) {
  Fixture f;
  auto first = f.connect_and_wait();
  f.server->open_step = Step::Block;
  auto second = f.connect();
  ZTALK_CHECK(f.manager.wait_for_state(second, {SshState::Connecting}, 3s) == SshState::Connecting);

  ZTALK_CHECK(!f.manager.remove(first));
  ZTALK_CHECK(!f.manager.info(first));
  ZTALK_CHECK(f.manager.remove(first).kind == SshErrorKind::UnknownConnection);
  ZTALK_CHECK(f.manager.connections().size() == 1);

  auto started = std::chrono::steady_clock::now();
  f.manager.shutdown();
  ZTALK_CHECK(std::chrono::steady_clock::now() - started < 1500ms);
  ZTALK_CHECK(f.manager.connections().empty());
  return true;
}

bool test_profiles_persist(TestContext& ctx) {
  auto dir = scratch_dir("ssh_profiles");
  auto path = dir / "profiles.json";
  auto logger = std::make_shared<Logger>("profiles");
  ctx.logs.attach(logger);
  std::string saved_id;
  {
    auto store = std::make_shared<JsonProfileStore>(path, logger);
    SshSessionManager manager(quick_config(), factory_for(std::make_shared<FakeSshServer>()),
                              nullptr, store);
    SshProfile p;
    p.name = "staging";
    p.host = "10.0.0.40";
    p.port = 0;
    p.username = "ops";
    p.key_path = "/home/ops/.ssh/id_ed25519";
    auto saved = manager.save_profile(p);
    ZTALK_CHECK(saved.id.size() == 8);
    ZTALK_CHECK(saved.port == 22);
    saved_id = saved.id;
    SshProfile other;
    other.name = "scratch";
    other.host = "10.0.0.41";
    other.username = "ops";
    auto scratch = manager.save_profile(other);
    ZTALK_CHECK(manager.delete_profile(scratch.id));
    ZTALK_CHECK(!manager.delete_profile(scratch.id));
  }
  ZTALK_CHECK(std::filesystem::exists(path));

  auto store = std::make_shared<JsonProfileStore>(path, logger);
  auto server = std::make_shared<FakeSshServer>();
  SshSessionManager manager(quick_config(), factory_for(server), nullptr, store);
  auto profiles = manager.profiles();
  ZTALK_CHECK(profiles.size() == 1);
  ZTALK_CHECK(profiles[0].id == saved_id);
  ZTALK_CHECK(profiles[0].name == "staging");
  ZTALK_CHECK(profiles[0].key_path == "/home/ops/.ssh/id_ed25519");

  SshError error;
  auto id = manager.connect_from_profile(saved_id, "", error);
  ZTALK_CHECK(!error && !id.empty());
  auto info = manager.info(id);
  ZTALK_CHECK(info && info->config.auth == SshAuthMethod::PublicKey);
  ZTALK_CHECK(info->config.host == "10.0.0.40");
  ZTALK_CHECK(manager.connect_from_profile("missing", "", error).empty());
  ZTALK_CHECK(error.kind == SshErrorKind::InvalidConfig);
  return true;
}

bool test_corrupt_profile_file(TestContext& ctx) {
  auto dir = scratch_dir("ssh_profiles_corrupt");
  auto path = dir / "profiles.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  auto logger = std::make_shared<Logger>("profiles");
  ctx.logs.attach(logger);
  JsonProfileStore store(path, logger);
  std::string error;
  auto loaded = store.load(error);
  ZTALK_CHECK(loaded.empty());
  ZTALK_CHECK(!error.empty());

  JsonProfileStore missing(dir / "absent.json", logger);
  error.clear();
  ZTALK_CHECK(missing.load(error).empty());
  ZTALK_CHECK(error.empty());
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"rejects_invalid_configs", test_rejects_invalid_configs},
    {"connect_and_run_command", test_connect_and_run_command},
    {"connect_timeout", test_connect_timeout},
    {"auth_failure_is_not_retried", test_auth_failure_is_not_retried},
    {"reconnect_attempts_are_bounded", test_reconnect_attempts_are_bounded},
    {"failed_first_connect_is_not_retried", test_failed_first_connect_is_not_retried},
    {"reconnect_recovers", test_reconnect_recovers},
    {"commands_are_serialized", test_commands_are_serialized},
    {"nonzero_exit_marker", test_nonzero_exit_marker},
    {"cancel_command_keeps_session", test_cancel_command_keeps_session},
    {"cancel_connect_before_tcp", test_cancel_connect_before_tcp},
    {"cancel_connect_after_tcp", test_cancel_connect_after_tcp},
    {"disconnect_is_idempotent", test_disconnect_is_idempotent},
    {"idle_timeout_disconnects", test_idle_timeout_disconnects},
    {"keepalive_failure_marks_lost", test_keepalive_failure_marks_lost},
    {"remove_and_shutdown", test_remove_and_shutdown},
    {"profiles_persist", test_profiles_persist},
    {"corrupt_profile_file", test_corrupt_profile_file},
  };
  return run_tests("ssh session manager", std::move(tests), argc, argv);
}
