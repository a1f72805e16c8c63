#include "ssh_session_manager.hpp"

#include <algorithm>

CommandStream::CommandStream(uint64_t id, std::string connection_id, std::string command)
  : id_(id),
    connection_id_(std::move(connection_id)),
    command_(std::move(command)) {}

std::optional<OutputChunk> CommandStream::next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]{ return !chunks_.empty() || finished_; });
  if(chunks_.empty()) return std::nullopt;
  auto chunk = std::move(chunks_.front());
  chunks_.pop_front();
  return chunk;
}

std::vector<OutputChunk> CommandStream::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<OutputChunk> out(std::make_move_iterator(chunks_.begin()),
                               std::make_move_iterator(chunks_.end()));
  chunks_.clear();
  return out;
}

bool CommandStream::wait(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]{ return finished_; });
}

bool CommandStream::finished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_;
}

std::optional<int> CommandStream::exit_status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exit_status_;
}

SshError CommandStream::error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

void CommandStream::push(const OutputChunk& chunk) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(finished_) return;
    chunks_.push_back(chunk);
  }
  cv_.notify_all();
}

void CommandStream::finish(std::optional<int> exit_status, SshError error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(finished_) return;
    finished_ = true;
    exit_status_ = exit_status;
    error_ = std::move(error);
  }
  cv_.notify_all();
}

struct SshSessionManager::Connection {
  std::string id;
  SshConfig config;
  std::string secret;

  mutable std::mutex mutex;
  std::condition_variable wake;
  mutable std::condition_variable state_cv;

  SshState state = SshState::Idle;
  SshError last_error;
  std::vector<std::string> history;
  std::deque<OutputChunk> output;
  std::deque<std::shared_ptr<CommandStream>> pending;
  std::shared_ptr<CommandStream> running;
  std::chrono::system_clock::time_point last_activity{};
  std::chrono::steady_clock::time_point last_activity_steady{};
  std::chrono::steady_clock::time_point last_keepalive{};
  int reconnect_attempts = 0;

  bool connect_requested = false;
  bool disconnect_requested = false;
  bool stop_requested = false;
  bool cancel_requested = false;
  bool tcp_established = false;

  std::shared_ptr<SshTransport> transport;
  std::thread worker;

  void touch() {
    last_activity = std::chrono::system_clock::now();
    last_activity_steady = std::chrono::steady_clock::now();
  }

  SshConnectionInfo snapshot() const {
    SshConnectionInfo info;
    info.id = id;
    info.config = config;
    info.state = state;
    info.last_error = last_error;
    info.last_activity = last_activity;
    info.history = history;
    info.buffered_chunks = output.size();
    info.reconnect_attempts = reconnect_attempts;
    return info;
  }
};

namespace {

SshError validate(const SshConfig& config) {
  if(config.host.empty()) return {SshErrorKind::InvalidConfig, "host is required"};
  if(config.username.empty()) return {SshErrorKind::InvalidConfig, "username is required"};
  if(config.port == 0) return {SshErrorKind::InvalidConfig, "port must be non-zero"};
  if(config.auth == SshAuthMethod::PublicKey && config.key_path.empty()) {
    return {SshErrorKind::InvalidConfig, "key file authentication needs a key path"};
  }
  if(config.auth == SshAuthMethod::Password && !config.key_path.empty()) {
    return {SshErrorKind::InvalidConfig, "password and key file authentication are mutually exclusive"};
  }
  return {};
}

} // namespace

SshSessionManager::SshSessionManager(SshManagerConfig config,
                                     SshTransportFactory factory,
                                     std::shared_ptr<EventBus> bus,
                                     std::shared_ptr<SshProfileStore> store,
                                     std::shared_ptr<Logger> logger)
  : config_(config),
    factory_(std::move(factory)),
    bus_(std::move(bus)),
    store_(std::move(store)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("ssh")) {
  if(config_.output_buffer_chunks == 0) config_.output_buffer_chunks = 1;
  if(store_) {
    std::string error;
    profiles_ = store_->load(error);
    if(!error.empty()) {
      logger_->warn("Unable to load ssh profiles: {}", error);
    } else if(!profiles_.empty()) {
      logger_->debug("loaded {} ssh profile(s)", profiles_.size());
    }
  }
}

SshSessionManager::~SshSessionManager() {
  shutdown();
}

std::shared_ptr<SshSessionManager::Connection> SshSessionManager::find(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  return it == connections_.end() ? nullptr : it->second;
}

std::string SshSessionManager::connect(const SshConfig& config, const std::string& secret, SshError& error) {
  error = validate(config);
  if(error) return {};

  auto conn = std::make_shared<Connection>();
  conn->config = config;
  if(conn->config.max_reconnect_attempts < 0) conn->config.max_reconnect_attempts = 0;
  conn->secret = secret;
  conn->connect_requested = true;
  conn->touch();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    conn->id = "ssh-" + std::to_string(next_connection_++);
    connections_.emplace(conn->id, conn);
  }
  logger_->info("{}: connecting to {}@{}:{}", conn->id, config.username, config.host, config.port);
  conn->worker = std::thread([this, conn]{ run_worker(conn); });
  return conn->id;
}

std::shared_ptr<CommandStream> SshSessionManager::execute(const std::string& connection_id,
                                                          const std::string& command,
                                                          SshError& error) {
  error = {};
  auto conn = find(connection_id);
  if(!conn) {
    error = {SshErrorKind::UnknownConnection, "no connection " + connection_id};
    return nullptr;
  }
  std::shared_ptr<CommandStream> stream;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    if(conn->state != SshState::Connected) {
      error = {SshErrorKind::NotConnected, connection_id + " is " + to_string(conn->state)};
      return nullptr;
    }
    stream = std::make_shared<CommandStream>(next_command_++, connection_id, command);
    conn->history.push_back(command);
    conn->pending.push_back(stream);
    conn->touch();
  }
  conn->wake.notify_all();
  return stream;
}

bool SshSessionManager::cancel_command(const std::shared_ptr<CommandStream>& stream) {
  if(!stream || stream->finished()) return false;
  stream->cancel_ = true;
  if(auto conn = find(stream->connection_id())) conn->wake.notify_all();
  return true;
}

SshError SshSessionManager::cancel_connect(const std::string& connection_id) {
  auto conn = find(connection_id);
  if(!conn) return {SshErrorKind::UnknownConnection, "no connection " + connection_id};
  std::shared_ptr<SshTransport> transport;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    if(conn->state != SshState::Connecting) {
      return {SshErrorKind::InvalidState, connection_id + " is not connecting"};
    }
    conn->cancel_requested = true;
    transport = conn->transport;
  }
  if(transport) transport->interrupt();
  return {};
}

SshError SshSessionManager::disconnect(const std::string& connection_id) {
  auto conn = find(connection_id);
  if(!conn) return {SshErrorKind::UnknownConnection, "no connection " + connection_id};
  std::shared_ptr<SshTransport> transport;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    if((conn->state == SshState::Disconnected || conn->state == SshState::Idle) &&
       !conn->connect_requested) {
      return {};
    }
    conn->disconnect_requested = true;
    conn->connect_requested = false;
    if(conn->running) conn->running->cancel_ = true;
    if(conn->state == SshState::Connecting) transport = conn->transport;
  }
  if(transport) transport->interrupt();
  conn->wake.notify_all();
  return {};
}

SshError SshSessionManager::reconnect(const std::string& connection_id, const std::string& secret) {
  auto conn = find(connection_id);
  if(!conn) return {SshErrorKind::UnknownConnection, "no connection " + connection_id};
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    if(conn->state != SshState::Error && conn->state != SshState::Disconnected &&
       conn->state != SshState::Idle) {
      return {SshErrorKind::InvalidState, connection_id + " is " + to_string(conn->state)};
    }
    if(!secret.empty()) conn->secret = secret;
    conn->connect_requested = true;
    conn->disconnect_requested = false;
    conn->reconnect_attempts = 0;
  }
  conn->wake.notify_all();
  return {};
}

SshError SshSessionManager::remove(const std::string& connection_id) {
  std::shared_ptr<Connection> conn;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if(it == connections_.end()) {
      return {SshErrorKind::UnknownConnection, "no connection " + connection_id};
    }
    conn = it->second;
    connections_.erase(it);
  }
  std::shared_ptr<SshTransport> transport;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    conn->stop_requested = true;
    if(conn->running) conn->running->cancel_ = true;
    transport = conn->transport;
  }
  if(transport) transport->interrupt();
  conn->wake.notify_all();
  if(conn->worker.joinable()) conn->worker.join();
  logger_->info("{}: removed", connection_id);
  return {};
}

void SshSessionManager::shutdown() {
  std::map<std::string, std::shared_ptr<Connection>> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    all.swap(connections_);
  }
  for(auto& [id, conn] : all) {
    std::shared_ptr<SshTransport> transport;
    {
      std::lock_guard<std::mutex> lock(conn->mutex);
      conn->stop_requested = true;
      if(conn->running) conn->running->cancel_ = true;
      transport = conn->transport;
    }
    if(transport) transport->interrupt();
    conn->wake.notify_all();
  }
  for(auto& [id, conn] : all) {
    if(conn->worker.joinable()) conn->worker.join();
  }
}

std::optional<SshConnectionInfo> SshSessionManager::info(const std::string& connection_id) const {
  auto conn = find(connection_id);
  if(!conn) return std::nullopt;
  std::lock_guard<std::mutex> lock(conn->mutex);
  return conn->snapshot();
}

std::vector<SshConnectionInfo> SshSessionManager::connections() const {
  std::vector<std::shared_ptr<Connection>> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& [id, conn] : connections_) all.push_back(conn);
  }
  std::vector<SshConnectionInfo> out;
  out.reserve(all.size());
  for(const auto& conn : all) {
    std::lock_guard<std::mutex> lock(conn->mutex);
    out.push_back(conn->snapshot());
  }
  return out;
}

std::vector<OutputChunk> SshSessionManager::output(const std::string& connection_id, std::size_t limit) const {
  auto conn = find(connection_id);
  if(!conn) return {};
  std::lock_guard<std::mutex> lock(conn->mutex);
  const auto& q = conn->output;
  auto start = (limit == 0 || limit >= q.size()) ? q.begin() : q.end() - static_cast<std::ptrdiff_t>(limit);
  return std::vector<OutputChunk>(start, q.end());
}

std::optional<SshState> SshSessionManager::wait_for_state(const std::string& connection_id,
                                                          const std::vector<SshState>& states,
                                                          std::chrono::milliseconds timeout) const {
  auto conn = find(connection_id);
  if(!conn) return std::nullopt;
  std::unique_lock<std::mutex> lock(conn->mutex);
  conn->state_cv.wait_for(lock, timeout, [&]{
    return std::find(states.begin(), states.end(), conn->state) != states.end();
  });
  return conn->state;
}

void SshSessionManager::run_worker(const std::shared_ptr<Connection>& conn) {
  for(;;) {
    std::unique_lock<std::mutex> lock(conn->mutex);
    auto now = std::chrono::steady_clock::now();
    auto wake_at = now + std::chrono::hours(1);
    if(conn->state == SshState::Connected) {
      if(config_.idle_timeout.count() > 0) {
        wake_at = std::min(wake_at, conn->last_activity_steady + config_.idle_timeout);
      }
      if(config_.keepalive_interval.count() > 0) {
        wake_at = std::min(wake_at, conn->last_keepalive + config_.keepalive_interval);
      }
    }
    conn->wake.wait_until(lock, wake_at, [&]{
      return conn->stop_requested || conn->connect_requested || conn->disconnect_requested ||
             (conn->state == SshState::Connected && !conn->pending.empty());
    });

    if(conn->stop_requested) {
      lock.unlock();
      close_session(conn, SshState::Disconnected);
      return;
    }
    if(conn->disconnect_requested) {
      conn->disconnect_requested = false;
      lock.unlock();
      close_session(conn, SshState::Disconnected);
      continue;
    }
    if(conn->connect_requested) {
      conn->connect_requested = false;
      lock.unlock();
      // a session that never reached Connected stays in Error until asked again
      connect_once(conn);
      continue;
    }
    if(conn->state != SshState::Connected) continue;

    if(!conn->pending.empty()) {
      auto stream = conn->pending.front();
      conn->pending.pop_front();
      conn->running = stream;
      lock.unlock();
      run_command(conn, stream);
      std::lock_guard<std::mutex> relock(conn->mutex);
      conn->running.reset();
      continue;
    }

    now = std::chrono::steady_clock::now();
    if(config_.idle_timeout.count() > 0 && now - conn->last_activity_steady >= config_.idle_timeout) {
      lock.unlock();
      logger_->info("{}: idle for {}s, disconnecting", conn->id, config_.idle_timeout.count());
      close_session(conn, SshState::Disconnected);
      continue;
    }
    if(config_.keepalive_interval.count() > 0 && now - conn->last_keepalive >= config_.keepalive_interval) {
      conn->last_keepalive = now;
      auto transport = conn->transport;
      lock.unlock();
      if(transport && !transport->alive()) {
        transition(conn, SshState::Error, {SshErrorKind::ConnectionLost, "keepalive failed"});
        close_session(conn, SshState::Error);
        auto_reconnect(conn);
      }
    }
  }
}

bool SshSessionManager::connect_once(const std::shared_ptr<Connection>& conn) {
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    conn->cancel_requested = false;
    conn->tcp_established = false;
  }
  transition(conn, SshState::Connecting);

  std::shared_ptr<SshTransport> transport(factory_());
  if(!transport) {
    transition(conn, SshState::Error, {SshErrorKind::ProtocolError, "no ssh transport available"});
    return false;
  }
  bool interrupt_now = false;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    conn->transport = transport;
    interrupt_now = conn->cancel_requested || conn->stop_requested || conn->disconnect_requested;
  }
  if(interrupt_now) transport->interrupt();

  auto timeout = conn->config.connect_timeout.count() > 0 ? conn->config.connect_timeout
                                                          : config_.connect_timeout;
  auto deadline = std::chrono::steady_clock::now() + timeout;

  auto abandon = [&]{
    transport->close();
    std::lock_guard<std::mutex> lock(conn->mutex);
    conn->transport.reset();
  };
  auto check_cancel = [&](bool& cancelled, bool& leaving){
    std::lock_guard<std::mutex> lock(conn->mutex);
    cancelled = conn->cancel_requested;
    leaving = conn->stop_requested || conn->disconnect_requested;
  };

  bool cancelled = false;
  bool leaving = false;
  auto err = transport->open(conn->config, deadline);
  check_cancel(cancelled, leaving);
  if(!err) {
    std::lock_guard<std::mutex> lock(conn->mutex);
    conn->tcp_established = true;
  }
  if(leaving) {
    abandon();
    return false;
  }
  if(cancelled) {
    abandon();
    if(err) {
      logger_->info("{}: connect cancelled before the tcp connection was made", conn->id);
      transition(conn, SshState::Idle);
    } else {
      transition(conn, SshState::Error, {SshErrorKind::Cancelled, "connect cancelled"});
    }
    return false;
  }
  if(err) {
    abandon();
    transition(conn, SshState::Error, err);
    return false;
  }

  err = transport->authenticate(conn->config, conn->secret, deadline);
  check_cancel(cancelled, leaving);
  if(leaving) {
    abandon();
    return false;
  }
  if(cancelled) {
    abandon();
    transition(conn, SshState::Error, {SshErrorKind::Cancelled, "connect cancelled"});
    return false;
  }
  if(err) {
    abandon();
    transition(conn, SshState::Error, err);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    conn->touch();
    conn->last_keepalive = std::chrono::steady_clock::now();
  }
  transition(conn, SshState::Connected);
  return true;
}

std::chrono::milliseconds SshSessionManager::backoff_delay(int attempt) const {
  auto delay = config_.reconnect_base;
  for(int i = 1; i < attempt && delay < config_.reconnect_cap; ++i) delay *= 2;
  return std::min(delay, config_.reconnect_cap);
}

void SshSessionManager::auto_reconnect(const std::shared_ptr<Connection>& conn) {
  if(!conn->config.auto_reconnect) return;
  const int max_attempts = conn->config.max_reconnect_attempts;
  for(int attempt = 1; attempt <= max_attempts; ++attempt) {
    auto delay = backoff_delay(attempt);
    {
      std::unique_lock<std::mutex> lock(conn->mutex);
      conn->reconnect_attempts = attempt;
      bool interrupted = conn->wake.wait_for(lock, delay, [&]{
        return conn->stop_requested || conn->disconnect_requested || conn->connect_requested;
      });
      if(interrupted) return;
    }
    logger_->info("{}: reconnect attempt {}/{}", conn->id, attempt, max_attempts);
    if(connect_once(conn)) {
      std::lock_guard<std::mutex> lock(conn->mutex);
      conn->reconnect_attempts = 0;
      return;
    }
    std::lock_guard<std::mutex> lock(conn->mutex);
    if(conn->stop_requested || conn->disconnect_requested) return;
    auto kind = conn->last_error.kind;
    if(kind == SshErrorKind::AuthenticationFailed || kind == SshErrorKind::Cancelled ||
       kind == SshErrorKind::InvalidConfig) {
      return;
    }
  }
  logger_->warn("{}: giving up after {} reconnect attempt(s)", conn->id, max_attempts);
}

void SshSessionManager::run_command(const std::shared_ptr<Connection>& conn,
                                    const std::shared_ptr<CommandStream>& stream) {
  if(stream->cancelled()) {
    stream->finish(std::nullopt, {SshErrorKind::Cancelled, "command cancelled"});
    return;
  }
  std::shared_ptr<SshTransport> transport;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    transport = conn->transport;
    conn->touch();
  }
  if(!transport) {
    stream->finish(std::nullopt, {SshErrorKind::NotConnected, "no session"});
    return;
  }
  logger_->debug("{}: running '{}'", conn->id, stream->command());

  int exit_status = 0;
  auto err = transport->execute(stream->command(),
    [&](OutputStream which, std::string data){
      if(stream->cancelled()) return;
      OutputChunk chunk;
      chunk.stream = which;
      chunk.data = std::move(data);
      chunk.at = std::chrono::system_clock::now();
      chunk.command_id = stream->id();
      record_output(conn, chunk);
      stream->push(chunk);
    },
    stream->cancel_, exit_status);

  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    conn->touch();
  }

  if(err.kind == SshErrorKind::ConnectionLost) {
    stream->finish(std::nullopt, err);
    transition(conn, SshState::Error, err);
    close_session(conn, SshState::Error);
    auto_reconnect(conn);
    return;
  }
  if(stream->cancelled()) {
    stream->finish(std::nullopt, {SshErrorKind::Cancelled, "command cancelled"});
    return;
  }
  if(err) {
    stream->finish(std::nullopt, err);
    return;
  }
  if(exit_status != 0) {
    OutputChunk marker;
    marker.stream = OutputStream::Stderr;
    marker.data = fmt::format("[exit status {}]\n", exit_status);
    marker.at = std::chrono::system_clock::now();
    marker.command_id = stream->id();
    marker.exit_status = exit_status;
    record_output(conn, marker);
    stream->push(marker);
    stream->finish(exit_status, {SshErrorKind::CommandFailed, fmt::format("exit status {}", exit_status)});
    return;
  }
  stream->finish(exit_status, {});
}

void SshSessionManager::record_output(const std::shared_ptr<Connection>& conn, const OutputChunk& chunk) {
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    conn->output.push_back(chunk);
    while(conn->output.size() > config_.output_buffer_chunks) conn->output.pop_front();
    conn->touch();
  }
  if(bus_) {
    OutputEvent payload;
    payload.connection_id = conn->id;
    payload.chunk = chunk;
    bus_->publish(make_event(EventType::OutputReceived, std::move(payload)));
  }
}

// Releases the session. final_state Disconnected walks through
// Disconnecting; Error just drops the handle and keeps the error state.
void SshSessionManager::close_session(const std::shared_ptr<Connection>& conn, SshState final_state) {
  SshState current;
  std::shared_ptr<SshTransport> transport;
  std::deque<std::shared_ptr<CommandStream>> pending;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    current = conn->state;
    transport = std::move(conn->transport);
    pending.swap(conn->pending);
  }
  auto reason = final_state == SshState::Error ? SshError{SshErrorKind::ConnectionLost, "connection lost"}
                                               : SshError{SshErrorKind::NotConnected, "disconnected"};
  for(auto& stream : pending) stream->finish(std::nullopt, reason);

  if(final_state == SshState::Error) {
    if(transport) transport->close();
    return;
  }
  if(current == SshState::Idle || current == SshState::Disconnected) {
    if(transport) transport->close();
    return;
  }
  transition(conn, SshState::Disconnecting);
  if(transport) transport->close();
  transition(conn, SshState::Disconnected);
}

void SshSessionManager::transition(const std::shared_ptr<Connection>& conn, SshState to, SshError error) {
  SshState from;
  {
    std::lock_guard<std::mutex> lock(conn->mutex);
    from = conn->state;
    if(from == to && !error) return;
    conn->state = to;
    if(to == SshState::Error) {
      conn->last_error = error;
    } else if(to == SshState::Connecting || to == SshState::Connected) {
      conn->last_error = {};
    }
  }
  conn->state_cv.notify_all();

  if(error) {
    logger_->warn("{}: {} -> {} ({}: {})", conn->id, to_string(from), to_string(to),
                  to_string(error.kind), error.reason);
  } else {
    logger_->info("{}: {} -> {}", conn->id, to_string(from), to_string(to));
  }
  if(bus_) {
    ConnectionStateEvent payload;
    payload.connection_id = conn->id;
    payload.from = from;
    payload.to = to;
    payload.error = std::move(error);
    bus_->publish(make_event(EventType::ConnectionStateChanged, std::move(payload)));
  }
}

SshProfile SshSessionManager::save_profile(SshProfile profile) {
  if(profile.id.empty()) profile.id = to_hex(random_uid()).substr(0, 8);
  if(profile.port == 0) profile.port = 22;
  std::lock_guard<std::mutex> lock(profiles_mutex_);
  auto it = std::find_if(profiles_.begin(), profiles_.end(),
                         [&](const SshProfile& p){ return p.id == profile.id; });
  if(it == profiles_.end()) profiles_.push_back(profile);
  else *it = profile;
  persist_profiles_locked();
  return profile;
}

bool SshSessionManager::delete_profile(const std::string& profile_id) {
  std::lock_guard<std::mutex> lock(profiles_mutex_);
  auto it = std::find_if(profiles_.begin(), profiles_.end(),
                         [&](const SshProfile& p){ return p.id == profile_id; });
  if(it == profiles_.end()) return false;
  profiles_.erase(it);
  persist_profiles_locked();
  return true;
}

std::vector<SshProfile> SshSessionManager::profiles() const {
  std::lock_guard<std::mutex> lock(profiles_mutex_);
  return profiles_;
}

std::optional<SshProfile> SshSessionManager::profile(const std::string& profile_id) const {
  std::lock_guard<std::mutex> lock(profiles_mutex_);
  for(const auto& p : profiles_) {
    if(p.id == profile_id) return p;
  }
  return std::nullopt;
}

std::string SshSessionManager::connect_from_profile(const std::string& profile_id,
                                                    const std::string& secret,
                                                    SshError& error) {
  auto p = profile(profile_id);
  if(!p) {
    error = {SshErrorKind::InvalidConfig, "no profile " + profile_id};
    return {};
  }
  SshConfig config;
  config.name = p->name;
  config.host = p->host;
  config.port = p->port;
  config.username = p->username;
  config.key_path = p->key_path;
  config.auth = p->key_path.empty() ? SshAuthMethod::Password : SshAuthMethod::PublicKey;
  return connect(config, secret, error);
}

void SshSessionManager::persist_profiles_locked() {
  if(!store_) return;
  std::string error;
  if(!store_->save(profiles_, error)) {
    logger_->warn("Unable to save ssh profiles: {}", error);
  }
}
