#include "ztalk_daemon.hpp"

#include <csignal>
#include <future>
#include <stdexcept>

#include "json_profile_store.hpp"
#include "libssh_transport.hpp"

ZtalkDaemon::ZtalkDaemon(DaemonConfig config, Options options)
  : config_(std::move(config)),
    options_(std::move(options)),
    logger_(std::make_shared<Logger>("ztalkd")),
    bus_(EventBus::create()) {
  if(is_nil(config_.peer_id)) {
    config_.peer_id = random_uid();
    logger_->warn("No peer_id configured, using ephemeral id {}", to_hex(config_.peer_id));
  }

  auto make_logger = [this](const char* name) {
    auto logger = std::make_shared<Logger>(name);
    component_loggers_.push_back(logger);
    return logger;
  };
  component_loggers_.push_back(logger_);

  registry_ = std::make_unique<PeerRegistry>(config_.registry, bus_, make_logger("registry"));
  transport_ = std::make_unique<Transport>(io_, config_.transport, make_logger("transport"));
  discovery_ = std::make_unique<DiscoveryEngine>(io_, *transport_, *registry_, config_.peer_id,
                                                 config_.display_name, config_.discovery,
                                                 make_logger("discovery"));
  router_ = std::make_unique<MessageRouter>(*transport_, *registry_, bus_, config_.peer_id,
                                            config_.router, make_logger("router"));

  auto ssh_logger = make_logger("ssh");
  auto factory = options_.ssh_transport_factory;
  if(!factory) factory = LibsshTransport::factory(ssh_logger);
  auto store = options_.profile_store;
  if(!store && !config_.ssh_profiles_file.empty()) {
    store = std::make_shared<JsonProfileStore>(config_.ssh_profiles_file, make_logger("profiles"));
  }
  ssh_ = std::make_unique<SshSessionManager>(config_.ssh, std::move(factory), bus_,
                                             std::move(store), ssh_logger);

  transport_->set_datagram_handler(
    [this](DatagramType type, const uint8_t* body, std::size_t size, const PeerAddress& from){
      switch(type) {
        case DatagramType::Beacon:
          discovery_->handle_beacon(body, size, from);
          break;
        case DatagramType::Message:
          router_->handle_datagram(body, size, from);
          break;
      }
    });
  transport_->set_frame_handler(
    [this](const uint8_t* body, std::size_t size, const PeerAddress& from){
      router_->handle_frame(body, size, from);
    });
}

ZtalkDaemon::~ZtalkDaemon() {
  stop();
}

void ZtalkDaemon::start() {
  if(started_) return;

  transport_->start();
  discovery_->start();
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = false;
  }
  if(options_.handle_signals) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    wait_for_signals();
  }
  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
    asio::make_work_guard(io_));
  io_thread_ = std::thread([this]{
    try {
      io_.run();
    } catch(const std::exception& e) {
      logger_->error("io thread stopped: {}", e.what());
      io_.stop();
      request_stop();
    }
  });
  started_ = true;
  logger_->info("peer {} '{}' listening on tcp port {}", to_hex(config_.peer_id),
                config_.display_name, transport_->tcp_port());
}

void ZtalkDaemon::wait_for_signals() {
  signals_->async_wait([this](const std::error_code& ec, int signo){
    if(ec) return;
    logger_->info("signal {} received, stopping", signo);
    request_stop();
  });
}

void ZtalkDaemon::run() {
  if(!started_) start();
  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_cv_.wait(lock, [this]{ return stop_requested_; });
  lock.unlock();
  stop();
}

void ZtalkDaemon::request_stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
}

void ZtalkDaemon::shutdown_on_io_thread() {
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  discovery_->stop();
  transport_->stop();
}

void ZtalkDaemon::stop() {
  if(!started_.exchange(false)) return;

  if(io_.stopped()) {
    shutdown_on_io_thread();
  } else {
    std::promise<void> done;
    auto finished = done.get_future();
    asio::post(io_, [this, &done]{
      shutdown_on_io_thread();
      done.set_value();
    });
    finished.wait();
  }

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) io_thread_.join();
  io_.restart();
  signals_.reset();

  ssh_->shutdown();
  request_stop();
  logger_->info("stopped");
}

std::shared_ptr<Subscription> ZtalkDaemon::subscribe(std::vector<EventType> types, std::size_t capacity) {
  return bus_->subscribe(std::move(types), capacity);
}

std::shared_ptr<const PeerRegistry::PeerList> ZtalkDaemon::peers() const {
  return registry_->snapshot();
}

std::optional<Peer> ZtalkDaemon::peer(const PeerId& id) const {
  return registry_->find(id);
}

std::optional<Peer> ZtalkDaemon::resolve_peer(const std::string& token) const {
  if(token.empty()) return std::nullopt;
  if(auto id = uid_from_hex(token)) return registry_->find(*id);

  auto snapshot = registry_->snapshot();
  std::optional<Peer> match;
  int matches = 0;
  for(const auto& p : *snapshot) {
    if(to_hex(p.id).compare(0, token.size(), token) == 0 || p.display_name == token) {
      match = p;
      ++matches;
    }
  }
  if(matches != 1) return std::nullopt;
  return match;
}

void ZtalkDaemon::set_display_name(std::string name) {
  config_.display_name = name;
  discovery_->set_display_name(std::move(name));
}

std::string ZtalkDaemon::display_name() const {
  return discovery_->display_name();
}

Message ZtalkDaemon::send_message(MessageKind kind,
                                  std::string content,
                                  std::optional<PeerId> recipient,
                                  std::optional<GroupId> group,
                                  DeliveryCallback callback) {
  return router_->send(kind, std::move(content), recipient, group, std::move(callback));
}

Group ZtalkDaemon::create_group(const std::string& name, const std::vector<PeerId>& members) {
  return router_->create_group(name, members);
}

std::vector<Group> ZtalkDaemon::groups() const {
  return router_->groups();
}

std::vector<Message> ZtalkDaemon::history(const ConversationKey& key, std::size_t limit) const {
  return router_->history(key, limit);
}

std::string ZtalkDaemon::connect_ssh(const SshConfig& config, const std::string& secret, SshError& error) {
  return ssh_->connect(config, secret, error);
}

std::shared_ptr<CommandStream> ZtalkDaemon::execute_command(const std::string& connection_id,
                                                            const std::string& command,
                                                            SshError& error) {
  return ssh_->execute(connection_id, command, error);
}

SshError ZtalkDaemon::disconnect_ssh(const std::string& connection_id) {
  return ssh_->disconnect(connection_id);
}

std::vector<SshConnectionInfo> ZtalkDaemon::ssh_connections() const {
  return ssh_->connections();
}

std::vector<SshProfile> ZtalkDaemon::ssh_profiles() const {
  return ssh_->profiles();
}

uint16_t ZtalkDaemon::tcp_port() const {
  return transport_->tcp_port();
}

LogListenerHandle ZtalkDaemon::add_log_listener(Logger::Listener listener, void* user_data) {
  std::vector<LogListenerHandle> handles;
  for(auto& logger : component_loggers_) {
    handles.push_back(logger->add_listener(listener, user_data));
  }
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  auto handle = next_listener_++;
  listeners_.emplace_back(handle, std::move(handles));
  return handle;
}

void ZtalkDaemon::remove_log_listener(LogListenerHandle handle) {
  std::vector<LogListenerHandle> handles;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for(auto it = listeners_.begin(); it != listeners_.end(); ++it) {
      if(it->first == handle) {
        handles = std::move(it->second);
        listeners_.erase(it);
        break;
      }
    }
  }
  for(std::size_t i = 0; i < handles.size() && i < component_loggers_.size(); ++i) {
    component_loggers_[i]->remove_listener(handles[i]);
  }
}
