#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <vector>

namespace {

constexpr const char* kLinePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct Sinks {
  std::shared_ptr<spdlog::logger> diagnostic; // info/debug/warn/error
  std::shared_ptr<spdlog::logger> plain_out;  // print
  std::shared_ptr<spdlog::logger> plain_err;  // print_err
};

std::mutex g_sinks_mutex;
Sinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

void build_sinks(const LogOptions& options) {
  std::vector<spdlog::sink_ptr> diagnostic_sinks;
  std::string file_error;
  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_pattern(kLinePattern);
  diagnostic_sinks.push_back(console);

  if(!options.log_file.empty()) {
    try {
      auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        options.log_file, options.log_file_max_bytes, options.log_file_count);
      file->set_pattern(kLinePattern);
      diagnostic_sinks.push_back(file);
    } catch(const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  auto out = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  out->set_pattern("%v");
  auto err = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  err->set_pattern("%v");

  Sinks sinks;
  sinks.diagnostic = std::make_shared<spdlog::logger>("ztalk",
    diagnostic_sinks.begin(), diagnostic_sinks.end());
  sinks.plain_out = std::make_shared<spdlog::logger>("ztalk.print", std::move(out));
  sinks.plain_err = std::make_shared<spdlog::logger>("ztalk.print_err", std::move(err));

  sinks.diagnostic->flush_on(spdlog::level::warn);
  sinks.plain_out->flush_on(spdlog::level::info);
  sinks.plain_err->flush_on(spdlog::level::err);

  auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  sinks.diagnostic->set_level(level);
  sinks.plain_out->set_level(spdlog::level::info);
  sinks.plain_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(sinks.diagnostic);
  spdlog::set_level(level);
  if(!file_error.empty()) {
    sinks.diagnostic->warn("unable to open log file {}: {}", options.log_file, file_error);
  }
  g_sinks = std::move(sinks);
}

Sinks current_sinks() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  if(!g_sinks.diagnostic) build_sinks(LogOptions{});
  return g_sinks;
}

} // namespace

void init(const LogOptions& options) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  build_sinks(options);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.clear();
}

bool Logger::has_listeners() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !listeners_.empty();
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default("error", "log", spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(const char* base_channel,
                  const std::string& logger_name,
                  spdlog::level::level_enum level,
                  const std::string& message) {
  detail::emit_to_default(base_channel, logger_name, level, message);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& logger_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  if(!log_passthrough()) return;
  auto sinks = current_sinks();

  if(std::strcmp(base_channel, "print") == 0) {
    sinks.plain_out->log(level, message);
    return;
  }
  if(std::strcmp(base_channel, "print_err") == 0) {
    sinks.plain_err->log(level, message);
    return;
  }
  if(logger_name.empty()) {
    sinks.diagnostic->log(level, message);
  } else {
    sinks.diagnostic->log(level, fmt::format("[{}] {}", logger_name, message));
  }
}

} // namespace detail
