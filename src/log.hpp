#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

struct LogOptions {
  bool verbose = false;
  // Empty keeps console-only logging.
  std::string log_file;
  std::size_t log_file_max_bytes = 5 * 1024 * 1024;
  std::size_t log_file_count = 3;
};

void init(const LogOptions& options = LogOptions{});
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// Named front end over the shared spdlog sinks. Listeners see every line
// first; a listener returning true consumes the line.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  void set_name(std::string name);
  std::string name() const;

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if(!spdlog::should_log(spdlog::level::debug) && !has_listeners()) return;
    log("debug", spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log("info", spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log("warn", spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log("error", spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log("print", spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log("print_err", spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

private:
  template<typename... Args>
  void log(const char* channel,
           spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    auto prefix = name();
    if(dispatch(prefix.empty() ? std::string(channel) : prefix + ":" + channel,
                level, formatted)) {
      return;
    }
    emit(channel, prefix, level, formatted);
  }

  bool has_listeners() const;
  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);
  static void emit(const char* base_channel,
                   const std::string& logger_name,
                   spdlog::level::level_enum level,
                   const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  mutable std::mutex mutex_;
  std::string name_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void emit_to_default(const char* base_channel,
                     const std::string& logger_name,
                     spdlog::level::level_enum level,
                     const std::string& message);
} // namespace detail

template<typename... Args>
inline void print_out(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->print(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_default("print", "", spdlog::level::info,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void print_err(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->print_err(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_default("print_err", "", spdlog::level::err,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }
}
