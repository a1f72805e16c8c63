#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "events.hpp"
#include "log.hpp"

class EventBus;

// A bounded queue of events for one observer. When the queue is full the
// oldest event is dropped; publishers never block on a slow reader.
class Subscription {
public:
  ~Subscription();

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  // Waits up to timeout for the next event. Empty on timeout or once closed
  // and drained.
  std::optional<Event> next(std::chrono::milliseconds timeout);
  std::optional<Event> try_next();

  uint64_t dropped() const;
  std::size_t pending() const;
  bool closed() const;
  void close();

  bool wants(EventType type) const;

private:
  friend class EventBus;
  Subscription(std::weak_ptr<EventBus> bus, uint64_t id,
               uint32_t type_mask, std::size_t capacity);

  // Returns true when an old event was dropped and a warning is due;
  // dropped_total then holds the running count.
  bool push(const Event& event, uint64_t& dropped_total);

  std::weak_ptr<EventBus> bus_;
  const uint64_t id_;
  const uint32_t type_mask_;
  const std::size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Event> queue_;
  uint64_t dropped_ = 0;
  bool closed_ = false;
  std::chrono::steady_clock::time_point last_drop_warning_{};
};

class EventBus : public std::enable_shared_from_this<EventBus> {
public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  static std::shared_ptr<EventBus> create();

  void publish(const Event& event);

  // An empty type list subscribes to everything.
  std::shared_ptr<Subscription> subscribe(std::vector<EventType> types = {},
                                          std::size_t capacity = kDefaultCapacity);

  std::size_t subscriber_count() const;

private:
  friend class Subscription;
  EventBus();
  void unsubscribe(uint64_t id);

  mutable std::mutex mutex_;
  struct Entry {
    uint64_t id = 0;
    std::weak_ptr<Subscription> subscription;
  };
  std::vector<Entry> subscribers_;
  uint64_t next_id_ = 1;
  std::shared_ptr<Logger> logger_;
};
