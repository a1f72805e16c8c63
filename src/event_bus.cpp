#include "event_bus.hpp"

#include <algorithm>

namespace {

constexpr auto kDropWarningInterval = std::chrono::seconds(5);

uint32_t mask_for(const std::vector<EventType>& types) {
  if(types.empty()) return 0xFFFFFFFFu;
  uint32_t mask = 0;
  for(auto t : types) mask |= 1u << static_cast<uint32_t>(t);
  return mask;
}

} // namespace

Subscription::Subscription(std::weak_ptr<EventBus> bus, uint64_t id,
                           uint32_t type_mask, std::size_t capacity)
  : bus_(std::move(bus)),
    id_(id),
    type_mask_(type_mask),
    capacity_(capacity == 0 ? 1 : capacity) {
}

Subscription::~Subscription() {
  close();
}

bool Subscription::wants(EventType type) const {
  return (type_mask_ >> static_cast<uint32_t>(type)) & 1u;
}

bool Subscription::push(const Event& event, uint64_t& dropped_total) {
  bool warn = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(closed_) return false;
    if(queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
      auto now = std::chrono::steady_clock::now();
      if(dropped_ == 1 || now - last_drop_warning_ >= kDropWarningInterval) {
        last_drop_warning_ = now;
        dropped_total = dropped_;
        warn = true;
      }
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
  return warn;
}

std::optional<Event> Subscription::next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]{ return !queue_.empty() || closed_; });
  if(queue_.empty()) return std::nullopt;
  auto e = std::move(queue_.front());
  queue_.pop_front();
  return e;
}

std::optional<Event> Subscription::try_next() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(queue_.empty()) return std::nullopt;
  auto e = std::move(queue_.front());
  queue_.pop_front();
  return e;
}

uint64_t Subscription::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::size_t Subscription::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool Subscription::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

void Subscription::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(closed_) return;
    closed_ = true;
  }
  cv_.notify_all();
  if(auto bus = bus_.lock()) {
    bus->unsubscribe(id_);
  }
}

std::shared_ptr<EventBus> EventBus::create() {
  return std::shared_ptr<EventBus>(new EventBus());
}

EventBus::EventBus()
  : logger_(std::make_shared<Logger>("event-bus")) {
}

void EventBus::publish(const Event& event) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(subscribers_.size());
    for(auto& entry : subscribers_) {
      if(auto sub = entry.subscription.lock()) {
        if(sub->wants(event.type)) targets.push_back(std::move(sub));
      }
    }
  }
  for(auto& sub : targets) {
    uint64_t dropped_total = 0;
    if(sub->push(event, dropped_total)) {
      logger_->warn("subscriber {} is falling behind, {} event(s) dropped so far",
                    sub->id_, dropped_total);
    }
  }
}

std::shared_ptr<Subscription> EventBus::subscribe(std::vector<EventType> types,
                                                  std::size_t capacity) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto id = next_id_++;
  auto sub = std::shared_ptr<Subscription>(
    new Subscription(weak_from_this(), id, mask_for(types), capacity));
  subscribers_.push_back(Entry{id, sub});
  return sub;
}

std::size_t EventBus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
    [](const Entry& e){ return !e.subscription.expired(); }));
}

void EventBus::unsubscribe(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                    [id](const Entry& e){ return e.id == id; }),
                     subscribers_.end());
}
