#include "dedup_cache.hpp"

DedupCache::DedupCache(std::size_t capacity, std::chrono::milliseconds window)
  : capacity_(capacity == 0 ? 1 : capacity),
    window_(window) {}

bool DedupCache::check_and_insert(const Uid& id, Clock::time_point now) {
  expire(now);
  if(seen_.count(id)) return false;
  seen_.emplace(id, now);
  order_.emplace_back(id, now);
  while(order_.size() > capacity_) {
    seen_.erase(order_.front().first);
    order_.pop_front();
  }
  return true;
}

void DedupCache::clear() {
  order_.clear();
  seen_.clear();
}

void DedupCache::expire(Clock::time_point now) {
  while(!order_.empty() && now - order_.front().second >= window_) {
    seen_.erase(order_.front().first);
    order_.pop_front();
  }
}
