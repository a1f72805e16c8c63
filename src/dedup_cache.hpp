#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <unordered_map>
#include <utility>

#include "utils.hpp"

// Recently seen message ids, bounded both by count and by age. Not
// thread-safe; the owner serializes access.
class DedupCache {
public:
  using Clock = std::chrono::steady_clock;

  DedupCache(std::size_t capacity, std::chrono::milliseconds window);

  // Records the id and returns true if it was not already present.
  bool check_and_insert(const Uid& id, Clock::time_point now);
  bool contains(const Uid& id) const { return seen_.count(id) != 0; }
  std::size_t size() const { return seen_.size(); }
  void clear();

private:
  void expire(Clock::time_point now);

  std::size_t capacity_;
  std::chrono::milliseconds window_;
  std::deque<std::pair<Uid, Clock::time_point>> order_;
  std::unordered_map<Uid, Clock::time_point, UidHash> seen_;
};
