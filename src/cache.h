// cache.h
#pragma once
#include "types.h"

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dispatch {

// Last good live roster per skill filter ("*" = unfiltered).
struct RosterSnapshot {
  std::vector<Executor> executors;
  std::chrono::system_clock::time_point captured_at;
};

// LRU of roster snapshots, used when the live roster is not trusted.
// Shared across requests, so it carries its own lock.
class SnapshotCache {
 public:
  explicit SnapshotCache(size_t capacity = 16) : capacity_(capacity ? capacity : 1) {}

  static std::string key_for(const std::optional<std::string>& skill_filter);

  std::optional<RosterSnapshot> get(const std::string& key);
  void put(const std::string& key, std::vector<Executor> executors);

  size_t size() const;
  size_t capacity() const { return capacity_; }

 private:
  using ListIt = std::list<std::string>::iterator;

  const size_t capacity_;
  mutable std::mutex mu_;
  std::list<std::string> order_;   // front = most recently used
  std::unordered_map<std::string, std::pair<ListIt, RosterSnapshot>> map_;
};

}  // namespace dispatch
