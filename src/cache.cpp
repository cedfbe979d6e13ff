#include "cache.h"

namespace dispatch {

std::string SnapshotCache::key_for(const std::optional<std::string>& skill_filter) {
  return skill_filter ? "skill:" + *skill_filter : std::string("*");
}

std::optional<RosterSnapshot> SnapshotCache::get(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = map_.find(key);
  if (it == map_.end()) return std::nullopt;

  // Move the node to the front (MRU)
  order_.splice(order_.begin(), order_, it->second.first);
  return it->second.second;
}

void SnapshotCache::put(const std::string& key, std::vector<Executor> executors) {
  std::lock_guard<std::mutex> lk(mu_);
  RosterSnapshot snap{std::move(executors), std::chrono::system_clock::now()};

  auto it = map_.find(key);
  if (it != map_.end()) {
    it->second.second = std::move(snap);
    order_.splice(order_.begin(), order_, it->second.first);
    return;
  }

  // Evict LRU if full
  if (map_.size() >= capacity_ && !order_.empty()) {
    map_.erase(order_.back());
    order_.pop_back();
  }

  order_.push_front(key);
  map_.emplace(key, std::make_pair(order_.begin(), std::move(snap)));
}

size_t SnapshotCache::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return map_.size();
}

}  // namespace dispatch
