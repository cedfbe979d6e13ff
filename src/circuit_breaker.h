// circuit_breaker.h
#pragma once
#include "types.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace dispatch {

using SteadyClock = std::chrono::steady_clock;
using ClockFn = std::function<SteadyClock::time_point()>;

inline SteadyClock::time_point steady_now() { return SteadyClock::now(); }

struct BreakerConfig {
  int threshold = 5;             // consecutive failures before opening
  double cooldown_seconds = 60;  // OPEN -> HALF_OPEN after this long
  int timeout_ms = 0;            // per-call timeout, 0 = run inline without one
  int max_in_flight = 8;         // timeout threads alive at once, abandoned ones included
};

// Counts calls running on their own timeout threads. Copies share the
// counter, so a detached thread can release its slot after the owner is gone.
class InFlightLimit {
 public:
  explicit InFlightLimit(int max = 0) : max_(max), count_(std::make_shared<std::atomic<int>>(0)) {}

  // max <= 0 means unlimited.
  bool try_acquire() {
    if (count_->fetch_add(1) >= max_ && max_ > 0) {
      count_->fetch_sub(1);
      return false;
    }
    return true;
  }
  void release() { count_->fetch_sub(1); }

  int in_flight() const { return count_->load(); }
  int max() const { return max_; }

 private:
  int max_;
  std::shared_ptr<std::atomic<int>> count_;
};

// CLOSED -> OPEN after `threshold` consecutive failures; OPEN rejects calls
// until the cool-down has elapsed, then admits exactly one trial call
// (HALF_OPEN). The trial's outcome closes or re-opens the breaker.
class CircuitBreaker {
 public:
  CircuitBreaker(std::string name, BreakerConfig cfg, ClockFn clock = steady_now);

  // Whether a call may proceed now. Moves OPEN -> HALF_OPEN once cooled down.
  bool allow_request();
  void record_success();
  void record_failure(const std::string& error);

  void reset();
  void force_open();

  // OPEN with the cool-down elapsed: the next allow_request() is a trial.
  bool trial_due() const;

  BreakerState state() const;
  BreakerStatus status() const;
  const std::string& name() const { return name_; }
  const BreakerConfig& config() const { return cfg_; }
  InFlightLimit in_flight_limit() const { return in_flight_; }

 private:
  void open_locked();

  const std::string name_;
  const BreakerConfig cfg_;
  ClockFn clock_;
  InFlightLimit in_flight_;

  mutable std::mutex mu_;
  BreakerState state_ = BreakerState::Closed;
  int consecutive_failures_ = 0;
  bool trial_in_flight_ = false;
  SteadyClock::time_point opened_at_{};
  std::optional<std::chrono::system_clock::time_point> last_failure_;
  std::string last_error_;
  long long total_ = 0, succeeded_ = 0, failed_ = 0, rejected_ = 0;
};

// Named breakers, one per dependency. Unknown names are created on first use
// with the default BreakerConfig.
class BreakerRegistry {
 public:
  BreakerRegistry(std::map<std::string, BreakerConfig> configs, ClockFn clock = steady_now);

  CircuitBreaker& get(const std::string& name);
  bool contains(const std::string& name) const;
  bool reset(const std::string& name);
  void reset_all();

  std::map<std::string, BreakerStatus> status() const;
  BreakerState state_of(const std::string& name) const;  // Closed if unknown

 private:
  mutable std::mutex mu_;   // guards the map only; each breaker has its own lock
  std::map<std::string, BreakerConfig> configs_;
  ClockFn clock_;
  std::map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
};

}  // namespace dispatch
