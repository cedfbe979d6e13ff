#include "circuit_breaker.h"
#include "utils.h"

namespace dispatch {

CircuitBreaker::CircuitBreaker(std::string name, BreakerConfig cfg, ClockFn clock)
    : name_(std::move(name)), cfg_(cfg), clock_(clock ? std::move(clock) : ClockFn(steady_now)),
      in_flight_(cfg.max_in_flight) {}

void CircuitBreaker::open_locked() {
  state_ = BreakerState::Open;
  trial_in_flight_ = false;
  opened_at_ = clock_();
}

bool CircuitBreaker::allow_request() {
  std::lock_guard<std::mutex> lk(mu_);
  ++total_;
  switch (state_) {
    case BreakerState::Closed:
      return true;
    case BreakerState::Open: {
      const auto cooldown = std::chrono::duration<double>(cfg_.cooldown_seconds);
      if (clock_() - opened_at_ >= cooldown) {
        state_ = BreakerState::HalfOpen;
        trial_in_flight_ = true;
        log_warn("breaker", name_ + " cool-down elapsed, HALF_OPEN trial");
        return true;
      }
      ++rejected_;
      return false;
    }
    case BreakerState::HalfOpen:
      if (!trial_in_flight_) {
        trial_in_flight_ = true;
        return true;
      }
      ++rejected_;
      return false;
  }
  return false;
}

void CircuitBreaker::record_success() {
  std::lock_guard<std::mutex> lk(mu_);
  ++succeeded_;
  consecutive_failures_ = 0;
  if (state_ == BreakerState::HalfOpen) {
    state_ = BreakerState::Closed;
    trial_in_flight_ = false;
    log_warn("breaker", name_ + " recovered, CLOSED");
  }
}

void CircuitBreaker::record_failure(const std::string& error) {
  std::lock_guard<std::mutex> lk(mu_);
  ++failed_;
  ++consecutive_failures_;
  last_failure_ = std::chrono::system_clock::now();
  last_error_ = error;
  if (state_ == BreakerState::HalfOpen) {
    open_locked();
    log_warn("breaker", name_ + " trial failed, OPEN again: " + error);
  } else if (state_ == BreakerState::Closed && consecutive_failures_ >= cfg_.threshold) {
    open_locked();
    log_warn("breaker", name_ + " OPEN after " + std::to_string(consecutive_failures_) +
                            " consecutive failures: " + error);
  }
}

void CircuitBreaker::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  state_ = BreakerState::Closed;
  consecutive_failures_ = 0;
  trial_in_flight_ = false;
  log_warn("breaker", name_ + " manually reset");
}

void CircuitBreaker::force_open() {
  std::lock_guard<std::mutex> lk(mu_);
  open_locked();
  log_warn("breaker", name_ + " manually opened");
}

bool CircuitBreaker::trial_due() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ != BreakerState::Open) return false;
  return clock_() - opened_at_ >= std::chrono::duration<double>(cfg_.cooldown_seconds);
}

BreakerState CircuitBreaker::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

BreakerStatus CircuitBreaker::status() const {
  std::lock_guard<std::mutex> lk(mu_);
  BreakerStatus s;
  s.name = name_;
  s.state = state_;
  s.consecutive_failures = consecutive_failures_;
  s.failure_threshold = cfg_.threshold;
  s.cooldown_seconds = cfg_.cooldown_seconds;
  s.last_failure = last_failure_;
  s.last_error = last_error_;
  s.total_requests = total_;
  s.successful_requests = succeeded_;
  s.failed_requests = failed_;
  s.rejected_requests = rejected_;
  return s;
}

// ---------------- registry ----------------

BreakerRegistry::BreakerRegistry(std::map<std::string, BreakerConfig> configs, ClockFn clock)
    : configs_(std::move(configs)), clock_(clock ? std::move(clock) : ClockFn(steady_now)) {
  for (const auto& kv : configs_)
    breakers_.emplace(kv.first, std::make_unique<CircuitBreaker>(kv.first, kv.second, clock_));
}

CircuitBreaker& BreakerRegistry::get(const std::string& name) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = breakers_.find(name);
  if (it == breakers_.end()) {
    it = breakers_.emplace(name, std::make_unique<CircuitBreaker>(name, BreakerConfig{}, clock_)).first;
  }
  return *it->second;
}

bool BreakerRegistry::contains(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  return breakers_.count(name) > 0;
}

bool BreakerRegistry::reset(const std::string& name) {
  CircuitBreaker* b = nullptr;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = breakers_.find(name);
    if (it == breakers_.end()) return false;
    b = it->second.get();
  }
  b->reset();
  return true;
}

void BreakerRegistry::reset_all() {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& kv : breakers_) kv.second->reset();
}

std::map<std::string, BreakerStatus> BreakerRegistry::status() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::map<std::string, BreakerStatus> out;
  for (const auto& kv : breakers_) out.emplace(kv.first, kv.second->status());
  return out;
}

BreakerState BreakerRegistry::state_of(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = breakers_.find(name);
  return it == breakers_.end() ? BreakerState::Closed : it->second->state();
}

}  // namespace dispatch
