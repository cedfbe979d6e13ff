// resilience.h
#pragma once
#include "cache.h"
#include "circuit_breaker.h"
#include "collaborators.h"
#include "errors.h"
#include "types.h"
#include "utils.h"

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dispatch {

struct ModeOverride {
  ServiceMode mode = ServiceMode::Full;
  std::string reason;
};

// Process-wide mutable state of the engine: breakers, operator override,
// round-robin cursor and roster snapshots. Pass one instance to every facade
// that should share it; tests build isolated ones.
class ResilienceState {
 public:
  explicit ResilienceState(std::map<std::string, BreakerConfig> breakers,
                           ClockFn clock = steady_now,
                           size_t snapshot_cache_size = 16);

  BreakerRegistry& breakers() { return breakers_; }
  const BreakerRegistry& breakers() const { return breakers_; }
  SnapshotCache& snapshots() { return snapshots_; }

  // Override if set, else derived from the data-source breakers.
  ServiceMode mode() const;
  ServiceMode derived_mode() const;

  void set_override(ServiceMode mode, const std::string& reason);
  void clear_override();
  std::optional<ModeOverride> override_info() const;

  // Returns the cursor for the first of `n` consecutive round-robin picks.
  size_t reserve_round_robin(size_t n);

 private:
  BreakerRegistry breakers_;
  SnapshotCache snapshots_;

  mutable std::mutex mu_;   // override, cursor, last reported mode
  std::optional<ModeOverride> override_;
  size_t rr_cursor_ = 0;
  mutable ServiceMode last_mode_ = ServiceMode::Full;
};

// Outcome of one guarded external call. value is empty on failure,
// short-circuit or timeout; error says which.
template <typename T>
struct Guarded {
  std::optional<T> value;
  std::string error;
  bool short_circuited = false;

  bool ok() const { return value.has_value(); }
};

// Runs fn, giving up after timeout_ms (<= 0 runs it inline). A call that
// times out keeps running on its own thread, holding a slot of `limit` until
// it returns; its result is dropped. No thread is started once the limit is full.
template <typename T>
T run_with_timeout(const std::string& dependency, int timeout_ms, std::function<T()> fn,
                   InFlightLimit limit = InFlightLimit()) {
  if (timeout_ms <= 0) return fn();
  if (!limit.try_acquire())
    throw DependencyUnavailable(dependency, std::to_string(limit.max()) + " calls still in flight");
  auto task = std::make_shared<std::packaged_task<T()>>(std::move(fn));
  std::future<T> fut = task->get_future();
  std::thread([task, limit]() mutable {
    (*task)();
    limit.release();
  }).detach();
  if (fut.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready)
    throw DependencyUnavailable(dependency, "timed out after " + std::to_string(timeout_ms) + " ms");
  return fut.get();
}

// Breaker check, timeout and outcome bookkeeping around one external call.
// Failures of any type are recorded and logged, never rethrown.
template <typename T>
Guarded<T> guarded_call(ResilienceState& state, const std::string& dependency,
                        std::function<T()> fn, bool verbose) {
  Guarded<T> g;
  CircuitBreaker& breaker = state.breakers().get(dependency);
  if (!breaker.allow_request()) {
    g.short_circuited = true;
    g.error = "circuit open";
    log_info(verbose, "resilience", dependency + " short-circuited");
    return g;
  }
  try {
    g.value = run_with_timeout<T>(dependency, breaker.config().timeout_ms, std::move(fn),
                                  breaker.in_flight_limit());
    breaker.record_success();
  } catch (const std::exception& e) {
    breaker.record_failure(e.what());
    g.error = e.what();
    log_warn("resilience", dependency + " failed: " + e.what());
  } catch (...) {
    breaker.record_failure("unknown error");
    g.error = "unknown error";
    log_warn("resilience", dependency + " failed: unknown error");
  }
  return g;
}

struct ResilienceOptions {
  bool permission_fail_open = false;
  bool notify_async = true;
  bool verbose = false;
};

struct PermissionResult {
  bool allowed = false;
  bool fallback_used = false;   // decided by policy, not by the service
};

struct TicketFetch {
  Ticket ticket;
  bool fallback_used = false;   // caller-supplied copy used
};

struct RosterFetch {
  std::vector<Executor> executors;
  bool fallback_used = false;
  std::string source;           // "live", "snapshot" or "static"
};

// Every call the engine makes to a collaborator goes through here.
class ResilienceLayer {
 public:
  ResilienceLayer(std::shared_ptr<ResilienceState> state, Collaborators collab,
                  ResilienceOptions opts);

  // When the service is unavailable: allow in EMERGENCY mode or when
  // configured fail-open, deny otherwise.
  PermissionResult check_permission(const std::string& user_id, const std::string& ticket_id,
                                    ServiceMode mode);

  // Canonical ticket from the ticket service, or `supplied` if it is unavailable.
  TicketFetch fetch_ticket(const Ticket& supplied);

  // Live roster in FULL mode (or as a breaker trial), else snapshot, else static list.
  RosterFetch fetch_roster(const std::optional<std::string>& skill_filter, ServiceMode mode);

  bool commit(const std::string& ticket_id, const std::string& executor_id,
              const std::map<std::string, std::string>& metadata);

  // Sent on a detached thread when notify_async is set, inline once the
  // notification breaker's max_in_flight async sends are pending.
  void notify(const std::string& user_id, const std::string& message, const std::string& priority);

  ResilienceState& state() { return *state_; }

 private:
  std::shared_ptr<ResilienceState> state_;
  Collaborators collab_;
  ResilienceOptions opts_;
  InFlightLimit async_sends_;
};

}  // namespace dispatch
