#include "resilience.h"
#include "fallback_data.h"

namespace dispatch {

ResilienceState::ResilienceState(std::map<std::string, BreakerConfig> breakers,
                                 ClockFn clock, size_t snapshot_cache_size)
    : breakers_(std::move(breakers), std::move(clock)), snapshots_(snapshot_cache_size) {}

ServiceMode ResilienceState::derived_mode() const {
  const bool tickets_open = breakers_.state_of(kDepTicketData) == BreakerState::Open;
  const bool roster_open = breakers_.state_of(kDepExecutorRoster) == BreakerState::Open;
  const bool perms_open = breakers_.state_of(kDepPermissionCheck) == BreakerState::Open;

  if (tickets_open && roster_open) return perms_open ? ServiceMode::Emergency : ServiceMode::Minimal;
  if (tickets_open || roster_open) return ServiceMode::Degraded;
  return ServiceMode::Full;
}

ServiceMode ResilienceState::mode() const {
  const ServiceMode derived = derived_mode();
  std::lock_guard<std::mutex> lk(mu_);
  const ServiceMode m = override_ ? override_->mode : derived;
  if (m != last_mode_) {
    log_warn("mode", std::string(to_string(last_mode_)) + " -> " + to_string(m) +
                         (override_ ? " (override: " + override_->reason + ")" : ""));
    last_mode_ = m;
  }
  return m;
}

void ResilienceState::set_override(ServiceMode mode, const std::string& reason) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    override_ = ModeOverride{mode, reason};
  }
  log_warn("mode", std::string("operator override ") + to_string(mode) + ": " + reason);
}

void ResilienceState::clear_override() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    override_.reset();
  }
  log_warn("mode", "operator override cleared");
}

std::optional<ModeOverride> ResilienceState::override_info() const {
  std::lock_guard<std::mutex> lk(mu_);
  return override_;
}

size_t ResilienceState::reserve_round_robin(size_t n) {
  std::lock_guard<std::mutex> lk(mu_);
  const size_t start = rr_cursor_;
  rr_cursor_ += n;
  return start;
}

// ---------------- layer ----------------

ResilienceLayer::ResilienceLayer(std::shared_ptr<ResilienceState> state, Collaborators collab,
                                 ResilienceOptions opts)
    : state_(std::move(state)),
      collab_(std::move(collab)),
      opts_(opts),
      async_sends_(state_->breakers().get(kDepNotification).config().max_in_flight) {}

PermissionResult ResilienceLayer::check_permission(const std::string& user_id,
                                                   const std::string& ticket_id,
                                                   ServiceMode mode) {
  auto svc = collab_.permissions;
  Guarded<bool> g = guarded_call<bool>(
      *state_, kDepPermissionCheck,
      [svc, user_id, ticket_id] { return svc->can_assign(user_id, ticket_id); },
      opts_.verbose);
  if (g.ok()) return {*g.value, false};

  const bool allow = opts_.permission_fail_open || mode == ServiceMode::Emergency;
  log_warn("permission", "check unavailable for " + user_id + "/" + ticket_id + ", " +
                             (allow ? "allowing" : "denying"));
  return {allow, true};
}

TicketFetch ResilienceLayer::fetch_ticket(const Ticket& supplied) {
  auto svc = collab_.tickets;
  const std::string id = supplied.id;
  Guarded<Ticket> g = guarded_call<Ticket>(
      *state_, kDepTicketData, [svc, id] { return svc->get_ticket(id); }, opts_.verbose);
  if (g.ok()) return {std::move(*g.value), false};
  return {supplied, true};
}

RosterFetch ResilienceLayer::fetch_roster(const std::optional<std::string>& skill_filter,
                                          ServiceMode mode) {
  const std::string key = SnapshotCache::key_for(skill_filter);
  CircuitBreaker& breaker = state_->breakers().get(kDepExecutorRoster);

  if (mode == ServiceMode::Full || breaker.trial_due()) {
    auto svc = collab_.roster;
    Guarded<std::vector<Executor>> g = guarded_call<std::vector<Executor>>(
        *state_, kDepExecutorRoster,
        [svc, skill_filter] { return svc->list_available_executors(skill_filter); },
        opts_.verbose);
    if (g.ok()) {
      state_->snapshots().put(key, *g.value);
      return {std::move(*g.value), false, "live"};
    }
  }

  if (auto snap = state_->snapshots().get(key)) {
    log_info(opts_.verbose, "resilience", "roster from snapshot '" + key + "'");
    return {std::move(snap->executors), true, "snapshot"};
  }
  log_info(opts_.verbose, "resilience",
           "roster from static fallback v" + std::to_string(FALLBACK_DATA_VERSION));
  return {fallback_executors(), true, "static"};
}

bool ResilienceLayer::commit(const std::string& ticket_id, const std::string& executor_id,
                             const std::map<std::string, std::string>& metadata) {
  auto store = collab_.store;
  Guarded<bool> g = guarded_call<bool>(
      *state_, kDepAssignmentCommit,
      [store, ticket_id, executor_id, metadata] {
        store->update_ticket_assignment(ticket_id, executor_id, metadata);
        return true;
      },
      opts_.verbose);
  return g.ok();
}

void ResilienceLayer::notify(const std::string& user_id, const std::string& message,
                             const std::string& priority) {
  auto state = state_;
  auto notifier = collab_.notifier;
  const bool verbose = opts_.verbose;
  auto send = [state, notifier, user_id, message, priority, verbose] {
    guarded_call<bool>(
        *state, kDepNotification,
        [notifier, user_id, message, priority] {
          notifier->notify(user_id, message, priority);
          return true;
        },
        verbose);
  };
  if (!opts_.notify_async) {
    send();
    return;
  }
  if (!async_sends_.try_acquire()) {
    log_info(verbose, "resilience", "notification backlog full, sending inline");
    send();
    return;
  }
  InFlightLimit slot = async_sends_;
  std::thread([send, slot]() mutable {
    send();
    slot.release();
  }).detach();
}

}  // namespace dispatch
