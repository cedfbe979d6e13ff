#include "facade.h"
#include "fallback_data.h"

#include <sstream>

namespace dispatch {

namespace {

const Collaborators& require(const Collaborators& c) {
  if (!c.permissions || !c.tickets || !c.roster || !c.store || !c.notifier)
    throw InvalidConfiguration("AssignmentFacade needs all five collaborators");
  return c;
}

ResilienceOptions resilience_options(const EngineConfig& cfg) {
  ResilienceOptions o;
  o.permission_fail_open = cfg.permission_fail_open;
  o.notify_async = cfg.notify_async;
  o.verbose = cfg.verbose;
  return o;
}

std::shared_ptr<ResilienceState> make_state(const EngineConfig& cfg) {
  return std::make_shared<ResilienceState>(cfg.breakers, steady_now, cfg.snapshot_cache_size);
}

}  // namespace

const char* notification_priority(int urgency) {
  if (urgency >= 5) return "critical";
  if (urgency >= 4) return "high";
  return "normal";
}

AssignmentFacade::AssignmentFacade(EngineConfig cfg, Collaborators collab,
                                   std::shared_ptr<ResilienceState> state)
    : cfg_((validate_config(cfg), std::move(cfg))),
      scorer_(cfg_.scoring, GeoIndex(cfg_.geo)),
      dispatcher_(scorer_),
      optimizer_(scorer_, cfg_.optimizer),
      state_(state ? std::move(state) : make_state(cfg_)),
      layer_(state_, require(collab), resilience_options(cfg_)) {}

AssignmentDecision AssignmentFacade::assign_one(const Ticket& ticket,
                                                const std::string& requesting_user) {
  const long long t0 = NowMillis();
  const ServiceMode mode = state_->mode();

  const PermissionResult perm = layer_.check_permission(requesting_user, ticket.id, mode);
  if (!perm.allowed) {
    AssignmentDecision d;
    d.ticket_id = ticket.id;
    d.service_mode = mode;
    d.weights = scorer_.weights_for({mode, false});
    d.reason = perm.fallback_used ? kReasonPermissionUnavailable : kReasonPermissionDenied;
    d.fallback_used = perm.fallback_used;
    d.duration_ms = NowMillis() - t0;
    log_info(cfg_.verbose, "dispatcher", ticket.id + " refused for " + requesting_user + ": " + d.reason);
    return d;
  }

  const TicketFetch tf = layer_.fetch_ticket(ticket);
  const RosterFetch roster = layer_.fetch_roster(std::nullopt, mode);

  AssignmentDecision d;
  if (mode == ServiceMode::Emergency) {
    d = dispatcher_.assign_round_robin(tf.ticket, roster.executors, state_->reserve_round_robin(1));
  } else {
    d = dispatcher_.assign(tf.ticket, roster.executors, ScoringContext{mode, false});
  }
  d.fallback_used = perm.fallback_used || tf.fallback_used || roster.fallback_used;

  if (d.assigned()) commit_and_notify(tf.ticket, d);
  d.duration_ms = NowMillis() - t0;

  if (cfg_.verbose) {
    std::ostringstream oss;
    oss << d.ticket_id << " -> " << d.executor_id
        << (d.assigned() ? "" : " (" + d.reason + ")")
        << " score=" << fmt_double(d.score)
        << " mode=" << to_string(mode)
        << " roster=" << roster.source
        << (d.fallback_used ? " fallback" : "")
        << " ms=" << d.duration_ms;
    log_info("dispatcher", oss.str());
  }
  return d;
}

std::vector<AssignmentDecision> AssignmentFacade::assign_batch(const std::vector<Ticket>& tickets,
                                                               std::optional<Algorithm> algorithm) {
  const long long t0 = NowMillis();
  // The budget covers the roster fetch too.
  const Deadline deadline = Deadline::in_ms(cfg_.request_budget_ms);
  const ServiceMode mode = state_->mode();
  if (tickets.empty()) return {};

  const RosterFetch roster = layer_.fetch_roster(std::nullopt, mode);

  OptimizeOptions opts;
  opts.algorithm = algorithm;
  opts.seed = cfg_.rng_seed;
  opts.deadline = deadline;
  opts.mode = mode;
  if (mode == ServiceMode::Emergency) opts.round_robin_start = state_->reserve_round_robin(tickets.size());

  BatchResult res = optimizer_.optimize(tickets, roster.executors, opts);
  for (size_t i = 0; i < res.decisions.size(); ++i) {
    AssignmentDecision& d = res.decisions[i];
    d.fallback_used = roster.fallback_used;
    if (d.assigned()) commit_and_notify(tickets[i], d);
  }

  const long long elapsed = NowMillis() - t0;
  for (auto& d : res.decisions) d.duration_ms = elapsed;
  log_info(cfg_.verbose, "dispatcher",
           "batch of " + std::to_string(tickets.size()) + " via " + to_string(res.algorithm) +
               " roster=" + roster.source + " ms=" + std::to_string(elapsed));
  return std::move(res.decisions);
}

std::vector<CandidateScore> AssignmentFacade::recommend(const Ticket& ticket, size_t top_n) {
  const ServiceMode mode = state_->mode();
  const RosterFetch roster = layer_.fetch_roster(std::nullopt, mode);
  return dispatcher_.rank(ticket, roster.executors, ScoringContext{mode, false}, top_n);
}

void AssignmentFacade::commit_and_notify(const Ticket& ticket, AssignmentDecision& d) {
  const std::map<std::string, std::string> metadata = {
      {"algorithm", to_string(d.algorithm)},
      {"score", fmt_double(d.score, 6)},
      {"service_mode", to_string(d.service_mode)},
      {"fallback_used", d.fallback_used ? "true" : "false"},
  };
  d.committed = layer_.commit(d.ticket_id, d.executor_id, metadata);
  if (!d.committed) {
    log_warn("dispatcher", "commit of " + d.ticket_id + " -> " + d.executor_id + " not confirmed");
  }

  std::ostringstream msg;
  msg << "Ticket " << ticket.id << " (" << ticket.category << ", urgency " << ticket.urgency;
  if (!ticket.zone.empty()) msg << ", " << ticket.zone;
  msg << ") assigned to you";
  layer_.notify(d.executor_id, msg.str(), notification_priority(ticket.urgency));
}

ServiceMode AssignmentFacade::service_mode() const { return state_->mode(); }

void AssignmentFacade::set_service_mode(ServiceMode mode, const std::string& reason) {
  state_->set_override(mode, reason);
}

void AssignmentFacade::clear_service_mode_override() { state_->clear_override(); }

std::map<std::string, BreakerStatus> AssignmentFacade::circuit_breaker_status() const {
  return state_->breakers().status();
}

bool AssignmentFacade::reset_circuit_breaker(const std::string& name) {
  return state_->breakers().reset(name);
}

std::vector<RoutePlan> AssignmentFacade::plan_routes(const std::vector<AssignmentDecision>& decisions,
                                                     const std::vector<Ticket>& tickets) {
  const RosterFetch roster = layer_.fetch_roster(std::nullopt, state_->mode());
  RouteSolveParams params;
  params.time_limit_seconds = cfg_.geo.route_time_limit_seconds;
  params.log_search = cfg_.verbose;
  return dispatch::plan_routes(scorer_.geo(), decisions, tickets, roster.executors,
                               cfg_.geo.refine_routes, params);
}

std::vector<ZoneCluster> AssignmentFacade::cluster_tickets(const std::vector<Ticket>& tickets) const {
  std::vector<ZoneCluster> clusters = scorer_.geo().cluster_by_zone(tickets);
  if (cfg_.verbose) {
    std::ostringstream oss;
    oss << clusters.size() << " zone clusters:";
    for (const auto& c : clusters) oss << " " << (c.zone.empty() ? "-" : c.zone) << "=" << c.ticket_ids.size();
    log_info("geo", oss.str());
  }
  return clusters;
}

std::vector<ZoneDemand> AssignmentFacade::zone_demand(const std::vector<Ticket>& tickets) {
  const RosterFetch roster = layer_.fetch_roster(std::nullopt, state_->mode());
  return scorer_.geo().zone_demand(tickets, cfg_.geo.coverage_radius_km,
                                   static_cast<int>(roster.executors.size()));
}

HealthReport AssignmentFacade::health() const {
  HealthReport h;
  h.mode = state_->mode();
  h.override_info = state_->override_info();
  for (const auto& kv : state_->breakers().status()) {
    if (kv.second.state != BreakerState::Closed) h.unhealthy.push_back(kv.first);
  }
  h.fallback_data_version = FALLBACK_DATA_VERSION;
  h.cached_snapshots = state_->snapshots().size();
  return h;
}

}  // namespace dispatch
