// facade.h
#pragma once
#include "collaborators.h"
#include "config.h"
#include "dispatcher.h"
#include "optimizer.h"
#include "resilience.h"
#include "route_solver.h"
#include "scoring.h"
#include "types.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dispatch {

struct HealthReport {
  ServiceMode mode = ServiceMode::Full;
  std::optional<ModeOverride> override_info;
  std::vector<std::string> unhealthy;   // breakers not CLOSED
  int fallback_data_version = 0;
  size_t cached_snapshots = 0;
};

// Single entry point. Orchestrates permission check, ticket fetch, roster
// fetch, dispatch or batch optimisation, commit and notification. Never
// throws for per-ticket problems; the constructor throws
// InvalidConfiguration for bad config or missing collaborators.
class AssignmentFacade {
 public:
  AssignmentFacade(EngineConfig cfg, Collaborators collab,
                   std::shared_ptr<ResilienceState> state = nullptr);
  AssignmentFacade(const AssignmentFacade&) = delete;
  AssignmentFacade& operator=(const AssignmentFacade&) = delete;

  AssignmentDecision assign_one(const Ticket& ticket, const std::string& requesting_user);

  // One decision per ticket, in input order. `algorithm` is ignored outside FULL mode.
  std::vector<AssignmentDecision> assign_batch(const std::vector<Ticket>& tickets,
                                               std::optional<Algorithm> algorithm = std::nullopt);

  // Ranked candidates, no side effects. top_n == 0 returns all.
  std::vector<CandidateScore> recommend(const Ticket& ticket, size_t top_n);

  ServiceMode service_mode() const;
  void set_service_mode(ServiceMode mode, const std::string& reason);
  void clear_service_mode_override();

  std::map<std::string, BreakerStatus> circuit_breaker_status() const;
  bool reset_circuit_breaker(const std::string& name);

  // Visiting order per executor for already-made decisions.
  std::vector<RoutePlan> plan_routes(const std::vector<AssignmentDecision>& decisions,
                                     const std::vector<Ticket>& tickets);

  // Tickets grouped by zone, largest group first. No collaborator calls.
  std::vector<ZoneCluster> cluster_tickets(const std::vector<Ticket>& tickets) const;

  // Demand per zone with nearby zones inside GEO_COVERAGE_RADIUS_KM; the
  // current roster size is split across zones by demand.
  std::vector<ZoneDemand> zone_demand(const std::vector<Ticket>& tickets);

  HealthReport health() const;

  const EngineConfig& config() const { return cfg_; }
  ResilienceState& state() { return *state_; }

 private:
  void commit_and_notify(const Ticket& ticket, AssignmentDecision& d);

  EngineConfig cfg_;
  Scorer scorer_;
  Dispatcher dispatcher_;
  BatchOptimizer optimizer_;
  std::shared_ptr<ResilienceState> state_;
  ResilienceLayer layer_;
};

// "critical" for urgency 5, "high" for 4, else "normal".
const char* notification_priority(int urgency);

}  // namespace dispatch
