// route_solver.h
#pragma once
#include "geo.h"
#include "types.h"

#include <string>
#include <vector>

namespace dispatch {

struct RouteSolveParams {
  int time_limit_seconds = 1;
  bool use_warm_start = true;   // seed the solver with the nearest-neighbor order
  bool log_search = false;
};

// Re-orders destinations as an open single-vehicle tour from home using the
// OR-Tools routing solver. Returns the nearest-neighbor estimate unchanged when
// the solver finds nothing shorter (or nothing at all).
RouteEstimate refine_route(const GeoIndex& geo,
                           const std::string& home,
                           const std::vector<std::string>& destinations,
                           const RouteSolveParams& params);

// Visiting order for one executor's assigned tickets, starting from its home zone.
struct RoutePlan {
  std::string executor_id;
  std::string home_zone;
  std::vector<std::string> ticket_ids;   // in visiting order
  std::vector<std::string> zones;        // parallel to ticket_ids
  double total_km = 0.0;
  double total_minutes = 0.0;
  bool refined = false;
};

// Groups assigned decisions per executor (first-seen order) and orders each
// group's zones; refine_route() is applied when refine is set. Decisions
// whose ticket or executor is not in the given snapshots are skipped.
std::vector<RoutePlan> plan_routes(const GeoIndex& geo,
                                   const std::vector<AssignmentDecision>& decisions,
                                   const std::vector<Ticket>& tickets,
                                   const std::vector<Executor>& executors,
                                   bool refine,
                                   const RouteSolveParams& params);

}  // namespace dispatch
