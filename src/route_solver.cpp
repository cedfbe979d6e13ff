#include "route_solver.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include <ortools/constraint_solver/routing.h>
#include <ortools/constraint_solver/routing_parameters.h>

using operations_research::Assignment;
using operations_research::RoutingIndexManager;
using operations_research::RoutingModel;
using operations_research::RoutingSearchParameters;

namespace dispatch {

namespace {

// Node 0 is home, nodes 1..N are destinations. Arc costs in metres; returning
// home is free so the solver optimises an open path.
std::vector<int64_t> build_cost_matrix(const GeoIndex& geo,
                                       const std::string& home,
                                       const std::vector<std::string>& destinations) {
  const int n = static_cast<int>(destinations.size()) + 1;
  std::vector<int64_t> cost(n * n, 0);
  auto zone_of = [&](int node) -> const std::string& {
    return node == 0 ? home : destinations[node - 1];
  };
  for (int i = 0; i < n; ++i) {
    for (int j = 1; j < n; ++j) {
      if (i == j) continue;
      cost[i * n + j] = static_cast<int64_t>(
          std::llround(geo.estimated_distance_km(zone_of(i), zone_of(j)) * 1000.0));
    }
  }
  return cost;
}

}  // namespace

RouteEstimate refine_route(const GeoIndex& geo,
                           const std::string& home,
                           const std::vector<std::string>& destinations,
                           const RouteSolveParams& params) {
  RouteEstimate nn = geo.order_route(home, destinations);
  if (destinations.size() < 3) return nn;   // nothing to improve

  const std::vector<int64_t> cost = build_cost_matrix(geo, home, destinations);
  const int N = static_cast<int>(destinations.size()) + 1;

  RoutingIndexManager manager(
      /*num_nodes=*/N,
      /*num_vehicles=*/1,
      /*depot=*/RoutingIndexManager::NodeIndex(0));
  RoutingModel routing(manager);

  const int transit_cb = routing.RegisterTransitCallback(
      [&manager, &cost, N](int64_t from_index, int64_t to_index) -> int64_t {
        const int from = manager.IndexToNode(from_index).value();
        const int to = manager.IndexToNode(to_index).value();
        return cost[from * N + to];
      });
  routing.SetArcCostEvaluatorOfAllVehicles(transit_cb);

  RoutingSearchParameters p = operations_research::DefaultRoutingSearchParameters();
  p.set_first_solution_strategy(operations_research::FirstSolutionStrategy::PATH_CHEAPEST_ARC);
  p.set_local_search_metaheuristic(operations_research::LocalSearchMetaheuristic::GUIDED_LOCAL_SEARCH);
  p.set_log_search(params.log_search);
  p.mutable_time_limit()->set_seconds(std::max(1, params.time_limit_seconds));

  const Assignment* assignment = nullptr;
  if (params.use_warm_start) {
    std::vector<std::vector<int64_t>> seed_routes(1);
    for (int idx : nn.order) seed_routes[0].push_back(idx + 1);
    const Assignment* seed = routing.ReadAssignmentFromRoutes(seed_routes, /*ignore_inactive_indices=*/true);
    if (seed) assignment = routing.SolveFromAssignmentWithParameters(seed, p);
  }
  if (!assignment) assignment = routing.SolveWithParameters(p);

  if (!assignment) {
    if (params.log_search)
      log_warn("route", "solver found no route for " + std::to_string(N - 1) + " stops; keeping nearest-neighbor");
    return nn;
  }

  std::vector<int> order;
  order.reserve(destinations.size());
  int64_t idx = assignment->Value(routing.NextVar(routing.Start(0)));
  while (!routing.IsEnd(idx)) {
    order.push_back(manager.IndexToNode(idx).value() - 1);
    idx = assignment->Value(routing.NextVar(idx));
  }
  if (order.size() != destinations.size()) return nn;

  RouteEstimate refined = geo.measure_route(home, destinations, order);
  if (refined.total_km + 1e-9 < nn.total_km) {
    refined.refined = true;
    return refined;
  }
  return nn;
}

std::vector<RoutePlan> plan_routes(const GeoIndex& geo,
                                   const std::vector<AssignmentDecision>& decisions,
                                   const std::vector<Ticket>& tickets,
                                   const std::vector<Executor>& executors,
                                   bool refine,
                                   const RouteSolveParams& params) {
  std::unordered_map<std::string, const Ticket*> ticket_by_id;
  for (const auto& t : tickets) ticket_by_id.emplace(t.id, &t);
  std::unordered_map<std::string, const Executor*> executor_by_id;
  for (const auto& e : executors) executor_by_id.emplace(e.id, &e);

  std::vector<RoutePlan> plans;
  std::unordered_map<std::string, size_t> plan_of;
  for (const auto& d : decisions) {
    if (!d.assigned()) continue;
    auto t = ticket_by_id.find(d.ticket_id);
    auto e = executor_by_id.find(d.executor_id);
    if (t == ticket_by_id.end() || e == executor_by_id.end()) continue;

    auto it = plan_of.find(d.executor_id);
    if (it == plan_of.end()) {
      it = plan_of.emplace(d.executor_id, plans.size()).first;
      RoutePlan p;
      p.executor_id = d.executor_id;
      p.home_zone = e->second->zone;
      plans.push_back(std::move(p));
    }
    RoutePlan& p = plans[it->second];
    p.ticket_ids.push_back(t->second->id);
    p.zones.push_back(t->second->zone);
  }

  for (auto& p : plans) {
    const RouteEstimate est = refine ? refine_route(geo, p.home_zone, p.zones, params)
                                     : geo.order_route(p.home_zone, p.zones);
    std::vector<std::string> ids, zones;
    for (int i : est.order) {
      ids.push_back(p.ticket_ids[i]);
      zones.push_back(p.zones[i]);
    }
    p.ticket_ids = std::move(ids);
    p.zones = std::move(zones);
    p.total_km = est.total_km;
    p.total_minutes = est.total_minutes;
    p.refined = est.refined;
  }
  return plans;
}

}  // namespace dispatch
