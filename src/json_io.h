// json_io.h
#pragma once
#include "facade.h"
#include "route_solver.h"
#include "types.h"
#include "utils.h"

#include <map>
#include <string>
#include <vector>

namespace dispatch {

// Readers throw InvalidConfiguration naming the offending record.
Ticket ticket_from_json(const json& j);
Executor executor_from_json(const json& j);

// Accepts a bare array or an object holding it under `key`.
std::vector<Ticket> tickets_from_json(const json& j);
std::vector<Executor> executors_from_json(const json& j);

json to_json(const Ticket& t);
json to_json(const Executor& e);
json to_json(const FactorValues& f);
json to_json(const ScoringWeights& w);
json to_json(const CandidateScore& c);
json to_json(const AssignmentDecision& d);
json to_json(const BreakerStatus& s);
json to_json(const RoutePlan& p);
json to_json(const HealthReport& h);
json to_json(const ZoneCluster& c);
json to_json(const ZoneDemand& d);

json breakers_to_json(const std::map<std::string, BreakerStatus>& status);

}  // namespace dispatch
