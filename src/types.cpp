#include "types.h"
#include "errors.h"

#include <algorithm>

namespace dispatch {

bool Executor::has_skill(const std::string& tag) const {
  return std::find(skills.begin(), skills.end(), tag) != skills.end();
}

const char* to_string(ServiceMode m) {
  switch (m) {
    case ServiceMode::Full: return "full";
    case ServiceMode::Degraded: return "degraded";
    case ServiceMode::Minimal: return "minimal";
    case ServiceMode::Emergency: return "emergency";
  }
  return "full";
}

const char* to_string(Algorithm a) {
  switch (a) {
    case Algorithm::Greedy: return "greedy";
    case Algorithm::Population: return "population";
    case Algorithm::Annealing: return "annealing";
    case Algorithm::Hybrid: return "hybrid";
    case Algorithm::Basic: return "basic";
    case Algorithm::RoundRobin: return "round_robin";
  }
  return "basic";
}

const char* to_string(BreakerState s) {
  switch (s) {
    case BreakerState::Closed: return "closed";
    case BreakerState::Open: return "open";
    case BreakerState::HalfOpen: return "half_open";
  }
  return "closed";
}

ServiceMode service_mode_from_string(const std::string& s) {
  if (s == "full") return ServiceMode::Full;
  if (s == "degraded") return ServiceMode::Degraded;
  if (s == "minimal") return ServiceMode::Minimal;
  if (s == "emergency") return ServiceMode::Emergency;
  throw InvalidConfiguration("Unknown service mode: " + s);
}

Algorithm algorithm_from_string(const std::string& s) {
  if (s == "greedy") return Algorithm::Greedy;
  if (s == "population" || s == "genetic") return Algorithm::Population;
  if (s == "annealing" || s == "simulated_annealing") return Algorithm::Annealing;
  if (s == "hybrid") return Algorithm::Hybrid;
  throw InvalidConfiguration("Unknown algorithm: " + s);
}

}  // namespace dispatch
