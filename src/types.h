// types.h
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dispatch {

inline constexpr const char* kUnassigned = "unassigned";

// Reasons attached to unassigned decisions.
inline constexpr const char* kReasonNoCapacity = "no_capacity";
inline constexpr const char* kReasonPermissionDenied = "permission_denied";
inline constexpr const char* kReasonPermissionUnavailable = "permission_unavailable";

// Dependency names used for circuit breakers.
inline constexpr const char* kDepTicketData = "ticket-data";
inline constexpr const char* kDepExecutorRoster = "executor-roster";
inline constexpr const char* kDepPermissionCheck = "permission-check";
inline constexpr const char* kDepNotification = "notification";
inline constexpr const char* kDepAssignmentCommit = "assignment-commit";

enum class ServiceMode { Full = 0, Degraded = 1, Minimal = 2, Emergency = 3 };

// Batch-selectable algorithms come first; Basic and RoundRobin only tag decisions.
enum class Algorithm { Greedy, Population, Annealing, Hybrid, Basic, RoundRobin };

enum class BreakerState { Closed, Open, HalfOpen };

struct Ticket {
  std::string id;
  std::string category;     // skill tag
  int urgency = 3;          // 1..5, 5 = most urgent
  std::string description;
  std::string zone;
  int64_t created_at = 0;   // epoch seconds
};

struct Executor {
  std::string id;
  std::string name;
  std::vector<std::string> skills;
  std::string zone;
  double efficiency = 0.0;  // 0..100
  int capacity = 0;         // max concurrent tickets
  int current_load = 0;
  bool available = true;

  bool has_skill(const std::string& tag) const;
  int spare_capacity() const { return capacity - current_load; }
};

struct FactorValues {
  double skill_match = 0.0;
  double efficiency = 0.0;
  double workload_balance = 0.0;
  double availability = 0.0;
  double geo_proximity = 0.0;
  double urgency_bonus = 0.0;   // informational, never weighted
};

struct ScoringWeights {
  double skill_match = 0.40;
  double efficiency = 0.30;
  double workload_balance = 0.20;
  double availability = 0.10;
  double geo_proximity = 0.0;

  double sum() const {
    return skill_match + efficiency + workload_balance + availability + geo_proximity;
  }
};

// Weighted sum of the five scored factors.
inline double combine(const ScoringWeights& w, const FactorValues& f) {
  return w.skill_match * f.skill_match +
         w.efficiency * f.efficiency +
         w.workload_balance * f.workload_balance +
         w.availability * f.availability +
         w.geo_proximity * f.geo_proximity;
}

struct CandidateScore {
  std::string ticket_id;
  std::string executor_id;
  double score = 0.0;
  FactorValues factors;
  ScoringWeights weights;
  std::string reasoning;
};

struct AssignmentDecision {
  std::string ticket_id;
  std::string executor_id = kUnassigned;
  std::string reason;                     // empty when assigned
  Algorithm algorithm = Algorithm::Basic;
  double score = 0.0;
  FactorValues factors;
  ScoringWeights weights;
  long long duration_ms = 0;
  bool fallback_used = false;
  bool budget_exhausted = false;
  ServiceMode service_mode = ServiceMode::Full;
  std::vector<std::string> alternatives;
  bool committed = false;

  bool assigned() const { return executor_id != kUnassigned; }
};

struct BreakerStatus {
  std::string name;
  BreakerState state = BreakerState::Closed;
  int consecutive_failures = 0;
  int failure_threshold = 0;
  double cooldown_seconds = 0.0;
  std::optional<std::chrono::system_clock::time_point> last_failure;
  std::string last_error;
  long long total_requests = 0;
  long long successful_requests = 0;
  long long failed_requests = 0;
  long long rejected_requests = 0;
};

const char* to_string(ServiceMode m);
const char* to_string(Algorithm a);
const char* to_string(BreakerState s);

// Both throw InvalidConfiguration on unknown names.
ServiceMode service_mode_from_string(const std::string& s);
Algorithm algorithm_from_string(const std::string& s);

}  // namespace dispatch
