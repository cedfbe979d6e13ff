// scoring.h
#pragma once
#include "geo.h"
#include "types.h"

#include <string>

namespace dispatch {

constexpr double kWeightSumTolerance = 1e-6;

struct ScoringConfig {
  ScoringWeights weights;                                   // 0.4/0.3/0.2/0.1/0
  ScoringWeights geo_weights{0.35, 0.25, 0.15, 0.10, 0.15}; // batch, geo-aware
  double partial_credit = 0.5;          // skill_match when the category tag is missing
  std::string generalist_skill = "general";
};

// Which factors a service mode still trusts. Non-increasing from FULL to EMERGENCY.
struct FactorMask {
  bool skill_match = true;
  bool efficiency = true;
  bool workload_balance = true;
  bool availability = true;
  bool geo_proximity = true;

  int count() const {
    return int(skill_match) + int(efficiency) + int(workload_balance) +
           int(availability) + int(geo_proximity);
  }
};

FactorMask factor_mask(ServiceMode mode);

struct ScoringContext {
  ServiceMode mode = ServiceMode::Full;
  bool geo_aware = false;   // evaluate the proximity term (batch variant)
};

// Throws InvalidConfiguration unless all weights are >= 0 and sum to 1.
void validate_weights(const ScoringWeights& w, const std::string& label);

// Pure multi-factor scorer. Copyable, immutable, safe for concurrent use.
class Scorer {
 public:
  Scorer(ScoringConfig cfg, GeoIndex geo);

  CandidateScore score(const Ticket& t, const Executor& e, const ScoringContext& ctx) const;
  FactorValues factors(const Ticket& t, const Executor& e, const ScoringContext& ctx) const;
  const ScoringWeights& weights_for(const ScoringContext& ctx) const;

  // Workload term for an arbitrary load, honouring the mode mask.
  double workload_factor(int load, int capacity, const ScoringContext& ctx) const;

  // Holds the category tag or the generalist tag.
  bool skill_eligible(const Ticket& t, const Executor& e) const;

  const ScoringConfig& config() const { return cfg_; }
  const GeoIndex& geo() const { return geo_; }

 private:
  ScoringConfig cfg_;
  GeoIndex geo_;
};

std::string explain(const FactorValues& f);

}  // namespace dispatch
