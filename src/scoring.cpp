#include "scoring.h"
#include "errors.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

namespace dispatch {

FactorMask factor_mask(ServiceMode mode) {
  FactorMask m;
  switch (mode) {
    case ServiceMode::Full:
      break;
    case ServiceMode::Degraded:
      m.geo_proximity = false;
      break;
    case ServiceMode::Minimal:
      m.geo_proximity = false;
      m.efficiency = false;
      m.workload_balance = false;
      break;
    case ServiceMode::Emergency:
      m = FactorMask{false, false, false, true, false};
      break;
  }
  return m;
}

void validate_weights(const ScoringWeights& w, const std::string& label) {
  const double parts[] = {w.skill_match, w.efficiency, w.workload_balance,
                          w.availability, w.geo_proximity};
  for (double p : parts) {
    if (!std::isfinite(p) || p < 0.0)
      throw InvalidConfiguration(label + ": weights must be finite and non-negative");
  }
  if (std::fabs(w.sum() - 1.0) > kWeightSumTolerance) {
    std::ostringstream oss;
    oss << label << ": weights sum to " << w.sum() << ", expected 1.0";
    throw InvalidConfiguration(oss.str());
  }
}

Scorer::Scorer(ScoringConfig cfg, GeoIndex geo) : cfg_(std::move(cfg)), geo_(std::move(geo)) {
  validate_weights(cfg_.weights, "SCORING_WEIGHTS");
  validate_weights(cfg_.geo_weights, "GEO_SCORING_WEIGHTS");
  if (!(cfg_.partial_credit >= 0.0 && cfg_.partial_credit <= 1.0))
    throw InvalidConfiguration("SKILL_PARTIAL_CREDIT must be within [0,1]");
}

const ScoringWeights& Scorer::weights_for(const ScoringContext& ctx) const {
  return (ctx.geo_aware && ctx.mode == ServiceMode::Full) ? cfg_.geo_weights : cfg_.weights;
}

bool Scorer::skill_eligible(const Ticket& t, const Executor& e) const {
  return e.has_skill(t.category) ||
         (!cfg_.generalist_skill.empty() && e.has_skill(cfg_.generalist_skill));
}

double Scorer::workload_factor(int load, int capacity, const ScoringContext& ctx) const {
  if (!factor_mask(ctx.mode).workload_balance || capacity <= 0) return 0.0;
  return std::clamp(1.0 - static_cast<double>(load) / capacity, 0.0, 1.0);
}

FactorValues Scorer::factors(const Ticket& t, const Executor& e, const ScoringContext& ctx) const {
  const FactorMask m = factor_mask(ctx.mode);
  FactorValues f;
  if (m.skill_match) f.skill_match = e.has_skill(t.category) ? 1.0 : cfg_.partial_credit;
  if (m.efficiency) f.efficiency = std::clamp(e.efficiency / 100.0, 0.0, 1.0);
  f.workload_balance = workload_factor(e.current_load, e.capacity, ctx);
  if (m.availability) f.availability = e.available ? 1.0 : 0.0;
  if (m.geo_proximity && ctx.geo_aware) f.geo_proximity = geo_.proximity(t.zone, e.zone);
  f.urgency_bonus = std::clamp(t.urgency / 5.0, 0.0, 1.0);
  return f;
}

CandidateScore Scorer::score(const Ticket& t, const Executor& e, const ScoringContext& ctx) const {
  CandidateScore cs;
  cs.ticket_id = t.id;
  cs.executor_id = e.id;
  cs.factors = factors(t, e, ctx);
  cs.weights = weights_for(ctx);
  cs.score = combine(cs.weights, cs.factors);
  cs.reasoning = explain(cs.factors);
  return cs;
}

std::string explain(const FactorValues& f) {
  std::vector<std::string> reasons;
  if (f.skill_match >= 1.0) reasons.push_back("exact skill match");
  else if (f.skill_match > 0.0) reasons.push_back("generalist skill match");

  if (f.efficiency > 0.8) reasons.push_back("high efficiency");
  else if (f.efficiency > 0.6) reasons.push_back("good efficiency");

  if (f.workload_balance > 0.8) reasons.push_back("low workload");
  else if (f.workload_balance > 0.5) reasons.push_back("moderate workload");

  if (f.geo_proximity >= 1.0) reasons.push_back("same zone");
  else if (f.geo_proximity > 0.6) reasons.push_back("nearby");

  if (reasons.empty()) return "baseline criteria";
  std::string out = reasons.front();
  for (size_t i = 1; i < reasons.size(); ++i) out += ", " + reasons[i];
  return out;
}

}  // namespace dispatch
