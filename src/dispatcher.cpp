#include "dispatcher.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace dispatch {

bool better_candidate(double score_a, int load_a, const std::string& id_a,
                      double score_b, int load_b, const std::string& id_b) {
  if (std::fabs(score_a - score_b) > kScoreTieEpsilon) return score_a > score_b;
  if (load_a != load_b) return load_a < load_b;
  return id_a < id_b;
}

bool Dispatcher::eligible(const Ticket& t, const Executor& e, ServiceMode mode) const {
  if (!e.available || e.current_load >= e.capacity) return false;
  if (mode == ServiceMode::Emergency) return true;
  return scorer_.skill_eligible(t, e);
}

std::vector<CandidateScore> Dispatcher::rank(const Ticket& t,
                                             const std::vector<Executor>& executors,
                                             const ScoringContext& ctx,
                                             size_t top_n) const {
  std::vector<CandidateScore> out;
  std::unordered_map<std::string, int> load_of;
  for (const auto& e : executors) {
    if (!eligible(t, e, ctx.mode)) continue;
    out.push_back(scorer_.score(t, e, ctx));
    load_of[e.id] = e.current_load;
  }
  std::sort(out.begin(), out.end(), [&](const CandidateScore& a, const CandidateScore& b) {
    return better_candidate(a.score, load_of[a.executor_id], a.executor_id,
                            b.score, load_of[b.executor_id], b.executor_id);
  });
  if (top_n > 0 && out.size() > top_n) out.resize(top_n);
  return out;
}

AssignmentDecision Dispatcher::assign(const Ticket& t,
                                      const std::vector<Executor>& executors,
                                      const ScoringContext& ctx) const {
  AssignmentDecision d;
  d.ticket_id = t.id;
  d.algorithm = Algorithm::Basic;
  d.service_mode = ctx.mode;
  d.weights = scorer_.weights_for(ctx);

  auto ranked = rank(t, executors, ctx, /*top_n=*/4);
  if (ranked.empty()) {
    d.reason = kReasonNoCapacity;
    return d;
  }
  const CandidateScore& best = ranked.front();
  d.executor_id = best.executor_id;
  d.score = best.score;
  d.factors = best.factors;
  d.weights = best.weights;
  for (size_t i = 1; i < ranked.size(); ++i) d.alternatives.push_back(ranked[i].executor_id);
  return d;
}

AssignmentDecision Dispatcher::assign_round_robin(const Ticket& t,
                                                  const std::vector<Executor>& executors,
                                                  size_t cursor) const {
  const ScoringContext ctx{ServiceMode::Emergency, false};
  AssignmentDecision d;
  d.ticket_id = t.id;
  d.algorithm = Algorithm::RoundRobin;
  d.service_mode = ServiceMode::Emergency;
  d.weights = scorer_.weights_for(ctx);

  const size_t n = executors.size();
  for (size_t k = 0; k < n; ++k) {
    const Executor& e = executors[(cursor + k) % n];
    if (!eligible(t, e, ServiceMode::Emergency)) continue;
    CandidateScore cs = scorer_.score(t, e, ctx);
    d.executor_id = e.id;
    d.score = cs.score;
    d.factors = cs.factors;
    return d;
  }
  d.reason = kReasonNoCapacity;
  return d;
}

}  // namespace dispatch
