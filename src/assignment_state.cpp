#include "assignment_state.h"
#include "dispatcher.h"
#include "penalties.h"

#include <algorithm>
#include <numeric>

namespace dispatch {

BatchProblem BatchProblem::build(const std::vector<Ticket>& tickets,
                                 const std::vector<Executor>& executors,
                                 const Scorer& scorer,
                                 const ScoringContext& ctx,
                                 double capacity_penalty) {
  BatchProblem P;
  P.tickets = tickets;
  P.executors = executors;
  P.ctx = ctx;
  P.weights = scorer.weights_for(ctx);
  P.scorer = &scorer;
  P.capacity_penalty = capacity_penalty;

  const int T = static_cast<int>(tickets.size());
  const int M = static_cast<int>(executors.size());

  P.order.resize(T);
  std::iota(P.order.begin(), P.order.end(), 0);
  std::stable_sort(P.order.begin(), P.order.end(), [&](int a, int b) {
    const Ticket& x = tickets[a];
    const Ticket& y = tickets[b];
    if (x.urgency != y.urgency) return x.urgency > y.urgency;
    if (x.created_at != y.created_at) return x.created_at < y.created_at;
    return x.id < y.id;
  });

  const bool ignore_skill = ctx.mode == ServiceMode::Emergency;
  P.eligible.assign(T, {});
  P.base.assign(T, std::vector<FactorValues>(M));
  for (int t = 0; t < T; ++t) {
    for (int e = 0; e < M; ++e) {
      const Executor& ex = executors[e];
      P.base[t][e] = scorer.factors(tickets[t], ex, ctx);
      if (!ex.available || ex.capacity <= 0 || ex.current_load >= ex.capacity) continue;
      if (!ignore_skill && !scorer.skill_eligible(tickets[t], ex)) continue;
      P.eligible[t].push_back(e);
    }
  }
  return P;
}

bool BatchProblem::is_eligible(int t, int e) const {
  const auto& el = eligible[t];
  return std::find(el.begin(), el.end(), e) != el.end();
}

FactorValues BatchProblem::pair_factors(int t, int e, int load) const {
  FactorValues f = base[t][e];
  f.workload_balance = scorer->workload_factor(load, executors[e].capacity, ctx);
  return f;
}

std::vector<int> BatchProblem::snapshot_loads() const {
  std::vector<int> loads(executors.size());
  for (size_t e = 0; e < executors.size(); ++e) loads[e] = executors[e].current_load;
  return loads;
}

void AssignmentState::decode(const BatchProblem& P) {
  executor_of.resize(P.tickets.size(), -1);
  std::vector<int> loads = P.snapshot_loads();

  for (int t : P.order) {
    int e = executor_of[t];
    if (e >= 0 && P.is_eligible(t, e) && loads[e] < P.executors[e].capacity) {
      loads[e]++;
      continue;
    }
    int best = -1;
    double best_score = 0.0;
    for (int cand : P.eligible[t]) {
      if (loads[cand] >= P.executors[cand].capacity) continue;
      const double s = P.pair_score(t, cand, loads[cand]);
      if (best < 0 || better_candidate(s, loads[cand], P.executors[cand].id,
                                       best_score, loads[best], P.executors[best].id)) {
        best = cand;
        best_score = s;
      }
    }
    executor_of[t] = best;
    if (best >= 0) loads[best]++;
  }
  fitness = evaluate_fitness(P, executor_of);
}

AssignmentState AssignmentState::greedy(const BatchProblem& P) {
  AssignmentState s;
  s.executor_of.assign(P.tickets.size(), -1);
  s.decode(P);
  return s;
}

}  // namespace dispatch
