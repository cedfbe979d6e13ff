#include "sa.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace dispatch {

namespace {

// Final load per executor for a decoded state
std::vector<int> loads_of(const BatchProblem& P, const AssignmentState& S) {
  std::vector<int> loads = P.snapshot_loads();
  for (int e : S.executor_of) if (e >= 0) loads[e]++;
  return loads;
}

// Tickets with somewhere else to go
std::vector<int> movable_tickets(const BatchProblem& P) {
  std::vector<int> out;
  for (int t = 0; t < P.ticket_count(); ++t)
    if (!P.eligible[t].empty()) out.push_back(t);
  return out;
}

// Reassign one ticket to a different eligible executor. When the target is
// full, swap: one of the target's tickets that can take the old executor goes
// there instead. decode() then restores feasibility and urgency priority.
bool propose_move(const BatchProblem& P, const std::vector<int>& movable,
                  AssignmentState& nxt, std::mt19937_64& rng) {
  const int t = movable[std::uniform_int_distribution<size_t>(0, movable.size() - 1)(rng)];
  const auto& options = P.eligible[t];
  const int cur = nxt.executor_of[t];
  if (options.size() == 1 && options.front() == cur) return false;

  int target = cur;
  while (target == cur)
    target = options[std::uniform_int_distribution<size_t>(0, options.size() - 1)(rng)];

  const std::vector<int> loads = loads_of(P, nxt);
  if (loads[target] >= P.executors[target].capacity && cur >= 0) {
    std::vector<int> swappable;
    for (int u = 0; u < P.ticket_count(); ++u)
      if (nxt.executor_of[u] == target && P.is_eligible(u, cur)) swappable.push_back(u);
    if (!swappable.empty()) {
      const int u = swappable[std::uniform_int_distribution<size_t>(0, swappable.size() - 1)(rng)];
      nxt.executor_of[u] = cur;
    }
  }
  nxt.executor_of[t] = target;
  nxt.decode(P);
  return true;
}

}  // namespace

SearchResult run_annealing(const BatchProblem& P,
                           const AssignmentState& start,
                           const AnnealingConfig& cfg,
                           int max_iterations,
                           const Deadline& deadline,
                           std::mt19937_64& rng) {
  SearchResult res;
  AssignmentState cur = start;
  cur.decode(P);
  res.best = cur;

  const std::vector<int> movable = movable_tickets(P);
  if (movable.empty()) return res;

  std::uniform_real_distribution<double> U(0.0, 1.0);
  double T = cfg.t0;
  const int iters = std::min(cfg.iterations, max_iterations);

  for (int it = 1; it <= iters; ++it) {
    if (deadline.expired()) {
      res.budget_exhausted = true;
      break;
    }
    res.iterations = it;

    AssignmentState nxt = cur;
    if (!propose_move(P, movable, nxt, rng)) continue;

    const double dE = nxt.fitness - cur.fitness;   // maximising
    const bool accept = (dE >= 0.0) || (U(rng) < std::exp(dE / std::max(1e-9, T)));
    if (accept) {
      cur = std::move(nxt);
      if (cur.fitness > res.best.fitness) res.best = cur;
    }

    if (cfg.verbose && cfg.log_every > 0 && it % cfg.log_every == 0) {
      std::ostringstream oss;
      oss << "it=" << it << " T=" << std::setprecision(4) << T
          << " cur=" << std::fixed << std::setprecision(4) << cur.fitness
          << " best=" << res.best.fitness << " dE=" << dE;
      log_info("annealing", oss.str());
    }

    T *= cfg.alpha;
    if (cfg.reheat_every > 0 && it % cfg.reheat_every == 0) T = cfg.t0;
    if (T < cfg.min_temperature) break;
  }
  return res;
}

}  // namespace dispatch
