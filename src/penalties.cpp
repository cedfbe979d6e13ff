// penalties.cpp
#include "penalties.h"
#include "assignment_state.h"

#include <algorithm>

namespace dispatch {

int capacity_overflow(const BatchProblem& P, const std::vector<int>& executor_of) {
  std::vector<int> loads = P.snapshot_loads();
  for (int e : executor_of) if (e >= 0) loads[e]++;
  int over = 0;
  for (size_t e = 0; e < loads.size(); ++e)
    over += std::max(0, loads[e] - std::max(P.executors[e].capacity, P.executors[e].current_load));
  return over;
}

double evaluate_fitness(const BatchProblem& P, const std::vector<int>& executor_of) {
  std::vector<int> loads = P.snapshot_loads();
  double total = 0.0;
  for (int t : P.order) {
    const int e = executor_of[t];
    if (e < 0) continue;
    total += P.pair_score(t, e, loads[e]);
    loads[e]++;
  }
  return total - P.capacity_penalty * capacity_overflow(P, executor_of);
}

}  // namespace dispatch
