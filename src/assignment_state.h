// assignment_state.h
#pragma once
#include "scoring.h"
#include "types.h"

#include <vector>

namespace dispatch {

// Request-scoped view of one batch. Built once per optimize() call and never
// shared between concurrent batches.
struct BatchProblem {
  std::vector<Ticket> tickets;
  std::vector<Executor> executors;
  ScoringContext ctx;
  ScoringWeights weights;
  const Scorer* scorer = nullptr;
  double capacity_penalty = 10.0;

  // Ticket indices by descending urgency, then created_at, then id.
  std::vector<int> order;
  // Per ticket: executor indices that may ever take it (available, capacity > 0, skill).
  std::vector<std::vector<int>> eligible;
  // [ticket][executor] factors against the snapshot load.
  std::vector<std::vector<FactorValues>> base;

  static BatchProblem build(const std::vector<Ticket>& tickets,
                            const std::vector<Executor>& executors,
                            const Scorer& scorer,
                            const ScoringContext& ctx,
                            double capacity_penalty);

  int ticket_count() const { return static_cast<int>(tickets.size()); }
  bool is_eligible(int t, int e) const;

  // Factors / score of ticket t on executor e when e already carries `load`.
  FactorValues pair_factors(int t, int e, int load) const;
  double pair_score(int t, int e, int load) const { return combine(weights, pair_factors(t, e, load)); }

  std::vector<int> snapshot_loads() const;
};

// A candidate solution: executor index per ticket, -1 = unassigned.
struct AssignmentState {
  std::vector<int> executor_of;
  double fitness = 0.0;

  // Walk tickets in urgency order; keep a ticket's executor if it is eligible
  // and still has room, else move it to the best executor with room, else
  // leave it unassigned. The result never exceeds any capacity.
  void decode(const BatchProblem& P);

  // decode() from an empty genome: sequential best-pick in urgency order.
  static AssignmentState greedy(const BatchProblem& P);
};

struct SearchResult {
  AssignmentState best;
  int iterations = 0;            // generations or annealing steps actually run
  bool budget_exhausted = false; // stopped by the deadline, not the iteration budget
};

}  // namespace dispatch
