// dispatcher.h
#pragma once
#include "scoring.h"
#include "types.h"

#include <cstddef>
#include <vector>

namespace dispatch {

constexpr double kScoreTieEpsilon = 1e-12;

// Candidate ordering shared by the dispatcher and the batch search:
// higher score, then lower load, then lower executor id.
bool better_candidate(double score_a, int load_a, const std::string& id_a,
                      double score_b, int load_b, const std::string& id_b);

// Single-ticket baseline: O(M) scan over the candidate pool.
class Dispatcher {
 public:
  explicit Dispatcher(const Scorer& scorer) : scorer_(scorer) {}

  // Available, below capacity and skill-matched (skill ignored in EMERGENCY).
  bool eligible(const Ticket& t, const Executor& e, ServiceMode mode) const;

  AssignmentDecision assign(const Ticket& t,
                            const std::vector<Executor>& executors,
                            const ScoringContext& ctx) const;

  // Ranked eligible candidates, best first; top_n == 0 returns all of them.
  std::vector<CandidateScore> rank(const Ticket& t,
                                   const std::vector<Executor>& executors,
                                   const ScoringContext& ctx,
                                   size_t top_n) const;

  // EMERGENCY path: first available executor with spare capacity at or after
  // `cursor` (wrapping), skill match ignored.
  AssignmentDecision assign_round_robin(const Ticket& t,
                                        const std::vector<Executor>& executors,
                                        size_t cursor) const;

  const Scorer& scorer() const { return scorer_; }

 private:
  const Scorer& scorer_;
};

}  // namespace dispatch
