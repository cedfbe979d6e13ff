// penalties.h
#pragma once
#include <vector>

namespace dispatch {

struct BatchProblem;

// Σ max(0, final_load - capacity) over executors for a raw genome.
int capacity_overflow(const BatchProblem& P, const std::vector<int>& executor_of);

// Shared objective of all batch algorithms: sum of per-ticket scores, each
// taken against the cumulative load at that ticket's turn in urgency order,
// minus capacity_penalty per unit of capacity overflow.
double evaluate_fitness(const BatchProblem& P, const std::vector<int>& executor_of);

}  // namespace dispatch
