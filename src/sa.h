// sa.h
#pragma once
#include "assignment_state.h"
#include "utils.h"

#include <random>

namespace dispatch {

struct AnnealingConfig {
  double t0 = 0.5;               // fitness deltas are in score units (<= 1 per ticket)
  double alpha = 0.995;          // geometric cooling T <- alpha * T
  double min_temperature = 1e-4; // stop once T falls below
  int iterations = 2000;
  int reheat_every = 0;          // 0 = never reheat
  bool verbose = false;
  int log_every = 500;
};

// Simulated annealing over single-ticket reassignments starting from `start`.
// `max_iterations` caps cfg.iterations (hybrid passes a smaller bound).
SearchResult run_annealing(const BatchProblem& P,
                           const AssignmentState& start,
                           const AnnealingConfig& cfg,
                           int max_iterations,
                           const Deadline& deadline,
                           std::mt19937_64& rng);

}  // namespace dispatch
