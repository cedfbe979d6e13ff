// optimizer.h
#pragma once
#include "population.h"
#include "sa.h"
#include "scoring.h"
#include "types.h"
#include "utils.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace dispatch {

struct OptimizerConfig {
  PopulationConfig population;
  AnnealingConfig annealing;
  int hybrid_iterations = 300;
  double capacity_penalty = 10.0;
  bool geo_aware = true;             // use the proximity term in FULL mode
  // auto-selection thresholds (batch size)
  int greedy_max_batch = 3;
  int annealing_max_batch = 8;
  int population_min_batch = 25;
  bool verbose = false;
};

struct OptimizeOptions {
  std::optional<Algorithm> algorithm;   // nullopt = choose by size/urgency
  uint64_t seed = 12345;
  Deadline deadline;
  ServiceMode mode = ServiceMode::Full;
  size_t round_robin_start = 0;         // EMERGENCY only
};

struct BatchResult {
  std::vector<AssignmentDecision> decisions;   // same order as the input tickets
  Algorithm algorithm = Algorithm::Greedy;
  double fitness = 0.0;
  int iterations = 0;
  bool budget_exhausted = false;
  long long duration_ms = 0;
};

// Signature every batch algorithm implements.
using SearchFn = SearchResult (*)(const BatchProblem&, const OptimizerConfig&,
                                  const Deadline&, std::mt19937_64&);

struct AlgorithmEntry {
  Algorithm algorithm;
  const char* name;
  SearchFn run;
};

// greedy, population, annealing, hybrid
const std::vector<AlgorithmEntry>& algorithm_table();
const AlgorithmEntry& algorithm_entry(Algorithm a);

class BatchOptimizer {
 public:
  BatchOptimizer(const Scorer& scorer, OptimizerConfig cfg);

  BatchResult optimize(const std::vector<Ticket>& tickets,
                       const std::vector<Executor>& executors,
                       const OptimizeOptions& opts) const;

  // Auto choice for a batch in FULL mode.
  Algorithm select_algorithm(const std::vector<Ticket>& tickets) const;

  // Algorithm actually run once the service mode is taken into account.
  Algorithm effective_algorithm(const std::vector<Ticket>& tickets,
                                const OptimizeOptions& opts) const;

  const OptimizerConfig& config() const { return cfg_; }

 private:
  BatchResult round_robin(const std::vector<Ticket>& tickets,
                          const std::vector<Executor>& executors,
                          const OptimizeOptions& opts) const;

  const Scorer& scorer_;
  OptimizerConfig cfg_;
};

}  // namespace dispatch
