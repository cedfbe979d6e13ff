// population.h
#pragma once
#include "assignment_state.h"
#include "utils.h"

#include <random>

namespace dispatch {

struct PopulationConfig {
  int population_size = 50;
  int generations = 100;
  int tournament_size = 3;
  int elite_size = 5;
  double crossover_rate = 0.8;
  double mutation_rate = 0.1;   // per offspring: chance of one gene being redrawn
  bool verbose = false;
  int log_every = 20;
};

// Genetic search: tournament selection, single-point crossover, mutation and
// elitism. The greedy solution is always part of the first generation, so the
// result is never worse than greedy.
SearchResult run_population(const BatchProblem& P,
                            const PopulationConfig& cfg,
                            const Deadline& deadline,
                            std::mt19937_64& rng);

}  // namespace dispatch
