#include "population.h"

#include <algorithm>
#include <numeric>
#include <sstream>

namespace dispatch {

namespace {

AssignmentState random_individual(const BatchProblem& P, std::mt19937_64& rng) {
  AssignmentState s;
  s.executor_of.assign(P.tickets.size(), -1);
  for (int t = 0; t < P.ticket_count(); ++t) {
    const auto& options = P.eligible[t];
    if (options.empty()) continue;
    s.executor_of[t] = options[std::uniform_int_distribution<size_t>(0, options.size() - 1)(rng)];
  }
  s.decode(P);
  return s;
}

const AssignmentState& tournament(const std::vector<AssignmentState>& pop, int k, std::mt19937_64& rng) {
  std::uniform_int_distribution<size_t> pick(0, pop.size() - 1);
  const AssignmentState* winner = &pop[pick(rng)];
  for (int i = 1; i < k; ++i) {
    const AssignmentState& c = pop[pick(rng)];
    if (c.fitness > winner->fitness) winner = &c;
  }
  return *winner;
}

void crossover(AssignmentState& a, AssignmentState& b, std::mt19937_64& rng) {
  const size_t n = a.executor_of.size();
  if (n < 2) return;
  const size_t cut = std::uniform_int_distribution<size_t>(1, n - 1)(rng);
  for (size_t i = cut; i < n; ++i) std::swap(a.executor_of[i], b.executor_of[i]);
}

void mutate(const BatchProblem& P, AssignmentState& s, std::mt19937_64& rng) {
  if (s.executor_of.empty()) return;
  const int t = static_cast<int>(std::uniform_int_distribution<size_t>(0, s.executor_of.size() - 1)(rng));
  const auto& options = P.eligible[t];
  if (options.empty()) return;
  s.executor_of[t] = options[std::uniform_int_distribution<size_t>(0, options.size() - 1)(rng)];
}

}  // namespace

SearchResult run_population(const BatchProblem& P,
                            const PopulationConfig& cfg,
                            const Deadline& deadline,
                            std::mt19937_64& rng) {
  SearchResult res;
  const int size = std::max(2, cfg.population_size);
  const int elite = std::clamp(cfg.elite_size, 0, size - 1);

  std::vector<AssignmentState> pop;
  pop.reserve(size);
  pop.push_back(AssignmentState::greedy(P));
  while (static_cast<int>(pop.size()) < size) pop.push_back(random_individual(P, rng));

  auto best_of = [](const std::vector<AssignmentState>& v) {
    return *std::max_element(v.begin(), v.end(), [](const AssignmentState& a, const AssignmentState& b) {
      return a.fitness < b.fitness;
    });
  };
  res.best = best_of(pop);

  std::uniform_real_distribution<double> U(0.0, 1.0);
  for (int gen = 1; gen <= cfg.generations; ++gen) {
    if (deadline.expired()) {
      res.budget_exhausted = true;
      break;
    }
    res.iterations = gen;

    // elites carried over unchanged
    std::vector<int> idx(pop.size());
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(), [&](int a, int b) { return pop[a].fitness > pop[b].fitness; });

    std::vector<AssignmentState> next;
    next.reserve(size);
    for (int i = 0; i < elite; ++i) next.push_back(pop[idx[i]]);

    while (static_cast<int>(next.size()) < size) {
      AssignmentState a = tournament(pop, cfg.tournament_size, rng);
      AssignmentState b = tournament(pop, cfg.tournament_size, rng);
      if (U(rng) < cfg.crossover_rate) crossover(a, b, rng);
      if (U(rng) < cfg.mutation_rate) mutate(P, a, rng);
      if (U(rng) < cfg.mutation_rate) mutate(P, b, rng);
      a.decode(P);
      next.push_back(std::move(a));
      if (static_cast<int>(next.size()) < size) {
        b.decode(P);
        next.push_back(std::move(b));
      }
    }
    pop = std::move(next);

    const AssignmentState& gen_best = best_of(pop);
    if (gen_best.fitness > res.best.fitness) res.best = gen_best;

    if (cfg.verbose && cfg.log_every > 0 && gen % cfg.log_every == 0) {
      std::ostringstream oss;
      oss << "generation=" << gen << " best=" << fmt_double(res.best.fitness, 4);
      log_info("population", oss.str());
    }
  }
  return res;
}

}  // namespace dispatch
