#include "optimizer.h"
#include "dispatcher.h"
#include "penalties.h"

#include <algorithm>
#include <sstream>

namespace dispatch {

namespace {

SearchResult search_greedy(const BatchProblem& P, const OptimizerConfig&,
                           const Deadline&, std::mt19937_64&) {
  SearchResult r;
  r.best = AssignmentState::greedy(P);
  return r;
}

SearchResult search_population(const BatchProblem& P, const OptimizerConfig& cfg,
                               const Deadline& deadline, std::mt19937_64& rng) {
  return run_population(P, cfg.population, deadline, rng);
}

SearchResult search_annealing(const BatchProblem& P, const OptimizerConfig& cfg,
                              const Deadline& deadline, std::mt19937_64& rng) {
  return run_annealing(P, AssignmentState::greedy(P), cfg.annealing,
                       cfg.annealing.iterations, deadline, rng);
}

// Greedy first, then a short annealing refinement.
SearchResult search_hybrid(const BatchProblem& P, const OptimizerConfig& cfg,
                           const Deadline& deadline, std::mt19937_64& rng) {
  return run_annealing(P, AssignmentState::greedy(P), cfg.annealing,
                       cfg.hybrid_iterations, deadline, rng);
}

std::vector<AssignmentDecision> materialize(const BatchProblem& P,
                                            const AssignmentState& S,
                                            Algorithm algorithm) {
  std::vector<AssignmentDecision> out(P.tickets.size());
  std::vector<int> loads = P.snapshot_loads();
  for (int t : P.order) {
    AssignmentDecision& d = out[t];
    d.ticket_id = P.tickets[t].id;
    d.algorithm = algorithm;
    d.service_mode = P.ctx.mode;
    d.weights = P.weights;
    const int e = S.executor_of[t];
    if (e < 0) {
      d.reason = kReasonNoCapacity;
      continue;
    }
    d.executor_id = P.executors[e].id;
    d.factors = P.pair_factors(t, e, loads[e]);
    d.score = combine(d.weights, d.factors);
    loads[e]++;
  }
  return out;
}

}  // namespace

const std::vector<AlgorithmEntry>& algorithm_table() {
  static const std::vector<AlgorithmEntry> table = {
      {Algorithm::Greedy, "greedy", &search_greedy},
      {Algorithm::Population, "population", &search_population},
      {Algorithm::Annealing, "annealing", &search_annealing},
      {Algorithm::Hybrid, "hybrid", &search_hybrid},
  };
  return table;
}

const AlgorithmEntry& algorithm_entry(Algorithm a) {
  for (const auto& entry : algorithm_table())
    if (entry.algorithm == a) return entry;
  throw InvalidConfiguration(std::string("Not a batch algorithm: ") + to_string(a));
}

BatchOptimizer::BatchOptimizer(const Scorer& scorer, OptimizerConfig cfg)
    : scorer_(scorer), cfg_(std::move(cfg)) {}

Algorithm BatchOptimizer::select_algorithm(const std::vector<Ticket>& tickets) const {
  const int n = static_cast<int>(tickets.size());
  if (n <= cfg_.greedy_max_batch) return Algorithm::Greedy;
  if (n <= cfg_.annealing_max_batch) return Algorithm::Annealing;
  const bool has_critical = std::any_of(tickets.begin(), tickets.end(),
                                        [](const Ticket& t) { return t.urgency >= 5; });
  if (n >= cfg_.population_min_batch && !has_critical) return Algorithm::Population;
  return Algorithm::Hybrid;
}

Algorithm BatchOptimizer::effective_algorithm(const std::vector<Ticket>& tickets,
                                              const OptimizeOptions& opts) const {
  switch (opts.mode) {
    case ServiceMode::Emergency:
      return Algorithm::RoundRobin;
    case ServiceMode::Degraded:
    case ServiceMode::Minimal:
      return Algorithm::Greedy;
    case ServiceMode::Full:
      break;
  }
  if (opts.algorithm) {
    algorithm_entry(*opts.algorithm);   // rejects Basic / RoundRobin
    return *opts.algorithm;
  }
  return select_algorithm(tickets);
}

BatchResult BatchOptimizer::optimize(const std::vector<Ticket>& tickets,
                                     const std::vector<Executor>& executors,
                                     const OptimizeOptions& opts) const {
  const long long t0 = NowMillis();
  const Algorithm algorithm = effective_algorithm(tickets, opts);
  if (opts.algorithm && *opts.algorithm != algorithm) {
    log_info(cfg_.verbose, "optimizer",
             std::string("mode ") + to_string(opts.mode) + " overrides requested " +
                 to_string(*opts.algorithm) + " with " + to_string(algorithm));
  }

  BatchResult res;
  if (algorithm == Algorithm::RoundRobin) {
    res = round_robin(tickets, executors, opts);
  } else {
    const ScoringContext ctx{opts.mode, cfg_.geo_aware};
    const BatchProblem P = BatchProblem::build(tickets, executors, scorer_, ctx, cfg_.capacity_penalty);

    std::mt19937_64 rng(opts.seed);
    SearchResult sr = algorithm_entry(algorithm).run(P, cfg_, opts.deadline, rng);
    sr.best.decode(P);   // idempotent for decoded states; guarantees feasibility

    res.algorithm = algorithm;
    res.fitness = sr.best.fitness;
    res.iterations = sr.iterations;
    res.budget_exhausted = sr.budget_exhausted;
    res.decisions = materialize(P, sr.best, algorithm);
  }

  res.duration_ms = NowMillis() - t0;
  int assigned = 0;
  for (auto& d : res.decisions) {
    d.duration_ms = res.duration_ms;
    d.budget_exhausted = res.budget_exhausted;
    if (d.assigned()) ++assigned;
  }

  if (cfg_.verbose) {
    std::ostringstream oss;
    oss << "algorithm=" << to_string(res.algorithm)
        << " tickets=" << tickets.size()
        << " executors=" << executors.size()
        << " assigned=" << assigned
        << " fitness=" << fmt_double(res.fitness, 4)
        << " iterations=" << res.iterations
        << (res.budget_exhausted ? " (budget exhausted)" : "")
        << " ms=" << res.duration_ms;
    log_info("optimizer", oss.str());
  }
  return res;
}

BatchResult BatchOptimizer::round_robin(const std::vector<Ticket>& tickets,
                                        const std::vector<Executor>& executors,
                                        const OptimizeOptions& opts) const {
  const ScoringContext ctx{ServiceMode::Emergency, false};
  const BatchProblem P = BatchProblem::build(tickets, executors, scorer_, ctx, cfg_.capacity_penalty);
  const Dispatcher dispatcher(scorer_);

  BatchResult res;
  res.algorithm = Algorithm::RoundRobin;
  res.decisions.resize(tickets.size());

  std::vector<Executor> working = executors;
  size_t cursor = opts.round_robin_start;
  for (int t : P.order) {
    AssignmentDecision d = dispatcher.assign_round_robin(tickets[t], working, cursor++);
    if (d.assigned()) {
      for (auto& e : working) {
        if (e.id == d.executor_id) { e.current_load++; break; }
      }
      res.fitness += d.score;
    }
    res.decisions[t] = std::move(d);
  }
  return res;
}

}  // namespace dispatch
