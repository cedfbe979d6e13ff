#include "config.h"

#include <cmath>

namespace dispatch {

namespace {

[[noreturn]] void fail(const std::string& msg) { throw InvalidConfiguration(msg); }

ScoringWeights parse_weights(const json& j, const ScoringWeights& def) {
  if (!j.is_object()) fail("Scoring weights must be an object");
  ScoringWeights w;
  w.skill_match      = j.value("skill_match", def.skill_match);
  w.efficiency       = j.value("efficiency", def.efficiency);
  w.workload_balance = j.value("workload_balance", def.workload_balance);
  w.availability     = j.value("availability", def.availability);
  w.geo_proximity    = j.value("geo_proximity", def.geo_proximity);
  return w;
}

void parse_population(const json& j, PopulationConfig& p) {
  p.population_size = j.value("size", p.population_size);
  p.generations     = j.value("generations", p.generations);
  p.tournament_size = j.value("tournament", p.tournament_size);
  p.elite_size      = j.value("elite", p.elite_size);
  p.crossover_rate  = j.value("crossover_rate", p.crossover_rate);
  p.mutation_rate   = j.value("mutation_rate", p.mutation_rate);
}

void parse_annealing(const json& j, AnnealingConfig& a) {
  a.t0              = j.value("t0", a.t0);
  a.alpha           = j.value("alpha", a.alpha);
  a.iterations      = j.value("iterations", a.iterations);
  a.min_temperature = j.value("min_temperature", a.min_temperature);
  a.reheat_every    = j.value("reheat_every", a.reheat_every);
}

void check(bool ok, const std::string& what) {
  if (!ok) fail("Invalid configuration: " + what);
}

bool in_unit(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

}  // namespace

std::map<std::string, BreakerConfig> default_breakers() {
  return {
      {kDepTicketData,       {3, 60.0, 2000}},
      {kDepExecutorRoster,   {3, 60.0, 3000}},
      {kDepPermissionCheck,  {5, 30.0, 1000}},
      {kDepNotification,     {5, 60.0, 1000}},
      {kDepAssignmentCommit, {3, 60.0, 2000}},
  };
}

EngineConfig default_config() {
  EngineConfig c;
  c.breakers = default_breakers();
  return c;
}

EngineConfig parse_config(const json& j) {
  if (!j.is_object()) fail("Config root must be a JSON object");
  EngineConfig c = default_config();
  try {
    if (j.contains("SCORING_WEIGHTS"))
      c.scoring.weights = parse_weights(j.at("SCORING_WEIGHTS"), c.scoring.weights);
    if (j.contains("GEO_SCORING_WEIGHTS"))
      c.scoring.geo_weights = parse_weights(j.at("GEO_SCORING_WEIGHTS"), c.scoring.geo_weights);
    c.scoring.partial_credit   = j.value("SKILL_PARTIAL_CREDIT", c.scoring.partial_credit);
    c.scoring.generalist_skill = j.value("GENERALIST_SKILL", c.scoring.generalist_skill);

    c.geo.max_distance_km          = j.value("GEO_MAX_DISTANCE_KM", c.geo.max_distance_km);
    c.geo.neutral_proximity        = j.value("GEO_NEUTRAL_PROXIMITY", c.geo.neutral_proximity);
    c.geo.default_distance_km      = j.value("GEO_DEFAULT_DISTANCE_KM", c.geo.default_distance_km);
    c.geo.average_speed_kmh        = j.value("AVERAGE_SPEED_KMH", c.geo.average_speed_kmh);
    c.geo.refine_routes            = j.value("ROUTE_REFINE", c.geo.refine_routes);
    c.geo.route_time_limit_seconds = j.value("ROUTE_TIME_LIMIT_SECONDS", c.geo.route_time_limit_seconds);
    c.geo.coverage_radius_km       = j.value("GEO_COVERAGE_RADIUS_KM", c.geo.coverage_radius_km);
    if (j.contains("ZONES")) {
      const json& zones = j.at("ZONES");
      if (!zones.is_object()) fail("ZONES must map zone names to {lat, lng}");
      for (auto it = zones.begin(); it != zones.end(); ++it) {
        c.geo.zones[it.key()] = ZoneCoord{it.value().at("lat").get<double>(),
                                          it.value().at("lng").get<double>()};
      }
    }

    if (j.contains("BREAKERS")) {
      const json& b = j.at("BREAKERS");
      if (!b.is_object()) fail("BREAKERS must map dependency names to settings");
      for (auto it = b.begin(); it != b.end(); ++it) {
        BreakerConfig bc = breaker_config_for(c, it.key());
        bc.threshold        = it.value().value("threshold", bc.threshold);
        bc.cooldown_seconds = it.value().value("cooldown_seconds", bc.cooldown_seconds);
        bc.timeout_ms       = it.value().value("timeout_ms", bc.timeout_ms);
        bc.max_in_flight    = it.value().value("max_in_flight", bc.max_in_flight);
        c.breakers[it.key()] = bc;
      }
    }

    if (j.contains("POPULATION")) parse_population(j.at("POPULATION"), c.optimizer.population);
    if (j.contains("ANNEALING")) parse_annealing(j.at("ANNEALING"), c.optimizer.annealing);
    c.optimizer.hybrid_iterations    = j.value("HYBRID_ITERATIONS", c.optimizer.hybrid_iterations);
    c.optimizer.capacity_penalty     = j.value("CAPACITY_PENALTY", c.optimizer.capacity_penalty);
    c.optimizer.geo_aware            = j.value("BATCH_GEO_AWARE", c.optimizer.geo_aware);
    c.optimizer.greedy_max_batch     = j.value("GREEDY_MAX_BATCH", c.optimizer.greedy_max_batch);
    c.optimizer.annealing_max_batch  = j.value("ANNEALING_MAX_BATCH", c.optimizer.annealing_max_batch);
    c.optimizer.population_min_batch = j.value("POPULATION_MIN_BATCH", c.optimizer.population_min_batch);

    c.request_budget_ms    = j.value("REQUEST_BUDGET_MS", c.request_budget_ms);
    c.rng_seed             = j.value("RNG_SEED", c.rng_seed);
    c.permission_fail_open = j.value("PERMISSION_FAIL_OPEN", c.permission_fail_open);
    c.notify_async         = j.value("NOTIFY_ASYNC", c.notify_async);
    c.snapshot_cache_size  = j.value("SNAPSHOT_CACHE_SIZE", c.snapshot_cache_size);
    c.verbose              = j.value("VERBOSE", c.verbose);
  } catch (const json::exception& e) {
    fail(std::string("Malformed config value: ") + e.what());
  }

  c.optimizer.verbose = c.verbose;
  c.optimizer.population.verbose = c.verbose;
  c.optimizer.annealing.verbose = c.verbose;

  validate_config(c);
  return c;
}

EngineConfig load_config(const std::string& path) {
  return parse_config(load_json(path));
}

void validate_config(const EngineConfig& c) {
  validate_weights(c.scoring.weights, "SCORING_WEIGHTS");
  validate_weights(c.scoring.geo_weights, "GEO_SCORING_WEIGHTS");
  check(in_unit(c.scoring.partial_credit), "SKILL_PARTIAL_CREDIT must be in [0, 1]");
  check(!c.scoring.generalist_skill.empty(), "GENERALIST_SKILL must not be empty");

  check(c.geo.max_distance_km > 0, "GEO_MAX_DISTANCE_KM must be > 0");
  check(in_unit(c.geo.neutral_proximity), "GEO_NEUTRAL_PROXIMITY must be in [0, 1]");
  check(c.geo.default_distance_km >= 0, "GEO_DEFAULT_DISTANCE_KM must be >= 0");
  check(c.geo.average_speed_kmh > 0, "AVERAGE_SPEED_KMH must be > 0");
  check(c.geo.route_time_limit_seconds > 0, "ROUTE_TIME_LIMIT_SECONDS must be > 0");
  check(c.geo.coverage_radius_km >= 0, "GEO_COVERAGE_RADIUS_KM must be >= 0");
  for (const auto& kv : c.geo.zones) {
    check(std::abs(kv.second.lat) <= 90 && std::abs(kv.second.lng) <= 180,
          "zone '" + kv.first + "' has out-of-range coordinates");
  }

  for (const auto& kv : c.breakers) {
    check(kv.second.threshold >= 1, "breaker '" + kv.first + "' threshold must be >= 1");
    check(kv.second.cooldown_seconds >= 0, "breaker '" + kv.first + "' cooldown must be >= 0");
    check(kv.second.timeout_ms >= 0, "breaker '" + kv.first + "' timeout must be >= 0");
    check(kv.second.max_in_flight >= 1, "breaker '" + kv.first + "' max_in_flight must be >= 1");
  }

  const auto& p = c.optimizer.population;
  check(p.population_size >= 2, "POPULATION.size must be >= 2");
  check(p.generations >= 0, "POPULATION.generations must be >= 0");
  check(p.tournament_size >= 1, "POPULATION.tournament must be >= 1");
  check(p.elite_size >= 0 && p.elite_size < p.population_size,
        "POPULATION.elite must be in [0, size)");
  check(in_unit(p.crossover_rate), "POPULATION.crossover_rate must be in [0, 1]");
  check(in_unit(p.mutation_rate), "POPULATION.mutation_rate must be in [0, 1]");

  const auto& a = c.optimizer.annealing;
  check(a.t0 > 0, "ANNEALING.t0 must be > 0");
  check(a.alpha > 0 && a.alpha < 1, "ANNEALING.alpha must be in (0, 1)");
  check(a.iterations >= 0, "ANNEALING.iterations must be >= 0");
  check(a.min_temperature >= 0, "ANNEALING.min_temperature must be >= 0");
  check(a.reheat_every >= 0, "ANNEALING.reheat_every must be >= 0");

  check(c.optimizer.hybrid_iterations >= 0, "HYBRID_ITERATIONS must be >= 0");
  check(c.optimizer.capacity_penalty >= 0, "CAPACITY_PENALTY must be >= 0");
  check(c.optimizer.greedy_max_batch <= c.optimizer.annealing_max_batch,
        "GREEDY_MAX_BATCH must not exceed ANNEALING_MAX_BATCH");
  check(c.snapshot_cache_size >= 1, "SNAPSHOT_CACHE_SIZE must be >= 1");
}

BreakerConfig breaker_config_for(const EngineConfig& c, const std::string& name) {
  auto it = c.breakers.find(name);
  return it == c.breakers.end() ? BreakerConfig{} : it->second;
}

}  // namespace dispatch
